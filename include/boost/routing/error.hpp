//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_ERROR_HPP
#define BOOST_ROUTING_ERROR_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace routing {

/** Error codes returned by routing operations.

    Configuration errors (@ref bad_pattern, @ref bad_handler)
    are thrown as `system::system_error` at registration time.
    Lookup errors are returned inside a `system::result` and
    are never thrown.
*/
enum class error
{
    /// Success
    success = 0,

    /** The path template or regular expression is malformed.
    */
    bad_pattern,

    /** A middleware value is neither a handler nor a router.
    */
    bad_handler,

    /** No route has the given name.
    */
    route_not_found,

    /** The route was built from a regular expression and
        has no template to substitute parameters into.
    */
    not_a_template,

    /** A required route parameter has no value.
    */
    missing_parameter
};

} // routing
} // boost

#include <boost/routing/impl/error.hpp>

#endif
