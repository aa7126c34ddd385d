//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_STATUSES_HPP
#define BOOST_ROUTING_STATUSES_HPP

#include <boost/routing/detail/config.hpp>
#include <string_view>

namespace boost {
namespace routing {

/** HTTP status code utilities.

    These help routers and handlers decide how a status
    code shapes a response.

    @par Example
    @code
    // Validate a redirect code
    if( ! statuses::is_redirect( code ) )
        throw std::invalid_argument( "not a redirect" );
    @endcode
*/
namespace statuses {

/** Check if a status code indicates a redirect.

    Returns `true` for status codes that indicate the client
    should redirect to a different URL. This includes:

    @li 300 Multiple Choices
    @li 301 Moved Permanently
    @li 302 Found
    @li 303 See Other
    @li 305 Use Proxy
    @li 307 Temporary Redirect
    @li 308 Permanent Redirect

    Note: 304 Not Modified is not considered a redirect.

    @param code The HTTP status code to check.

    @return `true` if the code indicates a redirect,
    `false` otherwise.
*/
BOOST_ROUTING_DECL
bool
is_redirect(unsigned code) noexcept;

/** Return the reason phrase for a status code

    @return The phrase, or an empty string if the
    code is not registered.
*/
BOOST_ROUTING_DECL
std::string_view
reason(unsigned code) noexcept;

} // statuses
} // routing
} // boost

#endif
