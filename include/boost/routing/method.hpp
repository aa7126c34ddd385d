//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_METHOD_HPP
#define BOOST_ROUTING_METHOD_HPP

#include <boost/routing/detail/config.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace boost {
namespace routing {

/** HTTP request methods known to the router.

    The set matches the verbs recognized by common
    HTTP/1.1 parsers. Routes may still be registered
    for tokens outside this set by passing strings.

    @see
        @ref string_to_method,
        @ref to_string,
        @ref all_methods.
*/
enum class method : char
{
    /** An unknown method.

        This value indicates that the request method string is not
        one of the recognized methods. Routers treat these as
        plain strings.
    */
    unknown = 0,

    acl,
    bind,
    checkout,
    connect,
    copy,

    /** The DELETE method deletes the specified resource
    */
    delete_,

    /** The GET method requests a representation of the specified resource.

        Requests using GET should only retrieve data and should have no
        other effect.
    */
    get,

    /** The HEAD method asks for a response identical to that of a GET
        request, but without the response body.
    */
    head,

    link,
    lock,
    msearch,
    merge,
    mkactivity,
    mkcalendar,
    mkcol,
    move,
    notify,

    /** The OPTIONS method returns the HTTP methods that the server
        supports for the specified URL.
    */
    options,

    /** The PATCH method applies partial modifications to a resource.
    */
    patch,

    /** The POST method requests that the server accept the entity
        enclosed in the request as a new subordinate of the web
        resource identified by the URI.
    */
    post,

    propfind,
    proppatch,
    purge,

    /** The PUT method requests that the enclosed entity be stored
        under the supplied URI.
    */
    put,

    rebind,
    report,
    search,
    source,
    subscribe,
    trace,
    unbind,
    unlink,
    unlock,
    unsubscribe
};

/** Return the method for a string.

    The comparison is case-sensitive, as method
    tokens are in RFC 9110.

    @return The matching method, or @ref method::unknown.
*/
BOOST_ROUTING_DECL
method
string_to_method(
    std::string_view s) noexcept;

/** Return the uppercase token for a method.

    @throw std::invalid_argument `v == method::unknown`
*/
BOOST_ROUTING_DECL
std::string_view
to_string(method v);

/** Return the tokens of every known method.

    The tokens are uppercase and in the order of
    the @ref method enumeration.
*/
BOOST_ROUTING_DECL
std::vector<std::string> const&
all_methods() noexcept;

} // routing
} // boost

#endif
