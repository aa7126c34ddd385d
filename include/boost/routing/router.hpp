//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_ROUTER_HPP
#define BOOST_ROUTING_ROUTER_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/basic_router.hpp>
#include <boost/routing/router_types.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace boost {
namespace routing {

/** A minimal response, filled in by handlers

    Field names compare case-insensitively.
*/
struct response
{
    /** The status code, 404 until a handler sets it
    */
    unsigned status = 404;

    /** The reason phrase for @ref status
    */
    std::string reason = "Not Found";

    /** The fields, in insertion order
    */
    std::vector<std::pair<
        std::string, std::string>> fields;

    /** The body
    */
    std::string body;

    /** True once a handler set the status or the body
    */
    bool explicit_status = false;

    /** Return true if a field with the name exists
    */
    BOOST_ROUTING_DECL
    bool
    exists(std::string_view name) const noexcept;

    /** Return the value of a field

        @throw std::out_of_range The field does not exist.
    */
    BOOST_ROUTING_DECL
    std::string const&
    at(std::string_view name) const;

    /** Set a field, replacing any previous value
    */
    BOOST_ROUTING_DECL
    void
    set(
        std::string_view name,
        std::string_view value);

    /** Remove every field with the name

        @return The number of fields removed.
    */
    BOOST_ROUTING_DECL
    std::size_t
    erase(std::string_view name) noexcept;
};

//-----------------------------------------------

/** The parameters passed to the handlers of a @ref router

    @par Example
    @code
    route_params p;
    p.verb = "GET";
    p.path = "/users/42";
    r.dispatch( p );
    std::cout << p.res.status << ' ' << p.res.body;
    @endcode
*/
class route_params
    : public route_params_base
{
public:
    /** The response
    */
    response res;

    route_params() = default;

    /** Constructor
    */
    BOOST_ROUTING_DECL
    route_params(
        std::string_view verb,
        std::string_view path);

    /** Set the status code and its reason phrase
    */
    BOOST_ROUTING_DECL
    route_params&
    status(unsigned code);

    /** Send a body

        The status becomes 200 unless one was set. The
        Content-Type is `text/html` when the body begins
        with `<`, otherwise `text/plain`, unless one was
        set. A `HEAD` request keeps the Content-Length
        but not the body.
    */
    BOOST_ROUTING_DECL
    void
    send(std::string_view body);

    /** Redirect to a URL

        Sets the Location field to the encoded URL and the
        status to 302, unless a redirect status was set.
    */
    BOOST_ROUTING_DECL
    void
    redirect(std::string_view url);

    /** Clear the request and the response
    */
    BOOST_ROUTING_DECL
    void
    reset();

    BOOST_ROUTING_DECL
    void
    set_status(unsigned code) override;

    BOOST_ROUTING_DECL
    void
    set_header(
        std::string_view name,
        std::string_view value) override;

    BOOST_ROUTING_DECL
    bool
    has_explicit_status() const noexcept override;
};

/** A router with @ref route_params
*/
using router = basic_router<route_params>;

} // routing
} // boost

#endif
