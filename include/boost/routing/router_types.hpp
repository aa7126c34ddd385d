//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_ROUTER_TYPES_HPP
#define BOOST_ROUTING_ROUTER_TYPES_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/method.hpp>
#include <boost/routing/param_map.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace boost {
namespace routing {

/** Function to continue routing past the current handler

    Every handler receives one of these. Invoking it
    runs the rest of the matched chain: the remaining
    handlers of the same route, then the remaining
    candidate routes, then whatever sits downstream of
    the router. When the call returns, everything after
    the handler has finished, so the handler may run
    code after it, as in an onion.

    A handler which does not invoke its continuation
    ends the chain.

    @par Example
    @code
    router.use(
        []( route_params& p, route_next next )
        {
            auto const before = p.path;
            next();
            assert( p.path == before );
        } );
    @endcode
*/
class route_next
{
public:
    /** Base class of the implementation
    */
    struct BOOST_ROUTING_SYMBOL_VISIBLE
        owner
    {
        virtual void do_next(std::size_t index) = 0;
    };

    /** Constructor

        Default constructed continuations are empty.
        An exception is thrown when attempting to
        invoke an empty object.
    */
    route_next() = default;

    route_next(route_next const&) = default;
    route_next& operator=(route_next const&) = default;

    route_next(
        owner& who,
        std::size_t index) noexcept
        : p_(&who)
        , i_(index)
    {
    }

    /** Return true if the object is not empty
    */
    explicit
    operator bool() const noexcept
    {
        return p_ != nullptr;
    }

    /** Continue routing

        @throw std::logic_error The object is empty, or this
        continuation was already invoked.
    */
    BOOST_ROUTING_DECL
    void operator()() const;

private:
    owner* p_ = nullptr;
    std::size_t i_ = 0;
};

//------------------------------------------------

/** The result of matching a path against a route
*/
struct route_match
{
    /** The captured parameters, percent-decoded
    */
    param_map params;

    /** The unconsumed portion of the path

        This always begins with a slash.
    */
    std::string path;
};

//------------------------------------------------

/** Base class for request objects

    This is a required public base for any `Params`
    type used with @ref basic_router. It holds the
    request view a router reads and rescopes, and
    declares the response sink used to write the
    synthesized 204, 405 and 501 responses.
*/
class BOOST_ROUTING_SYMBOL_VISIBLE
    route_params_base
{
public:
    virtual ~route_params_base() = default;

    /** The request method

        This is an uppercase token such as `"GET"`.
    */
    std::string verb;

    /** The current pathname

        Inside a mounted router this is the portion of
        the request path after the mount point.
    */
    std::string path;

    /** The parameters captured by the current route
    */
    param_map params;

    /** Return true if the request method matches `s`
    */
    bool is_method(
        std::string_view s) const noexcept
    {
        return verb == s;
    }

    /** Return true if the request method matches `m`
    */
    BOOST_ROUTING_DECL
    bool is_method(
        routing::method m) const noexcept;

    /** Set the response status code

        After this call @ref has_explicit_status
        must return `true`.
    */
    virtual void set_status(unsigned code) = 0;

    /** Set a response header, replacing any previous value
    */
    virtual void set_header(
        std::string_view name,
        std::string_view value) = 0;

    /** Return true if a terminal status or body was written
    */
    virtual bool has_explicit_status() const noexcept = 0;

protected:
    route_params_base() = default;
    route_params_base(route_params_base const&) = default;
    route_params_base& operator=(route_params_base const&) = default;
};

} // routing
} // boost

#endif
