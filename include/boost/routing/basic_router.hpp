//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_BASIC_ROUTER_HPP
#define BOOST_ROUTING_BASIC_ROUTER_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/detail/except.hpp>
#include <boost/routing/detail/router_base.hpp>
#include <boost/routing/encode_url.hpp>
#include <boost/routing/error.hpp>
#include <boost/routing/method.hpp>
#include <boost/routing/param_map.hpp>
#include <boost/routing/path_pattern.hpp>
#include <boost/routing/router_types.hpp>
#include <boost/routing/statuses.hpp>
#include <boost/core/demangle.hpp>
#include <boost/system/result.hpp>
#include <spdlog/logger.h>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace boost {
namespace routing {

template<class> class basic_router;

/** Configuration options for routers.

    All options default to `false`, and a nested
    router never inherits them from its parent.
*/
struct router_options
{
    /** Constructor.
    */
    router_options() = default;

    /** Set whether to merge parameters from parent routers.

        When set, handlers of this router see the parameters
        captured by the routes enclosing it, overridden by
        the parameters of the route that matched.

        @par Example
        @code
        router r( router_options()
            .merge_params( true )
            .strict( true ) );
        @endcode

        @param value `true` to merge parameters from parent routers.

        @return A reference to `*this` for chaining.
    */
    router_options&
    merge_params(
        bool value) noexcept
    {
        v_ = (v_ & ~1u) | (value ? 1u : 0u);
        return *this;
    }

    /** Set whether pattern matching is case-sensitive.

        @param value `true` to perform case-sensitive path matching.

        @return A reference to `*this` for chaining.
    */
    router_options&
    case_sensitive(
        bool value) noexcept
    {
        v_ = (v_ & ~2u) | (value ? 2u : 0u);
        return *this;
    }

    /** Set whether pattern matching is strict.

        Strict matching treats a trailing slash as significant:
        the pattern `"/api"` matches `"/api"` but not `"/api/"`.
        Patterns registered with @ref basic_router::mount are
        always strict.

        @param value `true` to enable strict path matching.

        @return A reference to `*this` for chaining.
    */
    router_options&
    strict(
        bool value) noexcept
    {
        v_ = (v_ & ~4u) | (value ? 4u : 0u);
        return *this;
    }

    /** Set the logger used for tracing

        Registration and dispatch are logged at the
        `trace` level. A null logger disables tracing.

        @par Example
        @code
        auto log = spdlog::stdout_color_mt( "routing" );
        log->set_level( spdlog::level::trace );
        router r( router_options().logger( log ) );
        @endcode

        @return A reference to `*this` for chaining.
    */
    router_options&
    logger(
        std::shared_ptr<spdlog::logger> log) noexcept
    {
        log_ = std::move(log);
        return *this;
    }

private:
    template<class> friend class basic_router;
    unsigned int v_ = 0;
    std::shared_ptr<spdlog::logger> log_;
};

//-----------------------------------------------

namespace detail {

template<class T>
std::string
to_url_arg(T const& v)
{
    if constexpr (std::is_arithmetic_v<T>)
        return std::to_string(v);
    else
        return std::string(std::string_view(v));
}

} // detail

/** A container for route handlers.

    `basic_router` objects store routes and dispatch
    requests to the handlers of the routes which match
    the method and path of the request. Routes are
    tried in the order they were added.

    Router objects are lightweight, shared references to
    their contents. Copies do not create new instances;
    they all refer to the same underlying routes.

    @par Handlers

    A handler is a callable with this equivalent signature:
    @code
    void handler( Params& p, route_next next );
    @endcode

    Invoking `next` runs the rest of the chain and
    returns when it has finished. A handler which does
    not invoke `next` ends the chain. A router may be
    used wherever a handler is expected; it is
    dispatched with the rest of the chain as its
    downstream continuation.

    @par Fallback responses

    When no route handled a request and nothing set
    the status, dispatch answers `OPTIONS` with 204, a
    method that some route accepts with 405, and any
    other method with 501. The `Allow` field lists the
    methods of the routes which matched the path.

    @par Example
    @code
    router r;
    r.get( "/hello/:name",
        []( route_params& p, route_next )
        {
            p.send( "Hello, " + *p.params.at( "name" ) );
        } );
    @endcode

    @par Thread Safety

    Member functions marked `const` may be called
    concurrently. Modification is not thread-safe.

    @par Constraints

    `Params` must be publicly derived from @ref route_params_base.

    @tparam Params The type of the parameters object passed to handlers.
*/
template<class P>
class basic_router : public detail::router_base
{
    static_assert(std::derived_from<P, route_params_base>);

    template<class T>
    static inline constexpr char handler_kind =
        []() -> char
        {
            if constexpr (std::is_base_of_v<basic_router<P>, T>)
            {
                return is_router;
            }
            else if constexpr (std::is_invocable_v<
                T const&, P&, route_next>)
            {
                return is_plain;
            }
            else
            {
                return is_invalid;
            }
        }();

    template<class... Ts>
    static inline constexpr bool handler_check =
        ((handler_kind<std::decay_t<Ts>> != is_invalid) && ...);

    template<class H>
    struct handler_impl : handler
    {
        using type = std::decay_t<H>;

        type h;

        template<class H_>
        explicit handler_impl(H_&& h_)
            : handler(handler_kind<type>)
            , h(std::forward<H_>(h_))
        {
        }

        void
        invoke(
            route_params_base& rp,
            route_next next) const override
        {
            if constexpr (handler_kind<type> == is_router)
                dispatch_nested(h, rp, next);
            else
                std::invoke(h, static_cast<P&>(rp), next);
        }

        bool
        empty() const noexcept override
        {
            if constexpr (handler_kind<type> == is_router)
                return h.router_base::empty();
            else if constexpr (std::is_constructible_v<bool, type const&>)
                return ! static_cast<bool>(h);
            else
                return false;
        }

        std::string
        type_name() const override
        {
            return core::demangle(typeid(type).name());
        }
    };

    template<class H>
    static handler_ptr make_handler(H&& h)
    {
        return std::make_unique<handler_impl<H>>(std::forward<H>(h));
    }

    template<std::size_t N>
    struct handlers_impl : handlers
    {
        handler_ptr v[N];

        template<class... HN>
        explicit handlers_impl(HN&&... hn)
        {
            p = v;
            n = sizeof...(HN);
            assign<0>(std::forward<HN>(hn)...);
        }

    private:
        template<std::size_t I, class H1, class... HN>
        void assign(H1&& h1, HN&&... hn)
        {
            v[I] = make_handler(std::forward<H1>(h1));
            assign<I+1>(std::forward<HN>(hn)...);
        }

        template<std::size_t>
        void assign(int = 0)
        {
        }
    };

    template<class... HN>
    static auto make_handlers(HN&&... hn)
    {
        return handlers_impl<sizeof...(HN)>(
            std::forward<HN>(hn)...);
    }

    template<class F>
    struct hook_impl : param_hook
    {
        std::decay_t<F> f;

        template<class F_>
        explicit hook_impl(F_&& f_)
            : f(std::forward<F_>(f_))
        {
        }

        void
        invoke(
            route_params_base& rp,
            std::optional<std::string_view> value,
            route_next next) const override
        {
            std::invoke(f, static_cast<P&>(rp), value, next);
        }
    };

    template<class F>
    static hook_ptr make_hook(F&& f)
    {
        static_assert(std::is_invocable_v<
            std::decay_t<F> const&, P&,
                std::optional<std::string_view>, route_next>,
            "invalid parameter hook signature");
        return std::make_shared<hook_impl<F>>(
            std::forward<F>(f));
    }

    template<class H1, class... HN>
    std::size_t
    add_route(
        std::string_view name,
        path_pattern const& pattern,
        std::vector<std::string> const& methods,
        bool prefix,
        H1&& h1, HN&&... hn)
    {
        static_assert(handler_check<H1, HN...>,
            "invalid handler signature");
        return add_impl(name, pattern, methods, prefix,
            make_handlers(std::forward<H1>(h1),
                std::forward<HN>(hn)...));
    }

    static std::vector<std::string>
    one_method(method m)
    {
        return { std::string(to_string(m)) };
    }

    std::string
    resolve(std::string_view target) const
    {
        if( ! target.empty() &&
            target.front() == '/')
            return std::string(target);
        auto rv = url(target);
        if(rv.has_error())
            detail::throw_system_error(rv.error(),
                "redirect `" + std::string(target) + "`");
        return std::move(*rv);
    }

public:
    /** The type of params used in handlers.
    */
    using params_type = P;

    /** A handle to one route of a router.

        Objects of this type are returned by the
        registration functions and by @ref lookup.
        They share ownership of the router.
    */
    class fluent_route;

    /** Constructor.

        Creates an empty router with the specified configuration.

        @param options The configuration options to use.
    */
    explicit
    basic_router(
        router_options options = {})
        : router_base(options.v_, std::move(options.log_))
    {
    }

    /** Add a route.

        Adds a route which runs the handlers when the
        request path matches `pattern` exactly and the
        request method is one of `methods`. A `HEAD`
        request also runs a route which accepts `GET`.
        An empty list of methods adds a prefix route,
        as @ref mount does.

        @par Example
        @code
        r.add( "user", "/users/:id", { "GET", "PATCH" },
            []( route_params& p, route_next next )
            {
                p.send( *p.params.at( "id" ) );
            } );
        @endcode

        @param name The name used by @ref lookup and @ref url.

        @param pattern The path template or regular expression.

        @param methods The methods of the route, in any case.

        @param h1 The first handler to add.

        @param hn Additional handlers to add, invoked after @p h1 in
        registration order.

        @throw system::system_error The pattern is malformed
        (@ref error::bad_pattern), or a handler is empty
        (@ref error::bad_handler).

        @return The added route.
    */
    template<class H1, class... HN>
    fluent_route
    add(
        std::string_view name,
        path_pattern const& pattern,
        std::vector<std::string> const& methods,
        H1&& h1, HN&&... hn)
    {
        return fluent_route(*this, add_route(
            name, pattern, methods, false,
            std::forward<H1>(h1), std::forward<HN>(hn)...));
    }

    /** Add a route.
    */
    template<class H1, class... HN>
    fluent_route
    add(
        path_pattern const& pattern,
        std::vector<std::string> const& methods,
        H1&& h1, HN&&... hn)
    {
        return add(std::string_view(), pattern, methods,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for one known method.
    */
    template<class H1, class... HN>
    fluent_route
    add(
        std::string_view name,
        method verb,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, pattern, one_method(verb),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for one known method.
    */
    template<class H1, class... HN>
    fluent_route
    add(
        method verb,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(std::string_view(), pattern, one_method(verb),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `GET`
    template<class H1, class... HN>
    fluent_route
    get(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::get, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `GET`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    get(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::get, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `POST`
    template<class H1, class... HN>
    fluent_route
    post(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::post, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `POST`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    post(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::post, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `PUT`
    template<class H1, class... HN>
    fluent_route
    put(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::put, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `PUT`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    put(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::put, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `DELETE`
    template<class H1, class... HN>
    fluent_route
    delete_(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::delete_, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `DELETE`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    delete_(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::delete_, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `PATCH`
    template<class H1, class... HN>
    fluent_route
    patch(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::patch, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `PATCH`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    patch(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::patch, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `HEAD`
    template<class H1, class... HN>
    fluent_route
    head(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::head, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `HEAD`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    head(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::head, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `OPTIONS`
    template<class H1, class... HN>
    fluent_route
    options(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::options, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `OPTIONS`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    options(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::options, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `TRACE`
    template<class H1, class... HN>
    fluent_route
    trace(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::trace, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `TRACE`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    trace(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::trace, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `CONNECT`
    template<class H1, class... HN>
    fluent_route
    connect(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, method::connect, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a route for `CONNECT`
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, path_pattern>)
    fluent_route
    connect(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(method::connect, pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for every known method.

        The route accepts each method of @ref all_methods.
    */
    template<class H1, class... HN>
    fluent_route
    all(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return add(name, pattern, all_methods(),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for every known method.
    */
    template<class H1, class... HN>
    fluent_route
    all(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
        requires (! std::is_convertible_v<H1, path_pattern>)
    {
        return add(std::string_view(), pattern, all_methods(),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add handlers for a path prefix.

        The handlers run for every method when the request
        path begins with `pattern` on a segment boundary.
        Within the handlers, and within any router passed
        as a handler, the request path is the remainder
        after the prefix. The pattern is always matched
        strictly, so `"/api/"` requires the trailing slash.

        @par Example
        @code
        router api;
        api.get( "/users", list_users );
        r.mount( "/api", api );     // GET /api/users
        @endcode

        @param name The name used by @ref lookup and @ref url.

        @param pattern The path prefix.

        @param h1 The first handler or router to add.

        @param hn Additional handlers to add, invoked after @p h1 in
        registration order.

        @return The added route.
    */
    template<class H1, class... HN>
    fluent_route
    mount(
        std::string_view name,
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return fluent_route(*this, add_route(
            name, pattern, {}, true,
            std::forward<H1>(h1), std::forward<HN>(hn)...));
    }

    /** Add handlers for a path prefix.
    */
    template<class H1, class... HN>
    fluent_route
    mount(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
        requires (! std::is_convertible_v<H1, path_pattern>)
    {
        return mount(std::string_view(), pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add handlers for a path prefix.

        This is equivalent to @ref mount without a name.
    */
    template<class H1, class... HN>
    fluent_route
    use(
        path_pattern const& pattern,
        H1&& h1, HN&&... hn)
    {
        return mount(std::string_view(), pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add handlers for every request.

        This is equivalent to writing:
        @code
        use( "/", h1, hn... );
        @endcode
    */
    template<class H1, class... HN>
    fluent_route
    use(H1&& h1, HN&&... hn)
        requires (! std::is_convertible_v<H1, path_pattern>)
    {
        return mount(std::string_view(), "/",
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a redirect.

        Adds a route for every method which sets the
        `Location` field to `destination` and the status
        to `code`. A source or destination which does not
        begin with a slash is the name of a route, and is
        replaced by the URL of that route.

        @par Example
        @code
        r.redirect( "/login", "sign-in" );
        r.redirect( "/old", "/new", 308 );
        @endcode

        @throw std::invalid_argument `code` is not a redirect status.

        @throw system::system_error A name could not be resolved.

        @return The added route.
    */
    fluent_route
    redirect(
        std::string_view source,
        std::string_view destination,
        unsigned code = 301)
    {
        if(! statuses::is_redirect(code))
            detail::throw_invalid_argument(
                "not a redirect status");
        auto from = resolve(source);
        auto location = encode_url(resolve(destination));
        return all(std::string_view(), from,
            [location, code](P& p, route_next)
            {
                p.set_header("Location", location);
                p.set_status(code);
            });
    }

    /** Add a parameter hook.

        The hook runs before the handlers of every route
        whose pattern declares the parameter `name`,
        including routes added after this call. Hooks of
        one route run in the order their parameters appear
        in the pattern. A hook replaces any previous hook
        for the same name.

        The hook has this equivalent signature:
        @code
        void hook( Params& p, std::optional<std::string_view> value, route_next next );
        @endcode
    */
    template<class F>
    void
    param(
        std::string_view name,
        F&& f)
    {
        param_impl(name, make_hook(std::forward<F>(f)));
    }

    /** Return the first route with the given name, if any
    */
    std::optional<fluent_route>
    lookup(std::string_view name) const
    {
        auto i = find_impl(name);
        if(! i)
            return std::nullopt;
        return fluent_route(*this, *i);
    }

    /** Return the URL of a named route.

        @par Example
        @code
        r.get( "books", "/:category/:title", show );
        auto u = r.url( "books",
            { { "category", "programming" }, { "title", "how to node" } } );
        assert( *u == "/programming/how%20to%20node" );
        @endcode

        @return The URL, or an error: @ref error::route_not_found
        when no route has the name, else the error of
        @ref fluent_route::url.
    */
    system::result<std::string>
    url(
        std::string_view name,
        param_map const& params = {}) const
    {
        auto i = find_impl(name);
        if(! i)
            BOOST_ROUTING_RETURN_EC(
                error::route_not_found);
        return url_impl(*i, params);
    }

    /** Return the URL of a named route.

        The arguments are assigned to the parameters of
        the route in the order they appear in its pattern.
    */
    template<class A1, class... AN>
    system::result<std::string>
    url(
        std::string_view name,
        A1 const& a1, AN const&... an) const
        requires (! std::is_convertible_v<A1, param_map const&>)
    {
        auto i = find_impl(name);
        if(! i)
            BOOST_ROUTING_RETURN_EC(
                error::route_not_found);
        return url_impl(*i, std::vector<std::string>{
            detail::to_url_arg(a1), detail::to_url_arg(an)... });
    }

    /** Return the number of routes
    */
    std::size_t
    size() const noexcept
    {
        return size_impl();
    }

    /** Return the route at an index, in registration order

        @throw std::out_of_range `i >= size()`
    */
    fluent_route
    at(std::size_t i) const
    {
        if(i >= size())
            detail::throw_out_of_range();
        return fluent_route(*this, i);
    }

    /** Return every method accepted by some route

        The list always contains `OPTIONS`.
    */
    std::vector<std::string> const&
    accepted_methods() const noexcept
    {
        return accepted_impl();
    }

    /** Dispatch a request.

        Runs the matching routes for the method and path
        of `p`. The fields `path` and `params` are restored
        when this function returns or throws.
    */
    void
    dispatch(P& p) const
    {
        dispatch_impl(p, route_next());
    }

    /** Dispatch a request, with a downstream continuation

        The continuation `f` is invoked with no arguments
        when a chain runs to its end, and at most once.
        Handlers see the request path of `p` as it was when
        the call was made.
    */
    template<class F>
    void
    dispatch(P& p, F&& f) const
    {
        struct downstream : route_next::owner
        {
            std::remove_reference_t<F>& f;
            bool done = false;

            explicit downstream(
                std::remove_reference_t<F>& f_) noexcept
                : f(f_)
            {
            }

            void
            do_next(std::size_t) override
            {
                if(done)
                    detail::throw_logic_error(
                        "route_next invoked more than once");
                done = true;
                std::invoke(f);
            }
        };

        downstream d(f);
        dispatch_impl(p, route_next(d, 0));
    }
};

//-----------------------------------------------

template<class P>
class basic_router<P>::
    fluent_route
{
public:
    fluent_route(fluent_route const&) = default;
    fluent_route& operator=(fluent_route const&) = default;

    /** Return the name, or the empty string
    */
    std::string_view
    name() const noexcept
    {
        return r_.name_impl(i_);
    }

    /** Return the pattern, or the description of the expression
    */
    std::string_view
    pattern() const noexcept
    {
        return r_.pattern_impl(i_);
    }

    /** Return the uppercase methods

        The list is empty for a prefix route.
    */
    std::vector<std::string> const&
    methods() const noexcept
    {
        return r_.methods_impl(i_);
    }

    /** Return true if this is a prefix route
    */
    bool
    is_prefix() const noexcept
    {
        return r_.is_prefix_impl(i_);
    }

    /** Return the index of the route in its router
    */
    std::size_t
    index() const noexcept
    {
        return i_;
    }

    /** Match a path against the pattern of this route

        @return The captured parameters and the remaining
        path, or `std::nullopt`.
    */
    std::optional<route_match>
    match(std::string_view path) const
    {
        return r_.match_impl(i_, path);
    }

    /** Add a parameter hook to this route only

        @see basic_router::param
    */
    template<class F>
    fluent_route&
    param(
        std::string_view name,
        F&& f)
    {
        r_.param_impl(i_, name,
            make_hook(std::forward<F>(f)));
        return *this;
    }

    /** Return a URL built from the pattern of this route

        Each value is substituted for the parameter with
        the same name, then every path segment is
        percent-encoded on its own.

        @return The URL, or an error: @ref error::not_a_template
        for a regular expression, @ref error::missing_parameter
        when a required parameter has no value.
    */
    system::result<std::string>
    url(param_map const& params = {}) const
    {
        return r_.url_impl(i_, params);
    }

    /** Return a URL built from positional values
    */
    template<class A1, class... AN>
    system::result<std::string>
    url(A1 const& a1, AN const&... an) const
        requires (! std::is_convertible_v<A1, param_map const&>)
    {
        return r_.url_impl(i_, std::vector<std::string>{
            detail::to_url_arg(a1), detail::to_url_arg(an)... });
    }

private:
    friend class basic_router;

    fluent_route(
        basic_router const& r,
        std::size_t i)
        : r_(r)
        , i_(i)
    {
    }

    basic_router r_;
    std::size_t i_;
};

} // routing
} // boost

#endif
