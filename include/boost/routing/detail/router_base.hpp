//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_DETAIL_ROUTER_BASE_HPP
#define BOOST_ROUTING_DETAIL_ROUTER_BASE_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/param_map.hpp>
#include <boost/routing/path_pattern.hpp>
#include <boost/routing/router_types.hpp>
#include <boost/system/result.hpp>
#include <spdlog/logger.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boost {
namespace routing {

template<class>
class basic_router;

namespace detail {

// implementation for all routers
class BOOST_ROUTING_DECL
    router_base
{
    struct impl;
    std::shared_ptr<impl> impl_;

protected:
    using opt_flags = unsigned int;

    enum
    {
        is_invalid = 0,
        is_plain = 1,
        is_router = 2
    };

    struct BOOST_ROUTING_DECL
        handler
    {
        char const kind;
        explicit handler(char kind_) noexcept : kind(kind_) {}
        virtual ~handler() = default;
        virtual void invoke(
            route_params_base&, route_next) const = 0;

        // true for a null function or router
        virtual bool empty() const noexcept { return false; }

        // demangled type of the wrapped value
        virtual std::string type_name() const = 0;
    };

    using handler_ptr = std::unique_ptr<handler>;

    struct handlers
    {
        std::size_t n;
        handler_ptr* p;
    };

    struct BOOST_ROUTING_DECL
        param_hook
    {
        virtual ~param_hook() = default;
        virtual void invoke(
            route_params_base&,
            std::optional<std::string_view>,
            route_next) const = 0;
    };

    using hook_ptr = std::shared_ptr<param_hook const>;

protected:
    struct matcher;
    struct layer;
    struct dispatcher;
    struct chain;

    router_base(opt_flags, std::shared_ptr<spdlog::logger>);

    // true for a moved-from router
    bool empty() const noexcept
    {
        return impl_ == nullptr;
    }

    std::size_t add_impl(
        std::string_view name,
        path_pattern const& pattern,
        std::vector<std::string> const& methods,
        bool prefix,
        handlers hn);

    void param_impl(std::string_view name, hook_ptr hook);
    void param_impl(std::size_t idx,
        std::string_view name, hook_ptr hook);

    std::size_t size_impl() const noexcept;
    std::optional<std::size_t> find_impl(
        std::string_view name) const noexcept;
    std::vector<std::string> const&
        accepted_impl() const noexcept;

    std::string_view name_impl(std::size_t idx) const noexcept;
    std::string_view pattern_impl(std::size_t idx) const noexcept;
    std::vector<std::string> const&
        methods_impl(std::size_t idx) const noexcept;
    bool is_prefix_impl(std::size_t idx) const noexcept;
    std::optional<route_match> match_impl(
        std::size_t idx, std::string_view path) const;
    system::result<std::string> url_impl(
        std::size_t idx, param_map const& params) const;
    system::result<std::string> url_impl(
        std::size_t idx,
        std::vector<std::string> const& args) const;

    void dispatch_impl(
        route_params_base& p,
        route_next downstream) const;

    static void dispatch_nested(
        router_base const& r,
        route_params_base& p,
        route_next next)
    {
        r.dispatch_impl(p, next);
    }
};

} // detail
} // routing
} // boost

#endif
