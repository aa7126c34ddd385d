//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_SRC_DETAIL_ROUTER_BASE_HPP
#define BOOST_ROUTING_SRC_DETAIL_ROUTER_BASE_HPP

#include <boost/routing/detail/router_base.hpp>
#include "src/detail/route_match.hpp"
#include <utility>

namespace boost {
namespace routing {
namespace detail {

enum : unsigned int
{
    opt_merge_params = 1,
    opt_case_sensitive = 2,
    opt_strict = 4
};

// A layer is one registered route: a compiled
// pattern, its methods, and the middleware chain
struct router_base::layer
{
    matcher match;
    std::string name;

    // uppercase, without duplicates
    std::vector<std::string> methods;

    std::vector<handler_ptr> handlers;

    // hooks registered for this route, by parameter name
    std::vector<std::pair<std::string, hook_ptr>> hooks;

    // hooks to run, in the order their parameters
    // appear in the pattern, then the handlers
    std::vector<std::pair<std::string const*,
        param_hook const*>> composed;

    bool prefix;

    layer(
        std::string_view name_,
        path_pattern const& pat,
        std::vector<std::string> methods_,
        bool prefix_,
        opt_flags opt)
        : match(pat,
            ! prefix_,
            prefix_ || (opt & opt_strict) != 0,
            (opt & opt_case_sensitive) != 0)
        , name(name_)
        , methods(std::move(methods_))
        , prefix(prefix_)
    {
    }

    bool
    allows(std::string_view verb) const noexcept
    {
        for(auto const& m : methods)
            if(m == verb)
                return true;
        return false;
    }

    // register or replace a hook, then recompose
    void
    set_hook(
        std::string_view key,
        hook_ptr hook)
    {
        bool found = false;
        for(auto& h : hooks)
        {
            if(h.first == key)
            {
                h.second = std::move(hook);
                found = true;
                break;
            }
        }
        if(! found)
            hooks.emplace_back(
                std::string(key), std::move(hook));

        composed.clear();
        for(auto const& k : match.keys())
            for(auto const& h : hooks)
                if(h.first == k)
                    composed.emplace_back(
                        &k, h.second.get());
    }
};

struct router_base::impl
{
    std::vector<layer> layers;

    // every method of every layer, seeded with OPTIONS
    std::vector<std::string> accepted{ "OPTIONS" };

    // router-wide hooks, applied to later layers too
    std::vector<std::pair<std::string, hook_ptr>> hooks;

    std::shared_ptr<spdlog::logger> log;
    opt_flags opt;

    impl(
        opt_flags opt_,
        std::shared_ptr<spdlog::logger> log_)
        : log(std::move(log_))
        , opt(opt_)
    {
    }
};

} // detail
} // routing
} // boost

#endif
