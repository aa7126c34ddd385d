//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_SRC_DETAIL_ROUTE_MATCH_HPP
#define BOOST_ROUTING_SRC_DETAIL_ROUTE_MATCH_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/detail/router_base.hpp>
#include <boost/routing/path_pattern.hpp>
#include <boost/routing/router_types.hpp>
#include <boost/system/result.hpp>
#include "src/detail/route_rule.hpp"
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace boost {
namespace routing {
namespace detail {

// Matches a path against a compiled pattern
struct router_base::matcher
{
    // throws system_error on a bad pattern
    matcher(
        path_pattern const& pat,
        bool end,
        bool strict,
        bool case_sensitive);

    // the match, or nullopt
    std::optional<route_match>
    operator()(std::string_view path) const;

    system::result<std::string>
    url(param_map const& params) const;

    // values are assigned to captures in order
    system::result<std::string>
    url(std::vector<std::string> const& args) const;

    std::string_view
    source() const noexcept
    {
        return *source_;
    }

    // keys of the captures, in order
    std::vector<std::string> const&
    keys() const noexcept
    {
        return keys_;
    }

    std::string const&
    expression() const noexcept
    {
        return expr_;
    }

private:
    // tokens_ refer into *source_
    std::unique_ptr<std::string const> source_;
    std::vector<route_token> tokens_;
    std::vector<std::string> keys_;
    std::string expr_;
    std::regex re_;
    bool template_;
};

} // detail
} // routing
} // boost

#endif
