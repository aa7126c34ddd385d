//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/routing/param_map.hpp>
#include <boost/routing/detail/except.hpp>

namespace boost {
namespace routing {

param_map::
param_map(
    std::initializer_list<std::pair<
        std::string_view, std::string_view>> init)
{
    v_.reserve(init.size());
    for(auto const& kv : init)
        set(kv.first, std::string(kv.second));
}

std::optional<std::string> const*
param_map::
find(std::string_view key) const noexcept
{
    for(auto const& kv : v_)
        if(kv.first == key)
            return &kv.second;
    return nullptr;
}

std::optional<std::string> const*
param_map::
find(std::size_t index) const
{
    return find(std::to_string(index));
}

std::optional<std::string> const&
param_map::
at(std::string_view key) const
{
    auto p = find(key);
    if(! p)
        detail::throw_out_of_range();
    return *p;
}

void
param_map::
set(
    std::string_view key,
    std::optional<std::string> value)
{
    for(auto& kv : v_)
    {
        if(kv.first == key)
        {
            kv.second = std::move(value);
            return;
        }
    }
    v_.emplace_back(
        std::string(key), std::move(value));
}

void
param_map::
merge(param_map const& other)
{
    for(auto const& kv : other.v_)
        set(kv.first, kv.second);
}

bool
operator==(
    param_map const& a,
    param_map const& b) noexcept
{
    if(a.size() != b.size())
        return false;
    for(auto const& kv : a.v_)
    {
        auto p = b.find(kv.first);
        if(! p || *p != kv.second)
            return false;
    }
    return true;
}

} // routing
} // boost
