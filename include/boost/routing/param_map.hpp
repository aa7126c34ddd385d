//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_PARAM_MAP_HPP
#define BOOST_ROUTING_PARAM_MAP_HPP

#include <boost/routing/detail/config.hpp>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace boost {
namespace routing {

/** A set of captured route parameters.

    Keys are parameter names, or the decimal position
    of an unnamed capture group. A key may be present
    with an absent value: this is how an optional group
    which did not participate in the match is reported,
    and it is distinct from a present empty string.

    Lookup is by exact key. Iteration order is the
    order in which keys were first inserted; equality
    ignores order.

    @par Example
    @code
    param_map pm{ { "category", "programming" } };
    pm.set( "title", "how to node" );
    pm.set( "page", std::nullopt );

    assert( pm.contains( "page" ) );
    assert( ! pm.at( "page" ).has_value() );
    @endcode
*/
class param_map
{
public:
    using value_type = std::pair<
        std::string, std::optional<std::string>>;
    using const_iterator =
        std::vector<value_type>::const_iterator;
    using iterator = const_iterator;

    param_map() = default;

    /** Constructor

        Each pair is inserted as by @ref set.
    */
    BOOST_ROUTING_DECL
    param_map(
        std::initializer_list<std::pair<
            std::string_view, std::string_view>> init);

    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    /** Return true if the key is present, even with an absent value
    */
    bool
    contains(
        std::string_view key) const noexcept
    {
        return find(key) != nullptr;
    }

    /** Return the value for a key, or `nullptr` if the key is missing
    */
    BOOST_ROUTING_DECL
    std::optional<std::string> const*
    find(std::string_view key) const noexcept;

    /** Return the value for a positional key, or `nullptr` if missing
    */
    BOOST_ROUTING_DECL
    std::optional<std::string> const*
    find(std::size_t index) const;

    /** Return the value for a key

        @throw std::out_of_range The key is missing.
    */
    BOOST_ROUTING_DECL
    std::optional<std::string> const&
    at(std::string_view key) const;

    /** Insert or replace the value for a key
    */
    BOOST_ROUTING_DECL
    void
    set(
        std::string_view key,
        std::optional<std::string> value);

    /** Insert or replace every key of another map

        Values from @p other win on key collision.
    */
    BOOST_ROUTING_DECL
    void
    merge(param_map const& other);

    void
    clear() noexcept
    {
        v_.clear();
    }

    friend
    BOOST_ROUTING_DECL
    bool
    operator==(
        param_map const& a,
        param_map const& b) noexcept;

private:
    std::vector<value_type> v_;
};

} // routing
} // boost

#endif
