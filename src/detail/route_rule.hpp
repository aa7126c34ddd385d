//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_SRC_DETAIL_ROUTE_RULE_HPP
#define BOOST_ROUTING_SRC_DETAIL_ROUTE_RULE_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/system/result.hpp>
#include <vector>

namespace boost {
namespace routing {
namespace detail {

/*
route-pattern  = *( escaped / param / group / wildcard / literal )
escaped        = "\" CHAR                 ; literal character
param          = ":" ident [ constraint ] [ modifier ]
group          = constraint [ modifier ]  ; unnamed, captured by position
wildcard       = "*"                      ; unnamed, same as "(.*)"
constraint     = "(" 1*( constraint-char ) ")"
modifier       = "?" / "*" / "+"
ident          = ALPHA *( ALPHA / DIGIT / "_" )
constraint-char = %x20-7E except ")"
literal        = any other character

A ":" which is not followed by ALPHA is a literal.
*/

//------------------------------------------------

struct constraint_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return ch >= 0x20 && ch <= 0x7E && ch != ')';
    }
};

struct ident_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch == '_');
    }
};

constexpr struct
{
    // empty for no constraint
    using value_type = core::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end || *it != '(')
            return core::string_view();
        auto it0 = it;
        it = grammar::find_if_not(
            it, end, constraint_char{});
        if(it - it0 <= 1)
        {
            // too small
            it = it0;
            BOOST_ROUTING_RETURN_EC(
                grammar::error::syntax);
        }
        if(it == end || *it != ')')
        {
            // unterminated
            it = it0;
            BOOST_ROUTING_RETURN_EC(
                grammar::error::syntax);
        }
        return core::string_view(++it0, it++);
    }
} constraint_rule{};

constexpr struct
{
    using value_type = core::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if( it == end ||
            ! grammar::alpha_chars(*it))
            BOOST_ROUTING_RETURN_EC(
                grammar::error::mismatch);
        auto it0 = it++;
        it = grammar::find_if_not(
            it, end, ident_char{});
        return core::string_view(it0, it);
    }
} param_name_rule{};

//------------------------------------------------

/** A unit of a route pattern
*/
struct route_token
{
    enum kind_type : char
    {
        literal,
        escaped,
        param,
        group,
        wildcard
    };

    // literal text, for literal and escaped
    core::string_view text;

    // empty for group and wildcard
    core::string_view name;

    // empty for the default capture
    core::string_view constraint;

    kind_type kind = literal;

    // the '/' or '.' taken from the preceding literal
    char prefix = 0;

    // '?', '*', '+' or 0
    char modifier = 0;

    // the prefix is followed by more text before the next
    // delimiter, so it stays required when the value is optional
    bool partial = false;

    bool
    is_capture() const noexcept
    {
        return kind >= param;
    }

    bool
    optional() const noexcept
    {
        return modifier == '?' || modifier == '*';
    }

    bool
    repeat() const noexcept
    {
        return modifier == '+' || modifier == '*';
    }
};

constexpr struct
{
    using value_type = char;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if( it != end && (
            *it == '?' || *it == '*' || *it == '+'))
            return *it++;
        return char(0);
    }
} modifier_rule{};

struct capture_rule_t
{
    using value_type = route_token;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end)
            BOOST_ROUTING_RETURN_EC(
                grammar::error::need_more);
        value_type v;
        if(*it == '*')
        {
            ++it;
            v.kind = route_token::wildcard;
            return v;
        }
        if(*it == ':')
        {
            auto const it0 = it++;
            auto rv = grammar::parse(
                it, end, param_name_rule);
            if(rv.has_error())
            {
                it = it0;
                return rv.error();
            }
            v.kind = route_token::param;
            v.name = rv.value();
        }
        else if(*it == '(')
        {
            v.kind = route_token::group;
        }
        else
        {
            BOOST_ROUTING_RETURN_EC(
                grammar::error::mismatch);
        }
        {
            auto rv = grammar::parse(
                it, end, constraint_rule);
            if(rv.has_error())
                return rv.error();
            v.constraint = rv.value();
        }
        v.modifier = grammar::parse(
            it, end, modifier_rule).value();
        return v;
    }
};

constexpr capture_rule_t capture_rule{};

//------------------------------------------------

struct pattern_rule_t
{
    using value_type = std::vector<route_token>;

    auto
    parse(
        char const*& it,
        char const* const end) const ->
            system::result<value_type>
    {
        value_type rv;
        auto lit = it;

        auto const flush = [&](char const* last)
        {
            if(lit == last)
                return;
            route_token t;
            t.text = core::string_view(lit, last);
            rv.push_back(t);
        };

        while(it != end)
        {
            if(*it == '\\')
            {
                flush(it);
                if(++it == end)
                    BOOST_ROUTING_RETURN_EC(
                        grammar::error::need_more);
                route_token t;
                t.kind = route_token::escaped;
                t.text = core::string_view(it, 1);
                rv.push_back(t);
                lit = ++it;
                continue;
            }
            if( *it != ':' &&
                *it != '(' &&
                *it != '*')
            {
                ++it;
                continue;
            }
            auto const it0 = it;
            auto rt = grammar::parse(
                it, end, capture_rule);
            if(rt.has_error())
            {
                if(rt.error() != grammar::error::mismatch)
                    return rt.error();
                // ":" not followed by a name
                it = it0 + 1;
                continue;
            }
            flush(it0);
            route_token t = rt.value();
            // take the delimiter from the preceding literal
            if( ! rv.empty() &&
                rv.back().kind == route_token::literal &&
                rv.back().text.data() +
                    rv.back().text.size() == it0)
            {
                auto& prev = rv.back().text;
                if( prev.back() == '/' ||
                    prev.back() == '.')
                {
                    t.prefix = prev.back();
                    prev.remove_suffix(1);
                    if(prev.empty())
                        rv.pop_back();
                }
            }
            if( t.prefix &&
                it != end &&
                *it != t.prefix)
                t.partial = true;
            rv.push_back(t);
            lit = it;
        }
        flush(it);
        // gcc 7 bug workaround
        return system::result<value_type>(std::move(rv));
    }
};

constexpr pattern_rule_t pattern_rule{};

} // detail
} // routing
} // boost

#endif
