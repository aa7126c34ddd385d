//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/pct_decode.hpp"
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>

namespace boost {
namespace routing {
namespace detail {

bool
ci_is_equal(
    core::string_view s0,
    core::string_view s1) noexcept
{
    auto n = s0.size();
    if(s1.size() != n)
        return false;
    auto p1 = s0.data();
    auto p2 = s1.data();
    char a, b;
    // fast loop
    while(n--)
    {
        a = *p1++;
        b = *p2++;
        if(a != b)
            goto slow;
    }
    return true;
    do
    {
        a = *p1++;
        b = *p2++;
    slow:
        if( grammar::to_lower(a) !=
            grammar::to_lower(b))
            return false;
    }
    while(n--);
    return true;
}

bool
is_utf8(
    core::string_view s) noexcept
{
    auto it = reinterpret_cast<
        unsigned char const*>(s.data());
    auto const end = it + s.size();
    while(it != end)
    {
        unsigned char const c = *it++;
        if(c < 0x80)
            continue;
        std::size_t n;
        unsigned long cp;
        if((c & 0xE0) == 0xC0)
        {
            n = 1;
            cp = c & 0x1F;
        }
        else if((c & 0xF0) == 0xE0)
        {
            n = 2;
            cp = c & 0x0F;
        }
        else if((c & 0xF8) == 0xF0)
        {
            n = 3;
            cp = c & 0x07;
        }
        else
        {
            return false;
        }
        if(static_cast<std::size_t>(end - it) < n)
            return false;
        for(std::size_t i = 0; i < n; ++i)
        {
            if((it[i] & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (it[i] & 0x3F);
        }
        it += n;
        // overlong, surrogate, or out of range
        if( (n == 1 && cp < 0x80) ||
            (n == 2 && cp < 0x800) ||
            (n == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF)
            return false;
    }
    return true;
}

std::string
pct_decode(
    core::string_view s)
{
    std::string result;
    result.reserve(s.size());
    auto it = s.data();
    auto const end = it + s.size();
    while(it != end)
    {
        if(*it != '%')
        {
            result.push_back(*it++);
            continue;
        }
        ++it;
        if(end - it < 2)
            goto invalid;
        {
            auto d0 = grammar::hexdig_value(*it++);
            auto d1 = grammar::hexdig_value(*it++);
            if(d0 < 0 || d1 < 0)
                goto invalid;
            result.push_back(static_cast<char>(
                d0 * 16 + d1));
        }
    }
    if(! is_utf8(result))
        goto invalid;
    return result;

invalid:
    return std::string(s);
}

} // detail
} // routing
} // boost
