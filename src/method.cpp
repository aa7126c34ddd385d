//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/routing/method.hpp>
#include <boost/routing/detail/except.hpp>
#include <iterator>

namespace boost {
namespace routing {

namespace {

// indexed by method, unknown excluded
constexpr std::string_view tokens[] = {
    "ACL",
    "BIND",
    "CHECKOUT",
    "CONNECT",
    "COPY",
    "DELETE",
    "GET",
    "HEAD",
    "LINK",
    "LOCK",
    "M-SEARCH",
    "MERGE",
    "MKACTIVITY",
    "MKCALENDAR",
    "MKCOL",
    "MOVE",
    "NOTIFY",
    "OPTIONS",
    "PATCH",
    "POST",
    "PROPFIND",
    "PROPPATCH",
    "PURGE",
    "PUT",
    "REBIND",
    "REPORT",
    "SEARCH",
    "SOURCE",
    "SUBSCRIBE",
    "TRACE",
    "UNBIND",
    "UNLINK",
    "UNLOCK",
    "UNSUBSCRIBE"
};

static_assert(
    std::size(tokens) ==
    static_cast<std::size_t>(method::unsubscribe));

} // (anon)

method
string_to_method(
    std::string_view s) noexcept
{
    for(std::size_t i = 0; i < std::size(tokens); ++i)
        if(tokens[i] == s)
            return static_cast<method>(i + 1);
    return method::unknown;
}

std::string_view
to_string(method v)
{
    auto const i = static_cast<std::size_t>(v);
    if(i == 0 || i > std::size(tokens))
        detail::throw_invalid_argument(
            "unknown method");
    return tokens[i - 1];
}

std::vector<std::string> const&
all_methods() noexcept
{
    static std::vector<std::string> const v(
        std::begin(tokens), std::end(tokens));
    return v;
}

} // routing
} // boost
