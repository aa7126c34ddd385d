//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_SRC_DETAIL_PCT_DECODE_HPP
#define BOOST_ROUTING_SRC_DETAIL_PCT_DECODE_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>

namespace boost {
namespace routing {
namespace detail {

bool
ci_is_equal(
    core::string_view s0,
    core::string_view s1) noexcept;

// true if s is well-formed UTF-8
bool
is_utf8(
    core::string_view s) noexcept;

// decode all percent escapes, including
// slashes. If an escape is malformed or the
// result is not UTF-8, returns s unchanged.
std::string
pct_decode(
    core::string_view s);

} // detail
} // routing
} // boost

#endif
