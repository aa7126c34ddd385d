//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_IMPL_ERROR_HPP
#define BOOST_ROUTING_IMPL_ERROR_HPP

#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <system_error>
#include <type_traits>

namespace boost {

namespace system {

template<>
struct is_error_code_enum<
    ::boost::routing::error>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::boost::routing::error>
    : std::true_type {};
} // std

namespace boost {

//-----------------------------------------------

namespace routing {

namespace detail {

struct BOOST_ROUTING_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_ROUTING_DECL const char* name(
        ) const noexcept override;
    BOOST_ROUTING_DECL std::string message(
        int) const override;
    BOOST_ROUTING_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x7c1e5a0d93b2f468)
    {
    }
};

BOOST_ROUTING_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // routing
} // boost

#endif
