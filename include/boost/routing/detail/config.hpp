//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_DETAIL_CONFIG_HPP
#define BOOST_ROUTING_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>
#include <stdint.h>

namespace boost {

namespace routing {

//------------------------------------------------

# if (defined(BOOST_ROUTING_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_ROUTING_STATIC_LINK)
#  if defined(BOOST_ROUTING_SOURCE)
#   define BOOST_ROUTING_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_ROUTING_BUILD_DLL
#  else
#   define BOOST_ROUTING_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_ROUTING_DECL
#  define BOOST_ROUTING_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_ROUTING_SYMBOL_VISIBLE BOOST_ROUTING_DECL
#else
    #define BOOST_ROUTING_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

# if !defined(BOOST_ROUTING_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_ROUTING_NO_LIB)
#  define BOOST_LIB_NAME boost_routing
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_ROUTING_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

//-----------------------------------------------

// Add source location to error codes
#ifdef BOOST_ROUTING_NO_SOURCE_LOCATION
# define BOOST_ROUTING_ERR(ev) (::boost::system::error_code(ev))
# define BOOST_ROUTING_RETURN_EC(ev) return (ev)
#else
# define BOOST_ROUTING_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define BOOST_ROUTING_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // routing

// lift grammar into our namespace
namespace urls {
namespace grammar {}
}
namespace routing {
namespace grammar = ::boost::urls::grammar;
} // routing

} // boost

#endif
