//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_HPP
#define BOOST_ROUTING_HPP

#include <boost/routing/basic_router.hpp>
#include <boost/routing/encode_url.hpp>
#include <boost/routing/error.hpp>
#include <boost/routing/method.hpp>
#include <boost/routing/param_map.hpp>
#include <boost/routing/path_pattern.hpp>
#include <boost/routing/router.hpp>
#include <boost/routing/router_types.hpp>
#include <boost/routing/statuses.hpp>

#endif
