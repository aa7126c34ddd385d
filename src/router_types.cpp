//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/routing/router_types.hpp>
#include <boost/routing/detail/except.hpp>

namespace boost {
namespace routing {

void
route_next::
operator()() const
{
    if(! p_)
        detail::throw_logic_error(
            "empty route_next");
    p_->do_next(i_);
}

bool
route_params_base::
is_method(
    routing::method m) const noexcept
{
    if(m == routing::method::unknown)
        return false;
    return verb == to_string(m);
}

} // routing
} // boost
