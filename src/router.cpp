//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/routing/router.hpp>
#include <boost/routing/detail/except.hpp>
#include <boost/routing/encode_url.hpp>
#include <boost/routing/statuses.hpp>
#include "src/detail/pct_decode.hpp"

namespace boost {
namespace routing {

bool
response::
exists(std::string_view name) const noexcept
{
    for(auto const& f : fields)
        if(detail::ci_is_equal(f.first, name))
            return true;
    return false;
}

std::string const&
response::
at(std::string_view name) const
{
    for(auto const& f : fields)
        if(detail::ci_is_equal(f.first, name))
            return f.second;
    detail::throw_out_of_range();
}

void
response::
set(
    std::string_view name,
    std::string_view value)
{
    for(auto& f : fields)
    {
        if(detail::ci_is_equal(f.first, name))
        {
            f.second = value;
            return;
        }
    }
    fields.emplace_back(name, value);
}

std::size_t
response::
erase(std::string_view name) noexcept
{
    auto const n = fields.size();
    std::erase_if(fields,
        [name](auto const& f)
        {
            return detail::ci_is_equal(f.first, name);
        });
    return n - fields.size();
}

//-----------------------------------------------

route_params::
route_params(
    std::string_view verb_,
    std::string_view path_)
{
    verb = verb_;
    path = path_;
}

route_params&
route_params::
status(unsigned code)
{
    res.status = code;
    res.reason = statuses::reason(code);
    res.explicit_status = true;
    return *this;
}

void
route_params::
send(std::string_view body)
{
    if(! res.explicit_status)
        status(200);
    if(! res.exists("Content-Type"))
    {
        if(! body.empty() && body.front() == '<')
            res.set("Content-Type", "text/html; charset=utf-8");
        else
            res.set("Content-Type", "text/plain; charset=utf-8");
    }
    res.set("Content-Length", std::to_string(body.size()));
    if(is_method(method::head))
        res.body.clear();
    else
        res.body = body;
    res.explicit_status = true;
}

void
route_params::
redirect(std::string_view url)
{
    res.set("Location", encode_url(url));
    if(! statuses::is_redirect(res.status))
        status(302);
    auto const body =
        "Redirecting to " + std::string(url) + ".";
    res.set("Content-Type", "text/plain; charset=utf-8");
    send(body);
}

void
route_params::
reset()
{
    verb.clear();
    path.clear();
    params.clear();
    res = {};
}

void
route_params::
set_status(unsigned code)
{
    status(code);
}

void
route_params::
set_header(
    std::string_view name,
    std::string_view value)
{
    res.set(name, value);
}

bool
route_params::
has_explicit_status() const noexcept
{
    return res.explicit_status;
}

} // routing
} // boost
