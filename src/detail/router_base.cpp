//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/router_base.hpp"
#include <boost/routing/detail/except.hpp>
#include <boost/routing/error.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/assert.hpp>
#include "src/detail/route_match.hpp"

/*

pattern        target          path(mount)    path(get)
-----------------------------------------------------------------
/              /               /
/              /api            /api
/api           /api            /              /api
/api           /api/           /              /api/
/api           /api/           /              no-match       strict
/api           /api/v0         /v0            no-match
/api/          /api            no-match       no-match       strict
/api/          /api/v0         /v0            no-match
/first/:id     /first/a/b      /b             no-match

*/

namespace boost {
namespace routing {
namespace detail {

namespace {

void
add_unique(
    std::vector<std::string>& v,
    std::string_view s)
{
    for(auto const& e : v)
        if(e == s)
            return;
    v.emplace_back(s);
}

bool
contains(
    std::vector<std::string> const& v,
    std::string_view s) noexcept
{
    for(auto const& e : v)
        if(e == s)
            return true;
    return false;
}

std::string
join(
    std::vector<std::string> const& v,
    std::string_view sep)
{
    std::string s;
    for(auto const& e : v)
    {
        if(! s.empty())
            s.append(sep);
        s.append(e);
    }
    return s;
}

// Restores the request view on every exit path
class scoped_view
{
    route_params_base& p_;
    std::string path_;
    param_map params_;

public:
    explicit
    scoped_view(
        route_params_base& p)
        : p_(p)
        , path_(p.path)
        , params_(p.params)
    {
    }

    scoped_view(scoped_view const&) = delete;
    scoped_view& operator=(scoped_view const&) = delete;

    ~scoped_view()
    {
        p_.path = std::move(path_);
        p_.params = std::move(params_);
    }
};

} // (anon)

//------------------------------------------------

// Runs the hooks and handlers of one layer
struct router_base::chain
    : route_next::owner
{
    layer const& l;
    route_params_base& p;
    route_next next;
    std::size_t pos = 0;

    chain(
        layer const& l_,
        route_params_base& p_,
        route_next next_) noexcept
        : l(l_)
        , p(p_)
        , next(next_)
    {
    }

    void
    do_next(std::size_t i) override
    {
        if(i < pos)
            detail::throw_logic_error(
                "route_next invoked more than once");
        run(i);
    }

    void
    run(std::size_t i)
    {
        pos = i + 1;
        auto const nh = l.composed.size();
        if(i < nh)
        {
            auto const& h = l.composed[i];
            std::optional<std::string_view> v;
            auto pv = p.params.find(*h.first);
            if(pv && pv->has_value())
                v = **pv;
            h.second->invoke(p, v,
                route_next(*this, i + 1));
            return;
        }
        if(i - nh < l.handlers.size())
        {
            l.handlers[i - nh]->invoke(p,
                route_next(*this, i + 1));
            return;
        }
        next();
    }
};

//------------------------------------------------

// Walks the matched layers of one dispatch
struct router_base::dispatcher
    : route_next::owner
{
    struct candidate
    {
        layer const* l;
        route_match m;
    };

    impl const& im;
    route_params_base& p;
    route_next downstream;
    std::vector<candidate> cands;
    std::string path0;
    param_map params0;
    std::vector<std::string> allowed;
    std::size_t pos = 0;
    bool called = false;

    dispatcher(
        impl const& im_,
        route_params_base& p_,
        route_next downstream_) noexcept
        : im(im_)
        , p(p_)
        , downstream(downstream_)
    {
    }

    void
    do_next(std::size_t i) override
    {
        if(i < pos)
            detail::throw_logic_error(
                "route_next invoked more than once");
        step(i);
    }

    void
    step(std::size_t i)
    {
        for(; i < cands.size(); ++i)
        {
            pos = i + 1;
            auto const& c = cands[i];
            auto const& l = *c.l;
            if(! l.prefix &&
                ! l.allows(p.verb) &&
                ! (p.verb == "HEAD" && l.allows("GET")))
            {
                for(auto const& m : l.methods)
                    add_unique(allowed, m);
                continue;
            }

            called = true;
            scoped_view sv(p);
            p.path = c.m.path;
            if(im.opt & opt_merge_params)
            {
                param_map pm = params0;
                pm.merge(c.m.params);
                p.params = std::move(pm);
            }
            else
            {
                p.params = c.m.params;
            }
            if(im.log)
                im.log->trace("enter {} {} as {}",
                    l.match.source(), p.verb, p.path);
            chain(l, p, route_next(*this, i + 1)).run(0);
            return;
        }
        finish();
    }

    void
    finish()
    {
        pos = cands.size() + 1;
        scoped_view sv(p);
        p.path = path0;
        p.params = params0;

        if(downstream)
            downstream();

        if(called || p.has_explicit_status())
            return;

        unsigned code;
        if(p.verb == "OPTIONS")
            code = 204;
        else if(contains(im.accepted, p.verb))
            code = 405;
        else
            code = 501;
        p.set_status(code);
        if(code != 501)
            p.set_header("Allow", join(allowed, ", "));
        if(im.log)
            im.log->trace("respond {} {} with {}",
                p.verb, p.path, code);
    }
};

//------------------------------------------------

router_base::
router_base(
    opt_flags opt,
    std::shared_ptr<spdlog::logger> log)
    : impl_(std::make_shared<impl>(
        opt, std::move(log)))
{
}

std::size_t
router_base::
add_impl(
    std::string_view name,
    path_pattern const& pattern,
    std::vector<std::string> const& methods,
    bool prefix,
    handlers hn)
{
    if(! impl_)
        detail::throw_logic_error(
            "empty router");
    if( ! pattern.is_regex() &&
        pattern.str().empty())
        detail::throw_invalid_argument(
            "empty route pattern");

    std::vector<std::string> verbs;
    verbs.reserve(methods.size());
    for(auto const& m : methods)
    {
        if(m.empty())
            detail::throw_invalid_argument(
                "empty method");
        std::string s(m);
        for(auto& c : s)
            c = grammar::to_upper(c);
        add_unique(verbs, s);
    }
    if(verbs.empty())
        prefix = true;

    for(std::size_t i = 0; i < hn.n; ++i)
    {
        if(! hn.p[i]->empty())
            continue;
        detail::throw_system_error(
            error::bad_handler,
            (prefix ? std::string("MOUNT") : join(verbs, ",")) +
            " `" + std::string(name.empty() ?
                pattern.str() : name) +
            "`: `middleware` must be a function or router, "
            "not an empty `" + hn.p[i]->type_name() + "`");
    }

    auto& im = *impl_;
    im.layers.emplace_back(
        name, pattern, std::move(verbs), prefix, im.opt);
    auto& l = im.layers.back();
    l.handlers.reserve(hn.n);
    for(std::size_t i = 0; i < hn.n; ++i)
        l.handlers.push_back(std::move(hn.p[i]));
    for(auto const& h : im.hooks)
        l.set_hook(h.first, h.second);
    for(auto const& m : l.methods)
        add_unique(im.accepted, m);

    if(im.log)
        im.log->trace("defined route {} {}",
            join(l.methods, ","), l.match.source());
    return im.layers.size() - 1;
}

void
router_base::
param_impl(
    std::string_view name,
    hook_ptr hook)
{
    if(! impl_)
        detail::throw_logic_error(
            "empty router");
    auto& im = *impl_;
    bool found = false;
    for(auto& h : im.hooks)
    {
        if(h.first == name)
        {
            h.second = hook;
            found = true;
            break;
        }
    }
    if(! found)
        im.hooks.emplace_back(std::string(name), hook);
    for(auto& l : im.layers)
        l.set_hook(name, hook);
}

void
router_base::
param_impl(
    std::size_t idx,
    std::string_view name,
    hook_ptr hook)
{
    impl_->layers.at(idx).set_hook(
        name, std::move(hook));
}

std::size_t
router_base::
size_impl() const noexcept
{
    return impl_ ? impl_->layers.size() : 0;
}

std::optional<std::size_t>
router_base::
find_impl(
    std::string_view name) const noexcept
{
    if(! impl_ || name.empty())
        return std::nullopt;
    auto const& v = impl_->layers;
    for(std::size_t i = 0; i < v.size(); ++i)
        if(v[i].name == name)
            return i;
    return std::nullopt;
}

std::vector<std::string> const&
router_base::
accepted_impl() const noexcept
{
    return impl_->accepted;
}

std::string_view
router_base::
name_impl(std::size_t idx) const noexcept
{
    BOOST_ASSERT(idx < impl_->layers.size());
    return impl_->layers[idx].name;
}

std::string_view
router_base::
pattern_impl(std::size_t idx) const noexcept
{
    BOOST_ASSERT(idx < impl_->layers.size());
    return impl_->layers[idx].match.source();
}

std::vector<std::string> const&
router_base::
methods_impl(std::size_t idx) const noexcept
{
    BOOST_ASSERT(idx < impl_->layers.size());
    return impl_->layers[idx].methods;
}

bool
router_base::
is_prefix_impl(std::size_t idx) const noexcept
{
    BOOST_ASSERT(idx < impl_->layers.size());
    return impl_->layers[idx].prefix;
}

std::optional<route_match>
router_base::
match_impl(
    std::size_t idx,
    std::string_view path) const
{
    BOOST_ASSERT(idx < impl_->layers.size());
    return impl_->layers[idx].match(path);
}

system::result<std::string>
router_base::
url_impl(
    std::size_t idx,
    param_map const& params) const
{
    return impl_->layers[idx].match.url(params);
}

system::result<std::string>
router_base::
url_impl(
    std::size_t idx,
    std::vector<std::string> const& args) const
{
    return impl_->layers[idx].match.url(args);
}

void
router_base::
dispatch_impl(
    route_params_base& p,
    route_next downstream) const
{
    if(! impl_)
        detail::throw_logic_error(
            "empty router");
    auto const& im = *impl_;
    if(im.log)
    {
        im.log->trace("routing {} {}", p.verb, p.path);
        im.log->trace("matching {}", p.path);
    }

    dispatcher d(im, p, downstream);
    for(auto const& l : im.layers)
    {
        if(im.log)
            im.log->trace("test {} {}",
                l.match.source(), l.match.expression());
        auto m = l.match(p.path);
        if(! m)
            continue;
        if(im.log)
            im.log->trace("match {} {}",
                l.match.source(), l.match.expression());
        d.cands.push_back({ &l, std::move(*m) });
    }

    if(d.cands.empty())
    {
        if(downstream)
            downstream();
        return;
    }

    d.path0 = p.path;
    d.params0 = p.params;
    d.step(0);
}

} // detail
} // routing
} // boost
