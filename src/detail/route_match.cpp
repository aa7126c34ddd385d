//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/route_match.hpp"
#include "src/detail/pct_decode.hpp"
#include <boost/routing/detail/except.hpp>
#include <boost/routing/encode_url.hpp>
#include <boost/routing/error.hpp>
#include <boost/assert.hpp>

/*

pattern     end    strict   expression
-------------------------------------------------------------
/api        true   false    ^/api(?:/(?=$))?$
/api        true   true     ^/api$
/api/       true   true     ^/api/$
/api        false  true     ^/api(?=/|$)
/api/       false  true     ^/api/
/:id        true   false    ^/((?:[^/]+?))(?:/(?=$))?$
/:id?       true   true     ^(?:/((?:[^/]+?)))?$
/:p+        true   true     ^/((?:[^/]+?)(?:/(?:[^/]+?))*)$
/:f.:x      true   true     ^/((?:[^/]+?))\.((?:[^.]+?))$
/*          true   true     ^/((?:.*))$

*/

namespace boost {
namespace routing {
namespace detail {

namespace {

void
append_escaped(
    std::string& s,
    core::string_view text)
{
    for(char c : text)
    {
        switch(c)
        {
        case '.': case '+': case '*': case '?':
        case '^': case '$': case '{': case '}':
        case '(': case ')': case '[': case ']':
        case '|': case '\\':
            s.push_back('\\');
            break;
        default:
            break;
        }
        s.push_back(c);
    }
}

std::string
to_expression(
    std::vector<route_token> const& tokens,
    bool end,
    bool strict)
{
    std::string s;
    for(auto const& t : tokens)
    {
        if(! t.is_capture())
        {
            append_escaped(s, t.text);
            continue;
        }
        std::string prefix;
        if(t.prefix)
            append_escaped(prefix,
                core::string_view(&t.prefix, 1));
        std::string capture = "(?:";
        if(! t.constraint.empty())
            capture.append(
                t.constraint.data(),
                t.constraint.size());
        else if(t.kind == route_token::wildcard)
            capture.append(".*");
        else if(t.prefix == '.')
            capture.append("[^.]+?");
        else
            capture.append("[^/]+?");
        capture.push_back(')');
        if(t.repeat())
            capture += "(?:" + prefix + capture + ")*";
        if(! t.optional())
            s += prefix + "(" + capture + ")";
        else if(t.partial)
            s += prefix + "(" + capture + ")?";
        else
            s += "(?:" + prefix + "(" + capture + "))?";
    }
    bool const slashed =
        ! s.empty() && s.back() == '/';
    if(! strict)
    {
        if(slashed)
            s.pop_back();
        s += "(?:/(?=$))?";
    }
    if(end)
        s += "$";
    else if(! (strict && slashed))
        s += "(?=/|$)";
    return "^" + s;
}

} // (anon)

router_base::
matcher::
matcher(
    path_pattern const& pat,
    bool end,
    bool strict,
    bool case_sensitive)
    : source_(std::make_unique<std::string const>(pat.str()))
    , template_(! pat.is_regex())
{
    if(! template_)
    {
        re_ = *pat.regex();
        expr_ = std::string(source());
        for(std::size_t i = 0; i < re_.mark_count(); ++i)
            keys_.push_back(std::to_string(i));
        return;
    }

    auto rv = grammar::parse(
        core::string_view(
            source_->data(), source_->size()),
        pattern_rule);
    if(rv.has_error())
        detail::throw_system_error(
            error::bad_pattern,
            "bad route pattern `" +
                std::string(source()) + "`: " +
                rv.error().message());
    tokens_ = std::move(*rv);

    std::size_t pos = 0;
    for(auto const& t : tokens_)
    {
        if(! t.is_capture())
            continue;
        if(t.name.empty())
            keys_.push_back(std::to_string(pos++));
        else
            keys_.emplace_back(
                t.name.data(), t.name.size());
    }

    expr_ = to_expression(tokens_, end, strict);
    auto flags = std::regex::ECMAScript;
    if(! case_sensitive)
        flags |= std::regex::icase;
    try
    {
        re_.assign(expr_, flags);
    }
    catch(std::regex_error const& e)
    {
        detail::throw_system_error(
            error::bad_pattern,
            "bad route pattern `" +
                std::string(source()) + "`: " +
                e.what());
    }
}

std::optional<route_match>
router_base::
matcher::
operator()(std::string_view path) const
{
    std::cmatch m;
    if(! std::regex_search(
            path.data(),
            path.data() + path.size(),
            m, re_))
        return std::nullopt;

    BOOST_ASSERT(! template_ ||
        m.size() == keys_.size() + 1);
    route_match rm;
    for(std::size_t i = 1; i < m.size(); ++i)
    {
        if(i > keys_.size())
            break;
        std::optional<std::string> v;
        if(m[i].matched)
            v = pct_decode(core::string_view(
                m[i].first, m[i].length()));
        rm.params.set(keys_[i - 1], std::move(v));
    }

    rm.path.assign(m.suffix().first, m.suffix().second);
    if( rm.path.empty() ||
        rm.path.front() != '/')
        rm.path.insert(rm.path.begin(), '/');
    return rm;
}

system::result<std::string>
router_base::
matcher::
url(param_map const& params) const
{
    if(! template_)
        BOOST_ROUTING_RETURN_EC(
            error::not_a_template);

    std::string s;
    std::size_t pos = 0;
    for(auto const& t : tokens_)
    {
        if(! t.is_capture())
        {
            s.append(t.text.data(), t.text.size());
            continue;
        }
        BOOST_ASSERT(pos < keys_.size());
        auto v = params.find(keys_[pos++]);
        if(! v || ! v->has_value())
        {
            if(! t.optional())
                BOOST_ROUTING_RETURN_EC(
                    error::missing_parameter);
            if(t.partial)
                s.push_back(t.prefix);
            continue;
        }
        if(t.prefix)
            s.push_back(t.prefix);
        s.append(**v);
    }

    // encode each segment on its own
    std::string out;
    out.reserve(s.size());
    std::string_view rest = s;
    for(;;)
    {
        auto const n = rest.find('/');
        out.append(encode_component(rest.substr(0, n)));
        if(n == std::string_view::npos)
            break;
        out.push_back('/');
        rest.remove_prefix(n + 1);
    }
    return out;
}

system::result<std::string>
router_base::
matcher::
url(std::vector<std::string> const& args) const
{
    param_map params;
    for(std::size_t i = 0;
        i < args.size() && i < keys_.size(); ++i)
        params.set(keys_[i], args[i]);
    return url(params);
}

} // detail
} // routing
} // boost
