//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/routing/router.hpp>

#include <boost/core/lightweight_test.hpp>
#include <regex>
#include <stdexcept>

namespace boost {
namespace routing {

struct route_test
{
    using route = router::fluent_route;

    static void h(route_params&, route_next) {}

    static
    param_map
    params(route const& rt, std::string_view path)
    {
        auto m = rt.match(path);
        if(! BOOST_TEST(m.has_value()))
            return {};
        return m->params;
    }

    static
    std::string
    rest(route const& rt, std::string_view path)
    {
        auto m = rt.match(path);
        if(! BOOST_TEST(m.has_value()))
            return {};
        return m->path;
    }

    static
    void
    no_match(route const& rt, std::string_view path)
    {
        BOOST_TEST(! rt.match(path).has_value());
    }

    template<class F>
    static
    void
    check_error(error ev, F const& f)
    {
        try
        {
            f();
            BOOST_TEST(false);
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == ev);
        }
    }

    void
    testProperties()
    {
        router r;
        auto rt = r.add("item", "/items/:id",
            { "get", "Post", "GET" }, h);
        BOOST_TEST_EQ(rt.name(), "item");
        BOOST_TEST_EQ(rt.pattern(), "/items/:id");
        BOOST_TEST_EQ(rt.methods().size(), 2u);
        BOOST_TEST_EQ(rt.methods()[0], "GET");
        BOOST_TEST_EQ(rt.methods()[1], "POST");
        BOOST_TEST(! rt.is_prefix());
        BOOST_TEST_EQ(rt.index(), 0u);

        auto mt = r.mount("/api", h);
        BOOST_TEST(mt.is_prefix());
        BOOST_TEST(mt.methods().empty());
        BOOST_TEST(mt.name().empty());
        BOOST_TEST_EQ(mt.index(), 1u);

        // no methods means a prefix route
        auto pt = r.add("/p", {}, h);
        BOOST_TEST(pt.is_prefix());

        BOOST_TEST_THROWS(r.add("/q", { "" }, h),
            std::invalid_argument);
        BOOST_TEST_THROWS(r.get("", h),
            std::invalid_argument);
    }

    void
    testMatch()
    {
        router r;
        auto rt = r.get("/users/:id", h);
        auto pm = params(rt, "/users/42");
        BOOST_TEST_EQ(*pm.at("id"), "42");
        BOOST_TEST_EQ(rest(rt, "/users/42"), "/");

        // trailing slash and case are tolerated
        BOOST_TEST_EQ(*params(rt, "/users/42/").at("id"), "42");
        BOOST_TEST_EQ(*params(rt, "/USERS/42").at("id"), "42");

        no_match(rt, "/users");
        no_match(rt, "/users/");
        no_match(rt, "/users/42/x");
        no_match(rt, "/users/42//");
        no_match(rt, "/people/42");
    }

    void
    testModifiers()
    {
        router r;
        {
            auto rt = r.get("/posts/:id?", h);
            auto pm = params(rt, "/posts");
            BOOST_TEST(pm.contains("id"));
            BOOST_TEST(! pm.at("id").has_value());
            BOOST_TEST_EQ(*params(rt, "/posts/7").at("id"), "7");
            no_match(rt, "/posts/7/8");
        }
        {
            auto rt = r.get("/files/:path+", h);
            BOOST_TEST_EQ(*params(rt, "/files/a/b/c").at("path"), "a/b/c");
            no_match(rt, "/files");
        }
        {
            auto rt = r.get("/docs/:path*", h);
            BOOST_TEST(! params(rt, "/docs").at("path").has_value());
            BOOST_TEST_EQ(*params(rt, "/docs/a/b").at("path"), "a/b");
        }
        {
            auto rt = r.get("/n/:id(\\d+)", h);
            BOOST_TEST_EQ(*params(rt, "/n/123").at("id"), "123");
            no_match(rt, "/n/abc");
        }
        {
            auto rt = r.get("/f/:name.:ext", h);
            auto pm = params(rt, "/f/report.pdf");
            BOOST_TEST_EQ(*pm.at("name"), "report");
            BOOST_TEST_EQ(*pm.at("ext"), "pdf");
        }
        {
            auto rt = r.get("/w/*", h);
            BOOST_TEST_EQ(*params(rt, "/w/x/y").at("0"), "x/y");
        }
        {
            auto rt = r.get("/g/(\\d+)/:name", h);
            auto pm = params(rt, "/g/5/bob");
            BOOST_TEST_EQ(*pm.at("0"), "5");
            BOOST_TEST_EQ(*pm.at("name"), "bob");
        }
    }

    void
    testDecoding()
    {
        router r;
        auto rt = r.get("/t/:title", h);
        BOOST_TEST_EQ(*params(rt, "/t/how%20to%20node").at("title"),
            "how to node");
        BOOST_TEST_EQ(*params(rt, "/t/a%2Fb").at("title"), "a/b");
        BOOST_TEST_EQ(*params(rt, "/t/caf%C3%A9").at("title"),
            "caf\xc3\xa9");

        // malformed input keeps the raw text
        BOOST_TEST_EQ(*params(rt, "/t/%E0%A4%A").at("title"),
            "%E0%A4%A");
        BOOST_TEST_EQ(*params(rt, "/t/%FF").at("title"), "%FF");
    }

    void
    testRegex()
    {
        router r;
        auto rt = r.get(path_pattern(
            std::regex("^/v(\\d+)/(beta)?"), "api"), h);
        BOOST_TEST_EQ(rt.pattern(), "api");
        auto m = rt.match("/v2/items");
        if(BOOST_TEST(m.has_value()))
        {
            BOOST_TEST_EQ(*m->params.at("0"), "2");
            BOOST_TEST(m->params.contains("1"));
            BOOST_TEST(! m->params.at("1").has_value());
            BOOST_TEST_EQ(m->path, "/items");
        }
        m = rt.match("/v3/beta");
        if(BOOST_TEST(m.has_value()))
            BOOST_TEST_EQ(*m->params.at("1"), "beta");
        no_match(rt, "/x/v2/");

        auto u = rt.url();
        BOOST_TEST(u.has_error());
        BOOST_TEST(u.error() == error::not_a_template);
    }

    void
    testPrefix()
    {
        router r;
        auto rt = r.mount("/api", h);
        BOOST_TEST_EQ(rest(rt, "/api"), "/");
        BOOST_TEST_EQ(rest(rt, "/api/"), "/");
        BOOST_TEST_EQ(rest(rt, "/api/v0"), "/v0");
        BOOST_TEST_EQ(rest(rt, "/API/v0/x"), "/v0/x");
        no_match(rt, "/apiary");
        no_match(rt, "/");

        auto rs = r.mount("/api/", h);
        no_match(rs, "/api");
        BOOST_TEST_EQ(rest(rs, "/api/v0"), "/v0");

        auto rp = r.mount("/first/:id", h);
        BOOST_TEST_EQ(rest(rp, "/first/second/third"), "/third");
        BOOST_TEST_EQ(*params(rp, "/first/second/third").at("id"),
            "second");

        auto root = r.use(h);
        BOOST_TEST_EQ(root.pattern(), "/");
        BOOST_TEST_EQ(rest(root, "/"), "/");
        BOOST_TEST_EQ(rest(root, "/a/b"), "/a/b");
    }

    void
    testOptions()
    {
        {
            router r(router_options().strict(true));
            auto rt = r.get("/api", h);
            BOOST_TEST(rt.match("/api").has_value());
            no_match(rt, "/api/");
            auto rs = r.get("/api/", h);
            BOOST_TEST(rs.match("/api/").has_value());
            no_match(rs, "/api");
        }
        {
            router r(router_options().case_sensitive(true));
            auto rt = r.get("/Api", h);
            BOOST_TEST(rt.match("/Api").has_value());
            no_match(rt, "/api");
        }
    }

    void
    testBadPattern()
    {
        router r;
        check_error(error::bad_pattern,
            [&]{ r.get("/:id(", h); });
        check_error(error::bad_pattern,
            [&]{ r.get("/:id()", h); });
        check_error(error::bad_pattern,
            [&]{ r.get("/:id([)", h); });
        check_error(error::bad_pattern,
            [&]{ r.mount("/x\\", h); });
        BOOST_TEST_EQ(r.size(), 0u);
    }

    void
    testUrl()
    {
        router r;
        auto rt = r.get("books", "/:category/:title", h);
        auto u = rt.url({
            { "category", "programming" },
            { "title", "how to node" } });
        if(BOOST_TEST(u.has_value()))
            BOOST_TEST_EQ(*u, "/programming/how%20to%20node");

        u = rt.url("programming", "how to node");
        if(BOOST_TEST(u.has_value()))
            BOOST_TEST_EQ(*u, "/programming/how%20to%20node");

        u = rt.url({ { "category", "programming" } });
        BOOST_TEST(u.has_error());
        BOOST_TEST(u.error() == error::missing_parameter);

        // optional parameters may be omitted
        auto ro = r.get("/p/:a/:b?", h);
        u = ro.url({ { "a", "x" } });
        if(BOOST_TEST(u.has_value()))
            BOOST_TEST_EQ(*u, "/p/x");
        u = ro.url("x", 2);
        if(BOOST_TEST(u.has_value()))
            BOOST_TEST_EQ(*u, "/p/x/2");

        // each segment is encoded on its own
        auto rf = r.get("/files/:path+", h);
        u = rf.url({ { "path", "a b/c?d" } });
        if(BOOST_TEST(u.has_value()))
            BOOST_TEST_EQ(*u, "/files/a%20b/c%3Fd");

        auto rw = r.get("/w/*", h);
        u = rw.url("x/y");
        if(BOOST_TEST(u.has_value()))
            BOOST_TEST_EQ(*u, "/w/x/y");
    }

    void
    run()
    {
        testProperties();
        testMatch();
        testModifiers();
        testDecoding();
        testRegex();
        testPrefix();
        testOptions();
        testBadPattern();
        testUrl();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::route_test().run();
    return boost::report_errors();
}
