//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/routing/router.hpp>

#include <boost/routing.hpp>
#include <boost/core/lightweight_test.hpp>
#include <stdexcept>

namespace boost {
namespace routing {

struct router_test
{
    void
    testResponse()
    {
        response res;
        BOOST_TEST_EQ(res.status, 404u);
        BOOST_TEST(! res.explicit_status);
        BOOST_TEST(! res.exists("Allow"));
        BOOST_TEST_THROWS(res.at("Allow"), std::out_of_range);

        res.set("Content-Type", "text/plain");
        res.set("content-type", "text/html");
        BOOST_TEST_EQ(res.fields.size(), 1u);
        BOOST_TEST_EQ(res.at("CONTENT-TYPE"), "text/html");

        res.set("X-A", "1");
        BOOST_TEST_EQ(res.erase("x-a"), 1u);
        BOOST_TEST_EQ(res.erase("x-a"), 0u);
        BOOST_TEST(! res.exists("X-A"));
    }

    void
    testStatus()
    {
        route_params p("GET", "/");
        BOOST_TEST(! p.has_explicit_status());
        p.status(201);
        BOOST_TEST_EQ(p.res.status, 201u);
        BOOST_TEST_EQ(p.res.reason, "Created");
        BOOST_TEST(p.has_explicit_status());

        p.set_status(405);
        BOOST_TEST_EQ(p.res.reason, "Method Not Allowed");

        p.reset();
        BOOST_TEST(p.verb.empty());
        BOOST_TEST_EQ(p.res.status, 404u);
        BOOST_TEST(! p.has_explicit_status());
    }

    void
    testSend()
    {
        {
            route_params p("GET", "/");
            p.send("hello");
            BOOST_TEST_EQ(p.res.status, 200u);
            BOOST_TEST_EQ(p.res.body, "hello");
            BOOST_TEST_EQ(p.res.at("Content-Type"),
                "text/plain; charset=utf-8");
            BOOST_TEST_EQ(p.res.at("Content-Length"), "5");
        }
        {
            route_params p("GET", "/");
            p.status(202).send("<p>ok</p>");
            BOOST_TEST_EQ(p.res.status, 202u);
            BOOST_TEST_EQ(p.res.at("Content-Type"),
                "text/html; charset=utf-8");
        }
        {
            route_params p("HEAD", "/");
            p.send("hello");
            BOOST_TEST(p.res.body.empty());
            BOOST_TEST_EQ(p.res.at("Content-Length"), "5");
        }
    }

    void
    testRedirect()
    {
        {
            route_params p("GET", "/");
            p.redirect("/a b");
            BOOST_TEST_EQ(p.res.status, 302u);
            BOOST_TEST_EQ(p.res.at("Location"), "/a%20b");
            BOOST_TEST_EQ(p.res.body, "Redirecting to /a b.");
        }
        {
            route_params p("GET", "/");
            p.status(301).redirect("/b");
            BOOST_TEST_EQ(p.res.status, 301u);
        }
    }

    void
    testDispatch()
    {
        router r;
        r.get("/hello/:name",
            [](route_params& p, route_next)
            {
                p.send("Hello, " + *p.params.at("name"));
            });
        r.get("/",
            [](route_params& p, route_next)
            {
                p.redirect("/hello/world");
            });

        route_params p("GET", "/hello/Jane%20Doe");
        r.dispatch(p);
        BOOST_TEST_EQ(p.res.status, 200u);
        BOOST_TEST_EQ(p.res.body, "Hello, Jane Doe");

        p.reset();
        p.verb = "HEAD";
        p.path = "/hello/x";
        r.dispatch(p);
        BOOST_TEST_EQ(p.res.status, 200u);
        BOOST_TEST(p.res.body.empty());
        BOOST_TEST_EQ(p.res.at("Content-Length"), "8");

        p.reset();
        p.verb = "DELETE";
        p.path = "/hello/x";
        r.dispatch(p);
        BOOST_TEST_EQ(p.res.status, 501u);

        p.reset();
        p.verb = "POST";
        p.path = "/hello/x";
        r.post("/form", [](route_params&, route_next) {});
        r.dispatch(p);
        BOOST_TEST_EQ(p.res.status, 405u);
        BOOST_TEST_EQ(p.res.reason, "Method Not Allowed");
        BOOST_TEST_EQ(p.res.at("allow"), "GET");

        p.reset();
        p.verb = "OPTIONS";
        p.path = "/";
        r.dispatch(p);
        BOOST_TEST_EQ(p.res.status, 204u);
        BOOST_TEST_EQ(p.res.at("Allow"), "GET");

        // nothing matched, nothing changed
        p.reset();
        p.verb = "GET";
        p.path = "/missing";
        r.dispatch(p);
        BOOST_TEST_EQ(p.res.status, 404u);
        BOOST_TEST(! p.has_explicit_status());

        p.reset();
        p.verb = "GET";
        p.path = "/";
        r.dispatch(p);
        BOOST_TEST_EQ(p.res.status, 302u);
        BOOST_TEST_EQ(p.res.at("Location"), "/hello/world");
    }

    void
    run()
    {
        testResponse();
        testStatus();
        testSend();
        testRedirect();
        testDispatch();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::router_test().run();
    return boost::report_errors();
}
