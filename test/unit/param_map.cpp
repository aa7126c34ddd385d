//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/routing/param_map.hpp>

#include <boost/core/lightweight_test.hpp>
#include <stdexcept>

namespace boost {
namespace routing {

struct param_map_test
{
    void
    testSet()
    {
        param_map pm;
        BOOST_TEST(pm.empty());
        pm.set("id", std::string("42"));
        pm.set("page", std::nullopt);
        BOOST_TEST_EQ(pm.size(), 2u);
        BOOST_TEST(pm.contains("id"));
        BOOST_TEST(pm.contains("page"));
        BOOST_TEST(! pm.contains("title"));
        BOOST_TEST_EQ(*pm.at("id"), "42");
        BOOST_TEST(! pm.at("page").has_value());
        BOOST_TEST(pm.find("title") == nullptr);
        BOOST_TEST_THROWS(pm.at("title"), std::out_of_range);

        // replace keeps the position
        pm.set("id", std::string("7"));
        BOOST_TEST_EQ(pm.size(), 2u);
        BOOST_TEST_EQ(pm.begin()->first, "id");
        BOOST_TEST_EQ(*pm.at("id"), "7");

        pm.clear();
        BOOST_TEST(pm.empty());
    }

    void
    testIndex()
    {
        param_map pm;
        pm.set("0", std::string("a"));
        pm.set("1", std::nullopt);
        BOOST_TEST(pm.find(0) != nullptr);
        BOOST_TEST_EQ(**pm.find(0), "a");
        BOOST_TEST(! pm.find(1)->has_value());
        BOOST_TEST(pm.find(2) == nullptr);
    }

    void
    testMerge()
    {
        param_map a{ { "user", "alice" }, { "id", "1" } };
        param_map b{ { "id", "2" }, { "tab", "posts" } };
        a.merge(b);
        BOOST_TEST_EQ(a.size(), 3u);
        BOOST_TEST_EQ(*a.at("user"), "alice");
        BOOST_TEST_EQ(*a.at("id"), "2");
        BOOST_TEST_EQ(*a.at("tab"), "posts");
    }

    void
    testEquality()
    {
        param_map a{ { "x", "1" }, { "y", "2" } };
        param_map b{ { "y", "2" }, { "x", "1" } };
        BOOST_TEST(a == b);
        b.set("y", std::nullopt);
        BOOST_TEST(! (a == b));
        BOOST_TEST(! (a == param_map{ { "x", "1" } }));
    }

    void
    run()
    {
        testSet();
        testIndex();
        testMerge();
        testEquality();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::param_map_test().run();
    return boost::report_errors();
}
