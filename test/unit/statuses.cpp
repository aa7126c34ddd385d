//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/routing/statuses.hpp>

#include <boost/core/lightweight_test.hpp>

namespace boost {
namespace routing {

struct statuses_test
{
    void
    testIsRedirect()
    {
        BOOST_TEST(statuses::is_redirect(300));
        BOOST_TEST(statuses::is_redirect(301));
        BOOST_TEST(statuses::is_redirect(302));
        BOOST_TEST(statuses::is_redirect(303));
        BOOST_TEST(statuses::is_redirect(305));
        BOOST_TEST(statuses::is_redirect(307));
        BOOST_TEST(statuses::is_redirect(308));
        BOOST_TEST(! statuses::is_redirect(304));
        BOOST_TEST(! statuses::is_redirect(306));
        BOOST_TEST(! statuses::is_redirect(200));
    }

    void
    testReason()
    {
        BOOST_TEST_EQ(statuses::reason(200), "OK");
        BOOST_TEST_EQ(statuses::reason(204), "No Content");
        BOOST_TEST_EQ(statuses::reason(301), "Moved Permanently");
        BOOST_TEST_EQ(statuses::reason(404), "Not Found");
        BOOST_TEST_EQ(statuses::reason(405), "Method Not Allowed");
        BOOST_TEST_EQ(statuses::reason(501), "Not Implemented");
        BOOST_TEST(statuses::reason(299).empty());
        BOOST_TEST(statuses::reason(0).empty());
    }

    void
    run()
    {
        testIsRedirect();
        testReason();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::statuses_test().run();
    return boost::report_errors();
}
