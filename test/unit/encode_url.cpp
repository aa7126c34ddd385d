//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/routing/encode_url.hpp>

#include <boost/core/lightweight_test.hpp>

namespace boost {
namespace routing {

struct encode_url_test
{
    void
    testEncodeUrl()
    {
        BOOST_TEST_EQ(encode_url(""), "");
        BOOST_TEST_EQ(encode_url("/path/to/file"), "/path/to/file");
        BOOST_TEST_EQ(
            encode_url("/path/to/file with spaces.txt"),
            "/path/to/file%20with%20spaces.txt");
        BOOST_TEST_EQ(
            encode_url("/search?q=a&b=c#top"),
            "/search?q=a&b=c#top");
        BOOST_TEST_EQ(encode_url("/a\"b<c>"), "/a%22b%3Cc%3E");

        // existing escapes are kept
        BOOST_TEST_EQ(encode_url("/a%20b"), "/a%20b");
        BOOST_TEST_EQ(encode_url("/100%"), "/100%25");
        BOOST_TEST_EQ(encode_url("/%zz"), "/%25zz");

        // utf-8
        BOOST_TEST_EQ(encode_url("/caf\xc3\xa9"), "/caf%C3%A9");
    }

    void
    testEncodeComponent()
    {
        BOOST_TEST_EQ(encode_component("how to node"), "how%20to%20node");
        BOOST_TEST_EQ(encode_component("a/b"), "a%2Fb");
        BOOST_TEST_EQ(encode_component("a?b#c"), "a%3Fb%23c");
        BOOST_TEST_EQ(encode_component("-_.!~*'()"), "-_.!~*'()");
        BOOST_TEST_EQ(encode_component("50%"), "50%25");
        BOOST_TEST_EQ(encode_component("a%20b"), "a%2520b");
    }

    void
    run()
    {
        testEncodeUrl();
        testEncodeComponent();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::encode_url_test().run();
    return boost::report_errors();
}
