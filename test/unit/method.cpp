//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/routing/method.hpp>

#include <boost/core/lightweight_test.hpp>
#include <stdexcept>

namespace boost {
namespace routing {

struct method_test
{
    void
    testStringToMethod()
    {
        BOOST_TEST(string_to_method("GET") == method::get);
        BOOST_TEST(string_to_method("DELETE") == method::delete_);
        BOOST_TEST(string_to_method("M-SEARCH") == method::msearch);
        BOOST_TEST(string_to_method("UNSUBSCRIBE") == method::unsubscribe);

        // case-sensitive
        BOOST_TEST(string_to_method("get") == method::unknown);
        BOOST_TEST(string_to_method("") == method::unknown);
        BOOST_TEST(string_to_method("BREW") == method::unknown);
    }

    void
    testToString()
    {
        BOOST_TEST_EQ(to_string(method::acl), "ACL");
        BOOST_TEST_EQ(to_string(method::options), "OPTIONS");
        BOOST_TEST_EQ(to_string(method::delete_), "DELETE");
        BOOST_TEST_THROWS(to_string(method::unknown),
            std::invalid_argument);
    }

    void
    testAllMethods()
    {
        auto const& v = all_methods();
        BOOST_TEST_EQ(v.size(),
            static_cast<std::size_t>(method::unsubscribe));
        BOOST_TEST_EQ(v.front(), "ACL");
        BOOST_TEST_EQ(v.back(), "UNSUBSCRIBE");
        for(auto const& s : v)
            BOOST_TEST_EQ(to_string(string_to_method(s)), s);
    }

    void
    run()
    {
        testStringToMethod();
        testToString();
        testAllMethods();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::method_test().run();
    return boost::report_errors();
}
