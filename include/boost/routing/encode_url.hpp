//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_ENCODE_URL_HPP
#define BOOST_ROUTING_ENCODE_URL_HPP

#include <boost/routing/detail/config.hpp>
#include <string>
#include <string_view>

namespace boost {
namespace routing {

/** Percent-encode a URL for safe use in HTTP responses.

    Encodes characters that are not safe in URLs using
    percent-encoding (e.g. space becomes %20). This is
    used for the `Location` header written by redirects.

    The following characters are NOT encoded:
    - Unreserved: A-Z a-z 0-9 - _ . ~
    - Reserved (allowed in URLs): ! # $ & ' ( ) * + , / : ; = ? @

    A percent sign which already begins a valid escape
    is kept, so encoded input is not encoded twice.

    @par Example
    @code
    std::string url = encode_url( "/path/to/file with spaces.txt" );
    // url == "/path/to/file%20with%20spaces.txt"
    @endcode

    @param url The URL to encode.

    @return A new string with unsafe characters percent-encoded.
*/
BOOST_ROUTING_DECL
std::string
encode_url(std::string_view url);

/** Percent-encode a single URL component.

    Only these characters are left as-is:

    @code
    A-Z a-z 0-9 - _ . ! ~ * ' ( )
    @endcode

    In particular `/`, `?`, `#` and `:` are encoded, so
    the result can be placed in one path segment.

    @par Example
    @code
    std::string s = encode_component( "how to node" );
    // s == "how%20to%20node"
    @endcode
*/
BOOST_ROUTING_DECL
std::string
encode_component(std::string_view s);

} // routing
} // boost

#endif
