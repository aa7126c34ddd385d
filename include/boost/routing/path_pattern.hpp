//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_ROUTING_PATH_PATTERN_HPP
#define BOOST_ROUTING_PATH_PATTERN_HPP

#include <boost/routing/detail/config.hpp>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

namespace boost {
namespace routing {

/** A path template or a regular expression

    Templates use this syntax:

    @code
    route-pattern  = *( escaped / param / group / wildcard / literal )
    escaped        = "\" CHAR
    param          = ":" ident [ constraint ] [ modifier ]
    group          = constraint [ modifier ]
    wildcard       = "*"
    constraint     = "(" 1*( %x20-7E except ")" ) ")"
    modifier       = "?" / "*" / "+"
    ident          = ALPHA *( ALPHA / DIGIT / "_" )
    @endcode

    A `/` or `.` immediately before a parameter is the
    parameter's delimiter, and becomes optional along
    with an optional parameter. Groups and wildcards are
    captured by position, starting at zero.

    A regular expression is searched for in the path as
    given, and its capture groups are reported by position.
    Routes built from a regular expression cannot generate
    URLs.

    @par Example
    @code
    path_pattern a( "/users/:id" );
    path_pattern b( "/files/:path+" );
    path_pattern c( std::regex( "^/v(\\d+)/" ), "^/v(\\d+)/" );
    @endcode
*/
class path_pattern
{
public:
    path_pattern(char const* s)
        : str_(s)
    {
    }

    path_pattern(std::string_view s)
        : str_(s)
    {
    }

    path_pattern(std::string s)
        : str_(std::move(s))
    {
    }

    /** Constructor

        @param re The expression to search for.

        @param source A description of the expression,
        used in diagnostics and by @ref str.
    */
    path_pattern(
        std::regex re,
        std::string_view source = "<regex>")
        : str_(source)
        , re_(std::move(re))
    {
    }

    /** Return true if this is a regular expression
    */
    bool
    is_regex() const noexcept
    {
        return re_.has_value();
    }

    /** Return the template, or the description of the expression
    */
    std::string_view
    str() const noexcept
    {
        return str_;
    }

    /** Return the expression, or `nullptr` for a template
    */
    std::regex const*
    regex() const noexcept
    {
        return re_ ? &*re_ : nullptr;
    }

private:
    std::string str_;
    std::optional<std::regex> re_;
};

} // routing
} // boost

#endif
