//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/routing/encode_url.hpp>

namespace boost {
namespace routing {

namespace {

bool
is_unreserved( char c ) noexcept
{
    return
        ( c >= 'A' && c <= 'Z' ) ||
        ( c >= 'a' && c <= 'z' ) ||
        ( c >= '0' && c <= '9' ) ||
        c == '-' || c == '_' || c == '.' || c == '~';
}

// Unreserved + reserved chars that are allowed in URLs
bool
is_url_safe( char c ) noexcept
{
    if( is_unreserved( c ) )
        return true;

    // Reserved chars allowed in URLs: ! # $ & ' ( ) * + , / : ; = ? @
    switch( c )
    {
    case '!':
    case '#':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case '/':
    case ':':
    case ';':
    case '=':
    case '?':
    case '@':
        return true;
    default:
        return false;
    }
}

bool
is_component_safe( char c ) noexcept
{
    if( is_unreserved( c ) )
        return true;

    switch( c )
    {
    case '!':
    case '\'':
    case '(':
    case ')':
    case '*':
        return true;
    default:
        return false;
    }
}

bool
is_hex( char c ) noexcept
{
    return
        ( c >= '0' && c <= '9' ) ||
        ( c >= 'A' && c <= 'F' ) ||
        ( c >= 'a' && c <= 'f' );
}

constexpr char hex_chars[] = "0123456789ABCDEF";

// when keep_escapes is set, a valid "%XX"
// is copied through unchanged
template< class Pred >
std::string
encode(
    std::string_view s,
    Pred safe,
    bool keep_escapes )
{
    std::string result;
    result.reserve( s.size() );

    for( std::size_t i = 0; i < s.size(); ++i )
    {
        auto const c = static_cast<unsigned char>( s[i] );
        if( safe( static_cast<char>( c ) ) )
        {
            result.push_back( static_cast<char>( c ) );
        }
        else if(
            keep_escapes && c == '%' &&
            i + 2 < s.size() &&
            is_hex( s[i + 1] ) && is_hex( s[i + 2] ) )
        {
            result.push_back( '%' );
        }
        else
        {
            result.push_back( '%' );
            result.push_back( hex_chars[c >> 4] );
            result.push_back( hex_chars[c & 0x0F] );
        }
    }

    return result;
}

} // (anon)

std::string
encode_url( std::string_view url )
{
    return encode( url, is_url_safe, true );
}

std::string
encode_component( std::string_view s )
{
    return encode( s, is_component_safe, false );
}

} // routing
} // boost
