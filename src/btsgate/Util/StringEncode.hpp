#pragma once

#include "btsgate/Util/Utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Conversions between binary-encoded and string-encoded data.

namespace Btsgate
{

const char HEX_MAP[ 16 ] = { '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F' };

inline std::optional< uint8_t > hex_digit_value( char character )
{
    if ( character >= '0' && character <= '9' ) return static_cast< uint8_t >( character - '0' );
    if ( character >= 'a' && character <= 'f' ) return static_cast< uint8_t >( character - 'a' + 10 );
    if ( character >= 'A' && character <= 'F' ) return static_cast< uint8_t >( character - 'A' + 10 );
    return { };
}

inline std::vector< uint8_t > dec_hex( std::string_view text )
{
    if ( text.size( ) % 2 != 0 )
    {
        throw BtsgateError( "Odd length hex string" );
    }

    std::vector< uint8_t > result( text.size( ) / 2 );
    for ( size_t i = 0; i < result.size( ); ++i )
    {
        auto high = hex_digit_value( text[ 2 * i ] );
        auto low = hex_digit_value( text[ 2 * i + 1 ] );
        if ( !high || !low )
        {
            throw BtsgateError( "Invalid hex character" );
        }
        result[ i ] = static_cast< uint8_t >( ( *high << 4 ) | *low );
    }
    return result;
}

// Characters left untouched by ECMAScript encodeURIComponent.
constexpr bool is_uri_component_unreserved( char character )
{
    if ( ( character >= 'A' && character <= 'Z' ) ||
         ( character >= 'a' && character <= 'z' ) ||
         ( character >= '0' && character <= '9' ) )
    {
        return true;
    }

    switch ( character )
    {
        case '-':
        case '_':
        case '.':
        case '!':
        case '~':
        case '*':
        case '\'':
        case '(':
        case ')':
            return true;
        default:
            return false;
    }
}

// Percent-encodes every UTF-8 byte outside the unreserved set.
inline std::string enc_uri_component( std::string_view text )
{
    std::string result;
    result.reserve( text.size( ) * 3 );
    for ( char character : text )
    {
        if ( is_uri_component_unreserved( character ) )
        {
            result.push_back( character );
            continue;
        }
        auto byte = static_cast< uint8_t >( character );
        result.push_back( '%' );
        result.push_back( HEX_MAP[ ( byte & 0xF0 ) >> 4 ] );
        result.push_back( HEX_MAP[ byte & 0x0F ] );
    }
    return result;
}

inline std::string dec_uri_component( std::string_view text )
{
    std::string result;
    result.reserve( text.size( ) );
    for ( size_t i = 0; i < text.size( ); ++i )
    {
        if ( text[ i ] != '%' )
        {
            result.push_back( text[ i ] );
            continue;
        }
        if ( i + 2 >= text.size( ) )
        {
            throw BtsgateError( "Truncated percent-encoding" );
        }
        auto high = hex_digit_value( text[ i + 1 ] );
        auto low = hex_digit_value( text[ i + 2 ] );
        if ( !high || !low )
        {
            throw BtsgateError( "Invalid percent-encoding" );
        }
        result.push_back( static_cast< char >( ( *high << 4 ) | *low ) );
        i += 2;
    }
    return result;
}

} // namespace Btsgate
