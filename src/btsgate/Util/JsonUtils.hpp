#pragma once

#include "btsgate/Util/Utils.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/string.hpp>
#include <boost/json/value.hpp>

#include <simdjson.h>

#include <string>
#include <string_view>
#include <vector>

namespace Btsgate
{

// Customization point for deserializing node responses and config documents.
// See: boost::json::value_to
template< class T >
struct json_to_tag
{ };

template< class T >
T json_to( simdjson::ondemand::value value )
{
    static_assert( !std::is_reference_v< T > );

    return tag_invoke( json_to_tag< typename std::remove_cv_t< T > >( ), std::move( value ) );
}

// Node results are passed through to callers untouched, re-materialize the raw token as a boost::json::value.
inline boost::json::value tag_invoke( json_to_tag< boost::json::value >, simdjson::ondemand::value jsonValue )
{
    std::string_view rawJson = simdjson::to_json_string( jsonValue ).value( );
    return boost::json::parse( rawJson );
}

inline std::string tag_invoke( json_to_tag< std::string >, simdjson::ondemand::value jsonValue )
{
    return std::string( jsonValue.get_string( ).value( ) );
}

inline std::string_view as_string_view( const boost::json::string & jsonString )
{
    return std::string_view( jsonString.data( ), jsonString.size( ) );
}

template< class T >
std::vector< T > json_to_vector( simdjson::ondemand::value jsonValue )
{
    std::vector< T > result;
    for ( simdjson::ondemand::value element : jsonValue.get_array( ) )
    {
        result.push_back( json_to< T >( element ) );
    }
    return result;
}

} // namespace Btsgate
