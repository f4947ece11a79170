#include "btsgate/Chain/ChainTypes.hpp"

#include <fmt/core.h>

#include <magic_enum/magic_enum.hpp>

namespace Btsgate
{

Chain parse_chain( std::string_view text )
{
    auto chain = magic_enum::enum_cast< Chain >( text );
    if ( !chain )
    {
        throw ValidationError( fmt::format( "Invalid chain: {}", text ) );
    }
    return *chain;
}

std::string_view chain_name( Chain chain )
{
    return magic_enum::enum_name( chain );
}

std::string_view chain_tag( Chain chain )
{
    switch ( chain )
    {
        case Chain::bitshares: return "BTS";
        case Chain::bitshares_testnet: return "TEST";
    }
    throw ValidationError( "Invalid chain" );
}

NodeEndpoint parse_node_endpoint( std::string_view url )
{
    NodeEndpoint endpoint;
    endpoint.url = std::string( url );

    std::string_view remainder;
    if ( url.starts_with( "wss://" ) )
    {
        endpoint.secure = true;
        endpoint.service = "443";
        remainder = url.substr( 6 );
    }
    else if ( url.starts_with( "ws://" ) )
    {
        endpoint.secure = false;
        endpoint.service = "80";
        remainder = url.substr( 5 );
    }
    else
    {
        throw ConfigurationError( fmt::format( "Unsupported node url scheme: {}", url ) );
    }

    auto pathStart = remainder.find( '/' );
    auto authority = remainder.substr( 0, pathStart );
    endpoint.target = pathStart == std::string_view::npos ? "/" : std::string( remainder.substr( pathStart ) );

    auto portStart = authority.rfind( ':' );
    if ( portStart != std::string_view::npos )
    {
        auto port = authority.substr( portStart + 1 );
        if ( port.empty( ) || port.find_first_not_of( "0123456789" ) != std::string_view::npos )
        {
            throw ConfigurationError( fmt::format( "Invalid port in node url: {}", url ) );
        }
        endpoint.service = std::string( port );
        authority = authority.substr( 0, portStart );
    }

    if ( authority.empty( ) )
    {
        throw ConfigurationError( fmt::format( "Missing host in node url: {}", url ) );
    }
    endpoint.host = std::string( authority );

    return endpoint;
}

ChainConfig tag_invoke( json_to_tag< ChainConfig >, simdjson::ondemand::value jsonValue )
{
    ChainConfig config;

    config.nodes = json_to_vector< std::string >( jsonValue[ "nodes" ].value( ) );
    config.historyHost = std::string( jsonValue[ "historyHost" ].get_string( ).value( ) );
    config.dataDirectory = std::string( jsonValue[ "dataDirectory" ].get_string( ).value( ) );

    return config;
}

} // namespace Btsgate
