#include "btsgate/Gateway/GatewayTypes.hpp"

#include "btsgate/Util/Logger.hpp"
#include "btsgate/Util/Utils.hpp"

#include <magic_enum/magic_enum.hpp>

#include <fmt/core.h>

namespace Btsgate
{

GatewayConfig tag_invoke( json_to_tag< GatewayConfig >, simdjson::ondemand::value jsonValue )
{
    GatewayConfig config;

    auto configObject = jsonValue.get_object( ).value( );

    if ( auto connectTimeout = configObject[ "connectTimeoutMs" ].get_uint64( ); !connectTimeout.error( ) )
    {
        config.connectTimeout = std::chrono::milliseconds( connectTimeout.value( ) );
    }
    if ( auto requestTimeout = configObject[ "requestTimeoutMs" ].get_uint64( ); !requestTimeout.error( ) )
    {
        config.requestTimeout = std::chrono::milliseconds( requestTimeout.value( ) );
    }
    if ( auto appName = configObject[ "appName" ].get_string( ); !appName.error( ) )
    {
        config.appName = std::string( appName.value( ) );
    }

    for ( auto chainField : configObject[ "chains" ].get_object( ) )
    {
        std::string_view chainKey = chainField.unescaped_key( ).value( );
        auto chain = magic_enum::enum_cast< Chain >( chainKey );
        if ( !chain )
        {
            throw ConfigurationError( fmt::format( "Unknown chain in config: {}", chainKey ) );
        }
        config.chains.insert_or_assign( *chain, json_to< ChainConfig >( chainField.value( ) ) );
    }

    return config;
}

std::map< Chain, std::vector< std::string > > GatewayConfig::endpoints( ) const
{
    std::map< Chain, std::vector< std::string > > result;
    for ( const auto & [ chain, chainConfig ] : chains )
    {
        result.emplace( chain, chainConfig.nodes );
    }
    return result;
}

std::map< Chain, std::string > GatewayConfig::history_hosts( ) const
{
    std::map< Chain, std::string > result;
    for ( const auto & [ chain, chainConfig ] : chains )
    {
        result.emplace( chain, chainConfig.historyHost );
    }
    return result;
}

std::map< Chain, std::filesystem::path > GatewayConfig::data_directories( ) const
{
    std::map< Chain, std::filesystem::path > result;
    for ( const auto & [ chain, chainConfig ] : chains )
    {
        result.emplace( chain, chainConfig.dataDirectory );
    }
    return result;
}

GatewayConfig load_gateway_config( const std::filesystem::path & configPath )
{
    GatewayConfig config;
    try
    {
        simdjson::ondemand::parser parser;
        simdjson::padded_string configBuffer = simdjson::padded_string::load( configPath.native( ) );
        simdjson::ondemand::document doc = parser.iterate( configBuffer );
        simdjson::ondemand::value jsonValue( doc );
        config = json_to< GatewayConfig >( jsonValue );
    }
    catch ( const ConfigurationError & )
    {
        throw;
    }
    catch ( const std::exception & ex )
    {
        throw ConfigurationError( fmt::format( "Error parsing config {}: {}", configPath.string( ), ex.what( ) ) );
    }

    for ( auto chain : magic_enum::enum_values< Chain >( ) )
    {
        auto findChain = config.chains.find( chain );
        if ( findChain == config.chains.end( ) )
        {
            throw ConfigurationError( fmt::format( "Missing chain in config: {}", chain_name( chain ) ) );
        }
        if ( findChain->second.nodes.empty( ) )
        {
            throw ConfigurationError( fmt::format( "No nodes configured for {}", chain_name( chain ) ) );
        }
        // Malformed node urls are rejected at startup rather than on first use.
        for ( const auto & node : findChain->second.nodes )
        {
            auto endpoint = parse_node_endpoint( node );
            BTSGATE_LOG_DEBUG_GLOBAL( )
                << fmt::format( "[GatewayConfig][{}] Node: {}:{}{}", chain_name( chain ), endpoint.host, endpoint.service, endpoint.target );
        }
    }

    return config;
}

} // namespace Btsgate
