#include "btsgate/Node/EndpointRegistry/EndpointRegistry.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

namespace Btsgate
{
namespace Node
{

EndpointRegistry::EndpointRegistry( const std::map< Chain, std::vector< std::string > > & endpoints )
{
    for ( const auto & [ chain, urls ] : endpoints )
    {
        if ( urls.empty( ) )
        {
            BTSGATE_LOG_ERROR( _logger )
                << fmt::format( "[{}] No endpoints configured for chain: {}", name( ), chain_name( chain ) );
            throw ConfigurationError( fmt::format( "Empty endpoint list for chain: {}", chain_name( chain ) ) );
        }

        auto chainEndpoints = std::make_unique< ChainEndpoints >( );
        chainEndpoints->endpoints.assign( urls.begin( ), urls.end( ) );
        _chains.emplace( chain, std::move( chainEndpoints ) );
    }
}

EndpointRegistry::ChainEndpoints & EndpointRegistry::chain_endpoints( Chain chain ) const
{
    auto findChain = _chains.find( chain );
    if ( findChain == _chains.end( ) )
    {
        throw ConfigurationError( fmt::format( "No endpoints configured for chain: {}", chain_name( chain ) ) );
    }
    return *findChain->second;
}

std::string EndpointRegistry::current_endpoint( Chain chain ) const
{
    auto & chainEndpoints = chain_endpoints( chain );
    std::lock_guard< std::mutex > lock( chainEndpoints.mutex );
    return chainEndpoints.endpoints.front( );
}

std::string EndpointRegistry::rotate( Chain chain )
{
    auto & chainEndpoints = chain_endpoints( chain );
    std::lock_guard< std::mutex > lock( chainEndpoints.mutex );
    return rotate_locked( chain, chainEndpoints );
}

std::string EndpointRegistry::rotate_if_current( Chain chain, const std::string & failedUrl )
{
    auto & chainEndpoints = chain_endpoints( chain );
    std::lock_guard< std::mutex > lock( chainEndpoints.mutex );
    if ( chainEndpoints.endpoints.front( ) != failedUrl )
    {
        BTSGATE_LOG_DEBUG( _logger )
            << fmt::format( "[{}][{}] Already rotated past: {}", name( ), chain_name( chain ), failedUrl );
        return chainEndpoints.endpoints.front( );
    }
    return rotate_locked( chain, chainEndpoints );
}

std::string EndpointRegistry::rotate_locked( Chain chain, ChainEndpoints & chainEndpoints )
{
    auto & endpoints = chainEndpoints.endpoints;
    endpoints.push_back( std::move( endpoints.front( ) ) );
    endpoints.pop_front( );

    BTSGATE_LOG_INFO( _logger )
        << fmt::format( "[{}][{}] Rotated endpoints, current: {}", name( ), chain_name( chain ), endpoints.front( ) );

    return endpoints.front( );
}

std::vector< std::string > EndpointRegistry::snapshot( Chain chain ) const
{
    auto & chainEndpoints = chain_endpoints( chain );
    std::lock_guard< std::mutex > lock( chainEndpoints.mutex );
    return std::vector< std::string >( chainEndpoints.endpoints.begin( ), chainEndpoints.endpoints.end( ) );
}

} // namespace Node
} // namespace Btsgate
