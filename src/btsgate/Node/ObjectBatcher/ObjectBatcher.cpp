#include "btsgate/Node/ObjectBatcher/ObjectBatcher.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>

namespace Btsgate
{
namespace Node
{

ObjectBatcher::ObjectBatcher( RpcInvoker & rpcInvoker, size_t chunkSize )
    : _rpcInvoker( rpcInvoker )
    , _chunkSize( chunkSize )
{
    if ( _chunkSize == 0 )
    {
        throw ConfigurationError( "Object chunk size must be positive" );
    }
}

boost::asio::awaitable< std::vector< boost::json::value > > ObjectBatcher::do_fetch_objects
(
    NodeSession & session,
    std::vector< std::string > ids
)
{
    auto chunkDivision = std::lldiv( ids.size( ), _chunkSize );
    auto chunkCount = chunkDivision.quot + ( chunkDivision.rem > 0 ? 1 : 0 );

    BTSGATE_LOG_DEBUG( _logger )
        << fmt::format
        (
            "[{}][{}] Batching get_objects of count: {}, into chunks: {}",
            name( ),
            session.endpoint( ),
            ids.size( ),
            chunkCount
        );

    std::vector< boost::json::value > objects;
    objects.reserve( ids.size( ) );

    size_t failedChunks = 0;
    for ( size_t chunkStart = 0; chunkStart < ids.size( ); chunkStart += _chunkSize )
    {
        size_t chunkEnd = std::min( chunkStart + _chunkSize, ids.size( ) );
        GetObjectsRequest chunkRequest{ .ids = std::vector< std::string >( ids.begin( ) + chunkStart, ids.begin( ) + chunkEnd ) };

        boost::json::value chunkResult;
        try
        {
            chunkResult = co_await _rpcInvoker.send_request( session, std::move( chunkRequest ) );
        }
        catch ( const ApiUnavailableError & )
        {
            // Not chunk specific, every chunk would fail the same way.
            throw;
        }
        catch ( const BtsgateError & ex )
        {
            ++failedChunks;
            BTSGATE_LOG_WARNING( _logger )
                << fmt::format( "[{}] Skipping chunk at offset {}: {}", name( ), chunkStart, ex.what( ) );
            continue;
        }

        auto * chunkObjects = chunkResult.if_array( );
        if ( chunkObjects == nullptr )
        {
            ++failedChunks;
            BTSGATE_LOG_WARNING( _logger )
                << fmt::format( "[{}] Skipping chunk at offset {}: result is not an array", name( ), chunkStart );
            continue;
        }

        for ( auto & object : *chunkObjects )
        {
            if ( !object.is_null( ) )
            {
                objects.push_back( std::move( object ) );
            }
        }
    }

    if ( objects.empty( ) )
    {
        BTSGATE_LOG_ERROR( _logger )
            << fmt::format( "[{}] No objects retrievable, requested: {}, failed chunks: {}", name( ), ids.size( ), failedChunks );
        throw RemoteCallError( "no objects retrievable" );
    }

    co_return objects;
}

} // namespace Node
} // namespace Btsgate
