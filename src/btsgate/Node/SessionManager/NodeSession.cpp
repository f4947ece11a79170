#include "btsgate/Node/SessionManager/NodeSession.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

namespace Btsgate
{
namespace Node
{

NodeSession::NodeSession
(
    Chain chain,
    std::string endpoint,
    std::unique_ptr< NodeConnection > connection,
    std::map< NodeApi, uint64_t > apiIds
)
    : _chain( chain )
    , _endpoint( std::move( endpoint ) )
    , _connection( std::move( connection ) )
    , _apiIds( std::move( apiIds ) )
{ }

std::optional< uint64_t > NodeSession::api_id( NodeApi api ) const
{
    auto findApi = _apiIds.find( api );
    if ( findApi == _apiIds.end( ) )
    {
        return std::nullopt;
    }
    return findApi->second;
}

boost::asio::awaitable< boost::json::value > NodeSession::do_call( uint64_t apiId, std::string method, boost::json::array params )
{
    if ( !_open )
    {
        throw ConnectivityError( fmt::format( "Session to {} is closed", _endpoint ) );
    }

    BTSGATE_LOG_TRACE( _logger ) << fmt::format( "[{}][{}] Calling {} on api {}", name( ), _endpoint, method, apiId );

    co_return co_await _connection->do_call( apiId, std::move( method ), std::move( params ) );
}

boost::asio::awaitable< void > NodeSession::do_close( )
{
    if ( !_open )
    {
        co_return;
    }
    _open = false;

    BTSGATE_LOG_DEBUG( _logger ) << fmt::format( "[{}][{}] Closing session", name( ), _endpoint );

    co_await _connection->do_close( );
}

} // namespace Node
} // namespace Btsgate
