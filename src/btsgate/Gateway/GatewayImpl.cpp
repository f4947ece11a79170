#include "btsgate/Gateway/GatewayImpl.hpp"

#include "btsgate/Node/NodeConnection/WebSocketNodeConnection.hpp"

#include <fmt/core.h>

namespace Btsgate
{

GatewayImpl::GatewayImpl
(
    boost::asio::io_context & ioContext,
    GatewayConfig config,
    Node::NodeConnectionFactory connectionFactory
)
    : _config( std::move( config ) )
    , _endpointRegistry( _config.endpoints( ) )
    , _sessionManager
    (
        _endpointRegistry,
        connectionFactory ? std::move( connectionFactory ) : Node::make_websocket_connection_factory( ioContext, _config.requestTimeout ),
        _config.connectTimeout
    )
    , _rpcInvoker( )
    , _objectBatcher( _rpcInvoker )
    , _chainQuery( _sessionManager, _rpcInvoker, _objectBatcher )
    , _portfolioComposer( _sessionManager, _rpcInvoker )
    , _transactionOrchestrator( _sessionManager, _rpcInvoker, _config.appName )
    , _historyClient( ioContext, _config.history_hosts( ), _config.requestTimeout )
    , _cacheStore( Cache::CacheStore::load( _config.data_directories( ) ) )
{
    BTSGATE_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] Initialized, connect timeout: {}ms, request timeout: {}ms",
            name( ),
            _config.connectTimeout.count( ),
            _config.requestTimeout.count( )
        );
}

boost::asio::awaitable< std::string > GatewayImpl::do_build_deeplink
(
    Chain chain,
    Transaction::OperationType operationType,
    std::vector< boost::json::value > operationPayloads
)
{
    co_return co_await _transactionOrchestrator.do_build_signing_request( chain, operationType, std::move( operationPayloads ) );
}

boost::asio::awaitable< boost::json::array > GatewayImpl::do_fetch_objects( Chain chain, std::vector< std::string > ids )
{
    co_return co_await _chainQuery.do_fetch_objects( chain, std::move( ids ) );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_account_lookup( Chain chain, std::string searchInput )
{
    co_return co_await _chainQuery.do_account_lookup( chain, std::move( searchInput ) );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_blocked_accounts( Chain chain )
{
    co_return co_await _chainQuery.do_blocked_accounts( chain );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_full_account( Chain chain, std::string accountId )
{
    co_return co_await _chainQuery.do_full_account( chain, std::move( accountId ) );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_account_balances( Chain chain, std::string accountId )
{
    co_return co_await _chainQuery.do_account_balances( chain, std::move( accountId ) );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_account_limit_orders( Chain chain, std::string accountId )
{
    co_return co_await _chainQuery.do_account_limit_orders( chain, std::move( accountId ) );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_order_book( Chain chain, std::string base, std::string quote )
{
    co_return co_await _chainQuery.do_order_book( chain, std::move( base ), std::move( quote ) );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_market_limit_orders( Chain chain, std::string base, std::string quote )
{
    co_return co_await _chainQuery.do_market_limit_orders( chain, std::move( base ), std::move( quote ) );
}

boost::asio::awaitable< boost::json::object > GatewayImpl::do_portfolio( Chain chain, std::string accountId )
{
    co_return co_await _portfolioComposer.do_portfolio( chain, std::move( accountId ) );
}

boost::asio::awaitable< std::optional< boost::json::value > > GatewayImpl::do_account_history
(
    Chain chain,
    std::string accountId,
    History::HistoryQuery query
)
{
    co_return co_await _historyClient.do_account_history( chain, std::move( accountId ), std::move( query ) );
}

std::vector< std::string > GatewayImpl::current_nodes( Chain chain ) const
{
    return _endpointRegistry.snapshot( chain );
}

} // namespace Btsgate
