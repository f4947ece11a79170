#include "btsgate/Query/PortfolioComposer/PortfolioComposer.hpp"

#include "btsgate/Query/ChainQuery/ChainQuery.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

namespace Btsgate
{
namespace Query
{

PortfolioComposer::PortfolioComposer( Node::SessionManager & sessionManager, Node::RpcInvoker & rpcInvoker )
    : _sessionManager( sessionManager )
    , _rpcInvoker( rpcInvoker )
{ }

boost::asio::awaitable< boost::json::object > PortfolioComposer::do_portfolio( Chain chain, std::string accountId )
{
    validate_not_empty( accountId, "account id" );

    co_return co_await _sessionManager.do_with_session< boost::json::object >
    (
        chain,
        [ this, &accountId ]( Node::NodeSession & session ) -> boost::asio::awaitable< boost::json::object >
        {
            auto balances = co_await _rpcInvoker.send_request
            (
                session,
                Node::GetAccountBalancesRequest{ .accountId = accountId, .assetIds = { } }
            );
            if ( balances.is_null( ) )
            {
                throw RemoteCallError( fmt::format( "Account balances not found: {}", accountId ) );
            }

            auto limitOrders = co_await _rpcInvoker.send_request
            (
                session,
                Node::GetLimitOrdersByAccountRequest{ .accountId = accountId, .limit = LIMIT_ORDER_COUNT }
            );
            if ( limitOrders.is_null( ) )
            {
                throw RemoteCallError( fmt::format( "Account limit orders not found: {}", accountId ) );
            }

            BTSGATE_LOG_DEBUG( _logger )
                << fmt::format( "[{}][{}] Composed portfolio of {}", name( ), session.endpoint( ), accountId );

            boost::json::object portfolio;
            portfolio.emplace( "balances", std::move( balances ) );
            portfolio.emplace( "limitOrders", std::move( limitOrders ) );
            co_return portfolio;
        }
    );
}

} // namespace Query
} // namespace Btsgate
