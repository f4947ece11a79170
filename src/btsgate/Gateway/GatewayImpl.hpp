#pragma once

#include "btsgate/Gateway/GatewayTypes.hpp"

#include "btsgate/Cache/CacheStore/CacheStore.hpp"
#include "btsgate/History/HistoryClient/HistoryClient.hpp"
#include "btsgate/Node/EndpointRegistry/EndpointRegistry.hpp"
#include "btsgate/Node/NodeConnection/NodeConnection.hpp"
#include "btsgate/Node/ObjectBatcher/ObjectBatcher.hpp"
#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"
#include "btsgate/Node/SessionManager/SessionManager.hpp"
#include "btsgate/Query/ChainQuery/ChainQuery.hpp"
#include "btsgate/Query/PortfolioComposer/PortfolioComposer.hpp"
#include "btsgate/Transaction/OperationType.hpp"
#include "btsgate/Transaction/TransactionOrchestrator/TransactionOrchestrator.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Btsgate
{

// Wires the node, query, transaction, history and cache components for both chains.
class GatewayImpl
{
public:
    // An empty connection factory selects the websocket transport.
    GatewayImpl
    (
        boost::asio::io_context & ioContext,
        GatewayConfig config,
        Node::NodeConnectionFactory connectionFactory = { }
    );

    boost::asio::awaitable< std::string > do_build_deeplink
    (
        Chain chain,
        Transaction::OperationType operationType,
        std::vector< boost::json::value > operationPayloads
    );

    boost::asio::awaitable< boost::json::array > do_fetch_objects( Chain chain, std::vector< std::string > ids );

    boost::asio::awaitable< std::optional< boost::json::value > > do_account_lookup( Chain chain, std::string searchInput );
    boost::asio::awaitable< std::optional< boost::json::value > > do_blocked_accounts( Chain chain );
    boost::asio::awaitable< std::optional< boost::json::value > > do_full_account( Chain chain, std::string accountId );
    boost::asio::awaitable< std::optional< boost::json::value > > do_account_balances( Chain chain, std::string accountId );
    boost::asio::awaitable< std::optional< boost::json::value > > do_account_limit_orders( Chain chain, std::string accountId );
    boost::asio::awaitable< std::optional< boost::json::value > > do_order_book( Chain chain, std::string base, std::string quote );
    boost::asio::awaitable< std::optional< boost::json::value > > do_market_limit_orders( Chain chain, std::string base, std::string quote );

    boost::asio::awaitable< boost::json::object > do_portfolio( Chain chain, std::string accountId );

    boost::asio::awaitable< std::optional< boost::json::value > > do_account_history
    (
        Chain chain,
        std::string accountId,
        History::HistoryQuery query
    );

    std::vector< std::string > current_nodes( Chain chain ) const;

    const Cache::CacheStore & cache( ) const & { return _cacheStore; }

    constexpr std::string_view name( ) const & { return "Gateway"; }

private:
    GatewayConfig _config;

    Node::EndpointRegistry _endpointRegistry;
    Node::SessionManager _sessionManager;
    Node::RpcInvoker _rpcInvoker;
    Node::ObjectBatcher _objectBatcher;

    Query::ChainQuery _chainQuery;
    Query::PortfolioComposer _portfolioComposer;
    Transaction::TransactionOrchestrator _transactionOrchestrator;

    History::HistoryClient _historyClient;
    Cache::CacheStore _cacheStore;

    mutable BtsgateLogger _logger;
};

} // namespace Btsgate
