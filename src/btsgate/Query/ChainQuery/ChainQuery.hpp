#pragma once

#include "btsgate/Chain/ChainTypes.hpp"
#include "btsgate/Node/ObjectBatcher/ObjectBatcher.hpp"
#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"
#include "btsgate/Node/SessionManager/SessionManager.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Btsgate
{
namespace Query
{

// Single-session read queries against a chain's current node.
// Nullopt means the query succeeded but the target does not exist.
class ChainQuery
{
public:
    static constexpr std::chrono::milliseconds ORDER_BOOK_CONNECT_TIMEOUT{ 4000 };
    static constexpr std::string_view BLOCKED_ACCOUNTS_MANAGER = "committee-blacklist-manager";

    ChainQuery( Node::SessionManager & sessionManager, Node::RpcInvoker & rpcInvoker, Node::ObjectBatcher & objectBatcher );

    // First match of get_accounts for an account id or name.
    boost::asio::awaitable< std::optional< boost::json::value > > do_account_lookup( Chain chain, std::string searchInput );

    // Committee maintained block list, only published on the main network.
    boost::asio::awaitable< std::optional< boost::json::value > > do_blocked_accounts( Chain chain );

    boost::asio::awaitable< std::optional< boost::json::value > > do_full_account( Chain chain, std::string accountId );
    boost::asio::awaitable< std::optional< boost::json::value > > do_account_balances( Chain chain, std::string accountId );
    boost::asio::awaitable< std::optional< boost::json::value > > do_account_limit_orders( Chain chain, std::string accountId );

    // Throws ValidationError unless both ids are asset ids.
    boost::asio::awaitable< std::optional< boost::json::value > > do_order_book( Chain chain, std::string base, std::string quote );
    boost::asio::awaitable< std::optional< boost::json::value > > do_market_limit_orders( Chain chain, std::string base, std::string quote );

    boost::asio::awaitable< boost::json::array > do_fetch_objects( Chain chain, std::vector< std::string > ids );

    constexpr std::string_view name( ) const & { return "ChainQuery"; }

private:
    // Array results: empty and null both mean absent.
    template< class RequestType >
    boost::asio::awaitable< std::optional< boost::json::value > > do_query_list
    (
        Chain chain,
        RequestType request,
        std::optional< std::chrono::milliseconds > connectTimeout = std::nullopt
    );

    Node::SessionManager & _sessionManager;
    Node::RpcInvoker & _rpcInvoker;
    Node::ObjectBatcher & _objectBatcher;

    BtsgateLogger _logger;
};

// Throws ValidationError for anything not shaped "1.3.N".
void validate_asset_id( std::string_view assetId );

// Throws ValidationError for an empty path or body parameter.
void validate_not_empty( std::string_view value, std::string_view what );

} // namespace Query
} // namespace Btsgate
