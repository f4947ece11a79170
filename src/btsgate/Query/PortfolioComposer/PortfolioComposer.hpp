#pragma once

#include "btsgate/Chain/ChainTypes.hpp"
#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"
#include "btsgate/Node/SessionManager/SessionManager.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/json/object.hpp>

#include <string>

namespace Btsgate
{
namespace Query
{

// Balances and open orders of one account, read over a single session.
// Either half failing fails the whole call, a partial portfolio is never returned.
class PortfolioComposer
{
public:
    static constexpr uint32_t LIMIT_ORDER_COUNT = 100;

    PortfolioComposer( Node::SessionManager & sessionManager, Node::RpcInvoker & rpcInvoker );

    // { "balances": [...], "limitOrders": [...] }
    boost::asio::awaitable< boost::json::object > do_portfolio( Chain chain, std::string accountId );

    constexpr std::string_view name( ) const & { return "PortfolioComposer"; }

private:
    Node::SessionManager & _sessionManager;
    Node::RpcInvoker & _rpcInvoker;

    BtsgateLogger _logger;
};

} // namespace Query
} // namespace Btsgate
