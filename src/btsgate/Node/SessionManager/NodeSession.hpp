#pragma once

#include "btsgate/Chain/ChainTypes.hpp"
#include "btsgate/Node/NodeConnection/NodeConnection.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace Btsgate
{
namespace Node
{

// Remote APIs a Graphene node may grant after login.
enum class NodeApi : uint8_t
{
    login,
    database,
    orders
};

// A single-request-scoped open connection to one endpoint.
class NodeSession
{
public:
    NodeSession
    (
        Chain chain,
        std::string endpoint,
        std::unique_ptr< NodeConnection > connection,
        std::map< NodeApi, uint64_t > apiIds
    );

    NodeSession( const NodeSession & ) = delete;
    NodeSession & operator=( const NodeSession & ) = delete;

    Chain chain( ) const { return _chain; }
    const std::string & endpoint( ) const & { return _endpoint; }
    bool is_open( ) const { return _open; }

    // Nullopt when the node did not grant the API.
    std::optional< uint64_t > api_id( NodeApi api ) const;

    // Throws ConnectivityError once the session is closed.
    boost::asio::awaitable< boost::json::value > do_call( uint64_t apiId, std::string method, boost::json::array params );

    // Idempotent, never throws.
    boost::asio::awaitable< void > do_close( );

    constexpr std::string_view name( ) const & { return "NodeSession"; }

private:
    Chain _chain;
    std::string _endpoint;
    std::unique_ptr< NodeConnection > _connection;
    std::map< NodeApi, uint64_t > _apiIds;

    bool _open = true;

    BtsgateLogger _logger;
};

} // namespace Node
} // namespace Btsgate
