#pragma once

#include "btsgate/Node/NodeConnection/NodeConnection.hpp"

#include "btsgate/Io/RpcSocket/RpcSocket.hpp"
#include "btsgate/Io/WebSocket/JsonWebSocket.hpp"
#include "btsgate/Io/WebSocket/SSLWebSocket.hpp"
#include "btsgate/Io/WebSocket/UnsecureWebSocket.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

namespace Btsgate
{
namespace Node
{

template< class WebSocketType >
class WebSocketNodeConnection : public NodeConnection
{
public:
    WebSocketNodeConnection
    (
        boost::asio::io_context & ioContext,
        const NodeEndpoint & endpoint,
        std::chrono::milliseconds requestTimeout
    )
        : _strand( ioContext.get_executor( ) )
        , _rpcSocket( &_strand, endpoint.host, endpoint.service, endpoint.target, requestTimeout )
    { }

    boost::asio::awaitable< void > do_connect( std::chrono::milliseconds timeout ) override
    {
        co_await _rpcSocket.do_connect( timeout );
    }

    boost::asio::awaitable< boost::json::value > do_call( uint64_t apiId, std::string method, boost::json::array params ) override
    {
        co_return co_await _rpcSocket.template do_send_request< boost::json::value >( apiId, method, std::move( params ) );
    }

    boost::asio::awaitable< void > do_close( ) override
    {
        co_await _rpcSocket.do_close( );
    }

private:
    boost::asio::strand< boost::asio::io_context::executor_type > _strand;
    Io::RpcSocket< Io::JsonWebSocket< WebSocketType > > _rpcSocket;
};

using SSLNodeConnection = WebSocketNodeConnection< Io::SSLWebSocket >;
using UnsecureNodeConnection = WebSocketNodeConnection< Io::UnsecureWebSocket >;

// Picks TLS or plain websocket from the endpoint scheme.
NodeConnectionFactory make_websocket_connection_factory( boost::asio::io_context & ioContext, std::chrono::milliseconds requestTimeout );

} // namespace Node
} // namespace Btsgate
