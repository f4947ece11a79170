#pragma once

#include "btsgate/Io/WebSocket/WebSocketBase.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace Btsgate
{
namespace Io
{

// TLS websocket to a wss:// node.
class SSLWebSocket : public WebSocketBase< SSLWebSocket >
{
public:
    SSLWebSocket
    (
        boost::asio::strand< boost::asio::io_context::executor_type > * strand,
        std::string_view host,
        std::string_view service,
        std::string_view target,
        WebSocketBase::OnMessageFn onMessageFn,
        WebSocketBase::OnClosedFn onClosedFn
    );

    // Resolve, connect, TLS and websocket handshakes. Throws ConnectivityError.
    boost::asio::awaitable< void > do_connect( std::chrono::milliseconds timeout );

    auto & get_next_layer( ) { return _webSocket; }

    constexpr std::string_view name( ) const & { return "SSLWebSocket"; }

private:
    std::string _host;
    std::string _service;
    std::string _target;

    boost::asio::ip::tcp::resolver _tcpResolver;

    boost::asio::ssl::context _sslContext;
    boost::beast::websocket::stream< boost::beast::ssl_stream< boost::beast::tcp_stream > > _webSocket;
};

} // namespace Io
} // namespace Btsgate
