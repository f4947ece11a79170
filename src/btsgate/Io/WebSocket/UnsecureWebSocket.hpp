#pragma once

#include "btsgate/Io/WebSocket/WebSocketBase.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace Btsgate
{
namespace Io
{

// Plain websocket to a ws:// node.
class UnsecureWebSocket : public WebSocketBase< UnsecureWebSocket >
{
public:
    UnsecureWebSocket
    (
        boost::asio::strand< boost::asio::io_context::executor_type > * strand,
        std::string_view host,
        std::string_view service,
        std::string_view target,
        WebSocketBase::OnMessageFn onMessageFn,
        WebSocketBase::OnClosedFn onClosedFn
    );

    // Resolve, connect and websocket handshake. Throws ConnectivityError.
    boost::asio::awaitable< void > do_connect( std::chrono::milliseconds timeout );

    auto & get_next_layer( ) { return _webSocket; }

    constexpr std::string_view name( ) const & { return "UnsecureWebSocket"; }

private:
    std::string _host;
    std::string _service;
    std::string _target;

    boost::asio::ip::tcp::resolver _tcpResolver;
    boost::beast::websocket::stream< boost::beast::tcp_stream > _webSocket;
};

} // namespace Io
} // namespace Btsgate
