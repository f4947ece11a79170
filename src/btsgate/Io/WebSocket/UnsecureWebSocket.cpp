#include "btsgate/Io/WebSocket/UnsecureWebSocket.hpp"

#include "btsgate/Io/AsyncResolve.hpp"
#include "btsgate/Util/Logger.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/asio/redirect_error.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace Btsgate
{
namespace Io
{

UnsecureWebSocket::UnsecureWebSocket
(
    boost::asio::strand< boost::asio::io_context::executor_type > * strand,
    std::string_view host,
    std::string_view service,
    std::string_view target,
    OnMessageFn onMessageFn,
    OnClosedFn onClosedFn
)
    : WebSocketBase( strand, std::move( onMessageFn ), std::move( onClosedFn ) )
    , _host( host )
    , _service( service )
    , _target( target )
    , _tcpResolver( *get_strand( ) )
    , _webSocket( *get_strand( ) )
{ }

boost::asio::awaitable< void > UnsecureWebSocket::do_connect( std::chrono::milliseconds timeout )
{
    BTSGATE_LOG_DEBUG( get_logger( ) ) << "Opening unsecure WebSocket connection: " << _host << ':' << _service;

    beast::error_code errorCode;
    const auto deadline = std::chrono::steady_clock::now( ) + timeout;
    const auto resolveResults = co_await async_resolve_until
    (
        _tcpResolver,
        _host,
        _service,
        deadline,
        boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( get_logger( ) ) << "Resolve error: " << errorCode.message( );
        throw ConnectivityError( fmt::format( "Resolve error: {}", errorCode.message( ) ) );
    }

    // One deadline covers resolve, connect and the handshake.
    beast::get_lowest_layer( _webSocket ).expires_at( deadline );
    // Make the connection on the IP address we get from a lookup.
    const auto connection = co_await beast::get_lowest_layer( _webSocket ).async_connect
    (
        resolveResults,
        boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( get_logger( ) ) << "Connect error: " << errorCode.message( );
        throw ConnectivityError( fmt::format( "Connect error: {}", errorCode.message( ) ) );
    }

    // Update the host_ string. This will provide the value of the
    // Host HTTP header during the WebSocket handshake.
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    auto resolvedHost = _host + ':' + std::to_string( connection.port( ) );

    // Perform the websocket handshake
    co_await _webSocket.async_handshake( resolvedHost, _target, boost::asio::redirect_error( boost::asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( get_logger( ) ) << "Handshake error: " << errorCode.message( );
        throw ConnectivityError( fmt::format( "WebSocket handshake error: {}", errorCode.message( ) ) );
    }

    // Turn off the timeout on the tcp_stream, because the websocket stream has its own timeout system.
    beast::get_lowest_layer( _webSocket ).expires_never( );
    _webSocket.set_option( beast::websocket::stream_base::timeout::suggested( beast::role_type::client ) );

    BTSGATE_LOG_INFO( get_logger( ) ) << "Successfully opened unsecure WebSocket connection: " << connection;

    on_connected( );
}

} // namespace Io
} // namespace Btsgate
