#include "btsgate/Io/WebSocket/SSLWebSocket.hpp"

#include "btsgate/Io/AsyncResolve.hpp"
#include "btsgate/Util/Logger.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace Btsgate
{
namespace Io
{

SSLWebSocket::SSLWebSocket
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
    , _sslContext( asio::ssl::context::method::sslv23_client )
    , _webSocket( *get_strand( ), _sslContext )
{
    _sslContext.set_default_verify_paths( );
    _sslContext.set_verify_mode( asio::ssl::verify_peer );
}

boost::asio::awaitable< void > SSLWebSocket::do_connect( std::chrono::milliseconds timeout )
{
    BTSGATE_LOG_DEBUG( get_logger( ) )
        << fmt::format( "[{}][{}:{}] Opening SSL WebSocket connection", name( ), _host, _service );

    boost::system::error_code errorCode;
    const auto deadline = std::chrono::steady_clock::now( ) + timeout;
    const auto results = co_await async_resolve_until
    (
        _tcpResolver,
        _host,
        _service,
        deadline,
        boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( get_logger( ) )
            << fmt::format( "[{}][{}:{}] Resolve error: {}", name( ), _host, _service, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "Resolve error: {}", errorCode.message( ) ) );
    }

    // The connect timeout covers resolve, tcp connect and both handshakes.
    beast::get_lowest_layer( _webSocket ).expires_at( deadline );
    const auto connection = co_await beast::get_lowest_layer( _webSocket ).async_connect
    (
        results,
        boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( get_logger( ) )
            << fmt::format( "[{}][{}:{}] Connect error: {}", name( ), _host, _service, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "Connect error: {}", errorCode.message( ) ) );
    }

    // Set SNI Hostname, most public nodes sit behind virtual hosts.
    if ( !SSL_set_tlsext_host_name( _webSocket.next_layer( ).native_handle( ), _host.c_str( ) ) )
    {
        errorCode.assign( static_cast< int >( ::ERR_get_error( ) ), boost::asio::error::get_ssl_category( ) );
        BTSGATE_LOG_ERROR( get_logger( ) )
            << fmt::format( "[{}][{}:{}] Error setting SNI hostname: {}", name( ), _host, _service, errorCode.message( ) );
        throw ConnectivityError( errorCode.message( ) );
    }
    _webSocket.next_layer( ).set_verify_callback( asio::ssl::host_name_verification( _host ) );

    co_await _webSocket.next_layer( ).async_handshake
    (
        boost::asio::ssl::stream_base::client,
        boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( get_logger( ) )
            << fmt::format( "[{}][{}:{}] SSL handshake error: {}", name( ), _host, _service, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "SSL handshake error: {}", errorCode.message( ) ) );
    }

    // Update the host string. This will provide the value of the
    // Host HTTP header during the WebSocket handshake.
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    auto resolvedHost = _host + ':' + std::to_string( connection.port( ) );
    co_await _webSocket.async_handshake( resolvedHost, _target, boost::asio::redirect_error( boost::asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( get_logger( ) )
            << fmt::format( "[{}][{}:{}] WS handshake error: {}", name( ), _host, _service, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "WebSocket handshake error: {}", errorCode.message( ) ) );
    }

    // Turn off the timeout on the tcp_stream, because the websocket stream has its own timeout system.
    beast::get_lowest_layer( _webSocket ).expires_never( );
    _webSocket.set_option( beast::websocket::stream_base::timeout::suggested( beast::role_type::client ) );

    BTSGATE_LOG_INFO( get_logger( ) )
        << fmt::format
        (
            "[{}][{}:{}{}] Successfully opened SSL WebSocket connection: {}",
            name( ),
            _host,
            _service,
            _target,
            fmt::streamed( connection )
        );

    on_connected( );
}

} // namespace Io
} // namespace Btsgate
