#include "btsgate/Http/HttpServer/HttpServer.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <chrono>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace Btsgate
{
namespace Http
{

HttpServerService::HttpServerService
(
    boost::asio::execution_context & executionContext,
    Gateway gateway,
    boost::asio::ip::tcp::endpoint listenEndpoint
)
    : boost::asio::execution_context::service( executionContext )
    , _work( boost::asio::require( _ioContext.get_executor( ),
             boost::asio::execution::outstanding_work.tracked ) )
    , _tcpAcceptor( _ioContext )
    , _gateway( gateway )
    , _router( _gateway )
    , _workThread( [ this ]( ){ return this->_ioContext.run( ); } )
{
    BTSGATE_LOG_INFO( _logger ) << fmt::format( "[{}] Listening on: {}", name( ), fmt::streamed( listenEndpoint ) );

    boost::asio::co_spawn
    (
        _ioContext,
        do_listen( std::move( listenEndpoint ) ),
        boost::asio::detached
    );
}

asio::awaitable< void > HttpServerService::do_listen( asio::ip::tcp::endpoint listenEndpoint )
{
    beast::error_code errorCode;
    _tcpAcceptor.open( listenEndpoint.protocol( ), errorCode );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Open error: {}", name( ), errorCode.message( ) );
        co_return;
    }

    // Allow address reuse
    _tcpAcceptor.set_option( asio::socket_base::reuse_address( true ), errorCode );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Error setting tcp acceptor options: {}", name( ), errorCode.message( ) );
        co_return;
    }

    // Bind to the server address
    _tcpAcceptor.bind( listenEndpoint, errorCode );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Bind error: {}", name( ), errorCode.message( ) );
        co_return;
    }

    // Start listening for connections
    _tcpAcceptor.listen( asio::socket_base::max_listen_connections, errorCode );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Listen error: {}", name( ), errorCode.message( ) );
        co_return;
    }

    while ( true )
    {
        asio::ip::tcp::socket clientSocket( _ioContext );
        co_await _tcpAcceptor.async_accept( clientSocket, asio::redirect_error( asio::use_awaitable, errorCode ) );
        if ( errorCode == asio::error::operation_aborted )
        {
            co_return;
        }
        if ( errorCode )
        {
            BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Accept error: {}", name( ), errorCode.message( ) );
            continue;
        }
        boost::asio::co_spawn
        (
            _ioContext,
            do_session( std::move( clientSocket ) ),
            boost::asio::detached
        );
    }
}

asio::awaitable< void > HttpServerService::do_session( asio::ip::tcp::socket socket )
{
    beast::tcp_stream tcpStream( std::move( socket ) );
    beast::flat_buffer buffer;
    beast::error_code errorCode;

    while ( true )
    {
        HttpRequest httpRequest;
        tcpStream.expires_after( std::chrono::seconds( 30 ) );
        co_await beast::http::async_read( tcpStream, buffer, httpRequest, asio::redirect_error( asio::use_awaitable, errorCode ) );
        if ( errorCode == beast::http::error::end_of_stream )
        {
            break;
        }
        if ( errorCode )
        {
            BTSGATE_LOG_DEBUG( _logger ) << fmt::format( "[{}] Read error: {}", name( ), errorCode.message( ) );
            break;
        }

        BTSGATE_LOG_TRACE( _logger ) << fmt::format( "[{}] Received request: {}", name( ), fmt::streamed( httpRequest ) );

        // Requests wait on node calls, the read deadline does not apply while routing.
        tcpStream.expires_never( );
        auto httpResponse = co_await _router.do_route( httpRequest );
        const bool keepAlive = httpResponse.keep_alive( );

        tcpStream.expires_after( std::chrono::seconds( 30 ) );
        co_await beast::http::async_write( tcpStream, httpResponse, asio::redirect_error( asio::use_awaitable, errorCode ) );
        if ( errorCode )
        {
            BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Write error: {}", name( ), errorCode.message( ) );
            break;
        }

        if ( !keepAlive )
        {
            break;
        }
    }

    tcpStream.socket( ).shutdown( asio::ip::tcp::socket::shutdown_send, errorCode );
}

} // namespace Http
} // namespace Btsgate
