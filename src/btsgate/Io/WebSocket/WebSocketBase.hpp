#pragma once

#include "btsgate/Util/Logger.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/high_resolution_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <simdjson.h>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <deque>
#include <functional>
#include <string>
#include <string_view>

namespace Btsgate
{
namespace Io
{

template< class ConcreteWebSocket >
class WebSocketBase
{
public:
    using OnMessageFn = std::function< void( std::string_view, size_t ) >;
    // Invoked once when the read loop ends, with the reason the connection went away.
    using OnClosedFn = std::function< void( std::string ) >;

    WebSocketBase
    (
        boost::asio::strand< boost::asio::io_context::executor_type > * strand,
        OnMessageFn onMessageFn,
        OnClosedFn onClosedFn
    )
        : _onMessageFn( std::move( onMessageFn ) )
        , _onClosedFn( std::move( onClosedFn ) )
        , _strand( strand )
        , _drainTimer( *strand )
    { }

    boost::asio::awaitable< void > do_send_message( std::string message )
    {
        if ( !_connected || _closing )
        {
            throw ConnectivityError( "WebSocket connection is not open" );
        }

        _writeBuffer.push_back( std::move( message ) );

        // If first pending message, start writer coro.
        if ( _writeBuffer.size( ) == 1 )
        {
            ++_activeLoops;
            boost::asio::co_spawn( *get_strand( ), do_write( ), boost::asio::detached );
        }

        co_return;
    }

    // Safe to call more than once, errors are logged and never thrown.
    boost::asio::awaitable< void > do_close( )
    {
        if ( _closing )
        {
            co_return;
        }
        _closing = true;

        boost::system::error_code errorCode;
        if ( _connected )
        {
            BTSGATE_LOG_DEBUG( get_logger( ) ) << fmt::format( "[{}] Gracefully closing WebSocket connection", name( ) );

            co_await impl( ).get_next_layer( ).async_close
            (
                boost::beast::websocket::close_code::normal,
                boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
            );
            if ( errorCode )
            {
                BTSGATE_LOG_DEBUG( get_logger( ) )
                    << fmt::format( "[{}] Close error: {}", name( ), errorCode.message( ) );
                boost::beast::get_lowest_layer( impl( ).get_next_layer( ) ).close( );
            }
        }

        // The socket must outlive the reader and writer coros.
        while ( _activeLoops > 0 )
        {
            _drainTimer.expires_at( boost::asio::high_resolution_timer::time_point::max( ) );
            co_await _drainTimer.async_wait( boost::asio::redirect_error( boost::asio::use_awaitable, errorCode ) );
        }
    }

    bool is_open( ) const { return _connected && !_closing; }

    constexpr std::string_view name( ) const & { return "WebSocketBase"; }

protected:
    BtsgateLogger & get_logger( ) { return _logger; }
    boost::asio::strand< boost::asio::io_context::executor_type > * get_strand( ) { return _strand; }

    // Called by the concrete socket once its handshake has completed.
    void on_connected( )
    {
        _connected = true;
        ++_activeLoops;
        boost::asio::co_spawn( *get_strand( ), do_read( ), boost::asio::detached );
    }

    boost::asio::awaitable< void > do_read( )
    {
        boost::beast::flat_buffer readBuffer;
        std::string closeReason;
        while ( true )
        {
            boost::system::error_code errorCode;

            size_t bytesRead = co_await impl( ).get_next_layer( ).async_read
            (
                readBuffer,
                boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
            );

            if ( errorCode == boost::beast::websocket::error::closed )
            {
                closeReason = fmt::format( "Connection closed, reason: {}", impl( ).get_next_layer( ).reason( ).reason.c_str( ) );
                BTSGATE_LOG_DEBUG( get_logger( ) ) << fmt::format( "[{}] {}", name( ), closeReason );
                break;
            }
            if ( errorCode == boost::asio::error::operation_aborted )
            {
                closeReason = "Connection closed by client";
                BTSGATE_LOG_DEBUG( get_logger( ) ) << fmt::format( "[{}] {}", name( ), closeReason );
                break;
            }
            if ( errorCode )
            {
                closeReason = fmt::format( "Read error: {}", errorCode.message( ) );
                BTSGATE_LOG_ERROR( get_logger( ) ) << fmt::format( "[{}] {}", name( ), closeReason );
                break;
            }

            readBuffer.reserve( bytesRead + simdjson::SIMDJSON_PADDING ); // reserve space for simdjson padding.

            std::string_view message( reinterpret_cast< const char * >( readBuffer.data( ).data( ) ), bytesRead );
            BTSGATE_LOG_TRACE( get_logger( ) ) << fmt::format( "[{}] Read: {}", name( ), message );

            _onMessageFn( message, bytesRead + simdjson::SIMDJSON_PADDING );

            readBuffer.consume( bytesRead );
        }

        _connected = false;
        _writeBuffer.clear( );
        _onClosedFn( std::move( closeReason ) );
        on_loop_finished( );
    }

private:
    ConcreteWebSocket & impl( ) { return static_cast< ConcreteWebSocket & >( *this ); }

    void on_loop_finished( )
    {
        if ( --_activeLoops == 0 )
        {
            _drainTimer.cancel( );
        }
    }

    boost::asio::awaitable< void > do_write( )
    {
        while ( !_writeBuffer.empty( ) )
        {
            boost::beast::error_code errorCode;

            auto bytesWritten = co_await impl( ).get_next_layer( ).async_write
            (
                boost::asio::buffer( _writeBuffer.front( ) ),
                boost::asio::redirect_error( boost::asio::use_awaitable, errorCode )
            );

            if ( errorCode )
            {
                BTSGATE_LOG_ERROR( get_logger( ) )
                    << fmt::format
                    (
                        "[{}] Write error: {}, bytes written: {}",
                        name( ),
                        errorCode.message( ),
                        bytesWritten
                    );
                _writeBuffer.clear( );
                break;
            }

            _writeBuffer.pop_front( );
        }
        on_loop_finished( );
    }

    OnMessageFn _onMessageFn;
    OnClosedFn _onClosedFn;

    boost::asio::strand< boost::asio::io_context::executor_type > * _strand;

    // Fires when the last reader or writer coro exits.
    boost::asio::high_resolution_timer _drainTimer;
    size_t _activeLoops = 0;

    bool _connected = false;
    bool _closing = false;

    std::deque< std::string > _writeBuffer;
    mutable BtsgateLogger _logger;
};

} // namespace Io
} // namespace Btsgate
