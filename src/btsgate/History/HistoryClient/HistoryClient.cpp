#include "btsgate/History/HistoryClient/HistoryClient.hpp"

#include "btsgate/Io/AsyncResolve.hpp"
#include "btsgate/Util/StringEncode.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <boost/json/parse.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace Btsgate
{
namespace History
{

std::string build_history_target( std::string_view accountId, const HistoryQuery & query )
{
    const auto param = [ ]( std::string_view key, const std::optional< std::string > & value, std::string_view fallback )
    {
        return fmt::format( "&{}={}", key, enc_uri_component( value.value_or( std::string( fallback ) ) ) );
    };

    std::string target = fmt::format( "/openexplorer/es/account_history?account_id={}", enc_uri_component( accountId ) );
    target += param( "from_", query.from, "0" );
    target += param( "size", query.size, "100" );
    target += param( "from_date", query.fromDate, "2015-10-10" );
    target += param( "to_date", query.toDate, "now" );
    target += param( "sort_by", query.sortBy, "-operation_id_num" );
    target += param( "type", query.type, "data" );
    target += param( "agg_field", query.aggField, "operation_type" );
    return target;
}

std::optional< boost::json::value > parse_history_response( const HistoryResponse & httpResponse )
{
    if ( httpResponse.result( ) != beast::http::status::ok )
    {
        auto reason = httpResponse.reason( );
        throw RemoteCallError
        (
            fmt::format( "History service returned {} {}", httpResponse.result_int( ), std::string_view( reason.data( ), reason.size( ) ) )
        );
    }

    boost::json::value history;
    try
    {
        history = boost::json::parse( httpResponse.body( ) );
    }
    catch ( const std::exception & ex )
    {
        throw RemoteCallError( fmt::format( "Invalid history document: {}", ex.what( ) ) );
    }

    if ( history.is_null( ) )
    {
        return std::nullopt;
    }
    return history;
}

HistoryClient::HistoryClient
(
    asio::io_context & ioContext,
    std::map< Chain, std::string > historyHosts,
    std::chrono::milliseconds requestTimeout
)
    : _historyHosts( std::move( historyHosts ) )
    , _requestTimeout( requestTimeout )
    , _strand( ioContext.get_executor( ) )
    , _sslContext( asio::ssl::context::method::sslv23_client )
    , _tcpResolver( _strand )
{
    _sslContext.set_default_verify_paths( );
    _sslContext.set_verify_mode( asio::ssl::verify_peer );
}

asio::awaitable< beast::ssl_stream< beast::tcp_stream > > HistoryClient::open_connection( const std::string & host )
{
    beast::ssl_stream< beast::tcp_stream > sslSocket( _strand, _sslContext );

    boost::system::error_code errorCode;
    const auto deadline = std::chrono::steady_clock::now( ) + _requestTimeout;
    const auto results = co_await Io::async_resolve_until
    (
        _tcpResolver,
        host,
        "https",
        deadline,
        asio::redirect_error( asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}][{}] Resolve error: {}", name( ), host, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "Resolve error: {}", errorCode.message( ) ) );
    }

    // Set SNI Hostname.
    if ( !SSL_set_tlsext_host_name( sslSocket.native_handle( ), host.c_str( ) ) )
    {
        errorCode.assign( static_cast< int >( ::ERR_get_error( ) ), asio::error::get_ssl_category( ) );
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Error setting SNI hostname: {}", name( ), errorCode.message( ) );
        throw ConnectivityError( errorCode.message( ) );
    }
    sslSocket.set_verify_callback( asio::ssl::host_name_verification( host ) );

    beast::get_lowest_layer( sslSocket ).expires_at( deadline );
    const auto connection = co_await beast::get_lowest_layer( sslSocket ).async_connect
    (
        results,
        asio::redirect_error( asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}][{}] Connect error: {}", name( ), host, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "Connect error: {}", errorCode.message( ) ) );
    }
    BTSGATE_LOG_DEBUG( _logger )
        << fmt::format( "[{}] Connected to history service: {}", name( ), fmt::streamed( connection ) );

    // Perform the SSL handshake.
    co_await sslSocket.async_handshake( asio::ssl::stream_base::client, asio::redirect_error( asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}][{}] SSL handshake error: {}", name( ), host, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "SSL handshake error: {}", errorCode.message( ) ) );
    }

    co_return std::move( sslSocket );
}

asio::awaitable< std::optional< boost::json::value > > HistoryClient::do_account_history
(
    Chain chain,
    std::string accountId,
    HistoryQuery query
)
{
    if ( accountId.empty( ) )
    {
        throw ValidationError( "Missing account id" );
    }

    auto findHost = _historyHosts.find( chain );
    if ( findHost == _historyHosts.end( ) )
    {
        throw ConfigurationError( fmt::format( "No history host configured for {}", chain_name( chain ) ) );
    }
    const auto & host = findHost->second;

    auto connection = co_await open_connection( host );

    beast::http::request< beast::http::empty_body > httpRequest;
    httpRequest.method( beast::http::verb::get );
    httpRequest.target( build_history_target( accountId, query ) );
    httpRequest.set( beast::http::field::host, host );
    httpRequest.set( beast::http::field::accept, "application/json" );

    BTSGATE_LOG_TRACE( _logger )
        << fmt::format( "[{}] Sending GET request: {}", name( ), fmt::streamed( httpRequest ) );

    boost::system::error_code errorCode;
    co_await beast::http::async_write( connection, httpRequest, asio::redirect_error( asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}][{}] Write error: {}", name( ), host, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "Write error: {}", errorCode.message( ) ) );
    }

    HistoryResponse httpResponse;
    {
        beast::flat_buffer readBuffer;
        co_await beast::http::async_read( connection, readBuffer, httpResponse, asio::redirect_error( asio::use_awaitable, errorCode ) );
    }
    if ( errorCode )
    {
        BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}][{}] Read error: {}", name( ), host, errorCode.message( ) );
        throw ConnectivityError( fmt::format( "Read error: {}", errorCode.message( ) ) );
    }

    // Best effort, the response is already complete.
    beast::get_lowest_layer( connection ).expires_after( _requestTimeout );
    co_await connection.async_shutdown( asio::redirect_error( asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        BTSGATE_LOG_DEBUG( _logger ) << fmt::format( "[{}][{}] Shutdown error: {}", name( ), host, errorCode.message( ) );
    }

    if ( httpResponse.result( ) != beast::http::status::ok )
    {
        BTSGATE_LOG_ERROR( _logger )
            << fmt::format
            (
                "[{}] Received invalid history response, status code: {}",
                name( ),
                httpResponse.result_int( )
            );
    }

    co_return parse_history_response( httpResponse );
}

} // namespace History
} // namespace Btsgate
