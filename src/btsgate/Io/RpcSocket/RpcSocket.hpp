#pragma once

#include "btsgate/Util/JsonUtils.hpp"
#include "btsgate/Util/Logger.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/high_resolution_timer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include <simdjson.h>

#include <fmt/core.h>

#include <chrono>
#include <memory>
#include <string_view>
#include <unordered_map>

namespace Btsgate
{
namespace Io
{

// Graphene nodes multiplex every API over the single "call" method.
inline boost::json::object build_rpc_request( uint64_t id, uint64_t apiId, std::string_view method, boost::json::array params )
{
    boost::json::array callParams;
    callParams.emplace_back( apiId );
    callParams.emplace_back( std::string( method ) );
    callParams.emplace_back( std::move( params ) );

    boost::json::object request;
    request.emplace( "jsonrpc", "2.0" );
    request.emplace( "id", id );
    request.emplace( "method", "call" );
    request.emplace( "params", std::move( callParams ) );
    return request;
}

template< class NextLayer >
class RpcSocket : public NextLayer
{
public:
    RpcSocket
    (
        boost::asio::strand< boost::asio::io_context::executor_type > * strand,
        std::string_view host,
        std::string_view service,
        std::string_view target,
        std::chrono::milliseconds requestTimeout
    )
        : NextLayer
        (
            strand,
            host,
            service,
            target,
            std::bind( &RpcSocket::on_message, this, std::placeholders::_1 ),
            std::bind( &RpcSocket::on_closed, this, std::placeholders::_1 )
        )
        , _requestTimeout( requestTimeout )
    { }

    template< class ResponseType >
    boost::asio::awaitable< ResponseType > do_send_request( uint64_t apiId, std::string_view method, boost::json::array params )
    {
        const auto id = _nextRequestId++;

        auto makeRequest = std::make_unique< PendingRequest< ResponseType > >( NextLayer::get_strand( ), _requestTimeout );
        auto * pendingRequest = _pendingRequests.emplace
        (
            id,
            std::move( makeRequest )
        ).first->second.get( );

        try
        {
            co_await NextLayer::do_send_message( build_rpc_request( id, apiId, method, std::move( params ) ) );
        }
        catch ( const std::exception & )
        {
            _pendingRequests.erase( id );
            throw;
        }

        boost::system::error_code errorCode;
        // Wait for response to succeed or timeout.
        co_await pendingRequest->expiryTimer.async_wait( boost::asio::redirect_error( boost::asio::use_awaitable, errorCode ) );

        // Complete request.
        if ( errorCode == boost::asio::error::operation_aborted )
        {
            if ( pendingRequest->error )
            {
                BTSGATE_LOG_DEBUG( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Completed request with error, method: {}, id: {}", name( ), method, id );
                // Rethrow error.
                auto ex = std::move( pendingRequest->error );
                _pendingRequests.erase( id );
                std::rethrow_exception( ex );
            }

            auto response = std::move( static_cast< PendingRequest< ResponseType > * >( pendingRequest )->response );
            _pendingRequests.erase( id );
            co_return response;
        }
        else if ( errorCode )
        {
            // Expiry timer error.
            BTSGATE_LOG_ERROR( NextLayer::get_logger( ) )
                << fmt::format( "[{}] Request timer error: {}, id: {}", name( ), errorCode.message( ), id );
            _pendingRequests.erase( id );
            throw ConnectivityError( errorCode.message( ) );
        }
        else
        {
            // Timed-out.
            _pendingRequests.erase( id );
            BTSGATE_LOG_ERROR( NextLayer::get_logger( ) )
                << fmt::format( "[{}] Request timed out, method: {}, id: {}", name( ), method, id );

            throw ConnectivityError( fmt::format( "Request timed out: {}", method ) );
        }
    }

    constexpr std::string_view name( ) const & { return "RpcSocket"; }

private:
    void on_message( simdjson::ondemand::document responseDocument )
    {
        try
        {
            simdjson::ondemand::object responseObject( responseDocument );
            auto id = responseObject[ "id" ].get_uint64( );
            if ( id.error( ) )
            {
                // Subscription notices carry no id, sessions never subscribe.
                BTSGATE_LOG_TRACE( NextLayer::get_logger( ) ) << fmt::format( "[{}] Ignoring notice", name( ) );
                return;
            }

            auto findPendingRequest = _pendingRequests.find( id.value( ) );
            if ( findPendingRequest == _pendingRequests.end( ) )
            {
                BTSGATE_LOG_ERROR( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Invalid response id: {}", name( ), id.value( ) );
                return;
            }

            auto error = responseObject[ "error" ];
            if ( !error.error( ) )
            {
                auto errorJson = json_to< boost::json::value >( error.value( ) );
                std::string message = boost::json::serialize( errorJson );
                if ( auto * errorObject = errorJson.if_object( ) )
                {
                    if ( auto * errorMessage = errorObject->if_contains( "message" ); errorMessage && errorMessage->is_string( ) )
                    {
                        message = std::string( as_string_view( errorMessage->get_string( ) ) );
                    }
                }
                BTSGATE_LOG_ERROR( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Received error response: {}", name( ), message );
                findPendingRequest->second->error = std::make_exception_ptr( RemoteCallError( message ) );
            }
            else
            {
                findPendingRequest->second->set_result( responseObject[ "result" ].value( ) );
                BTSGATE_LOG_TRACE( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Successfully read RPC response", name( ) );
            }

            // Notify writer of request that response is successful.
            findPendingRequest->second->expiryTimer.cancel( );
        }
        catch ( const std::exception & ex )
        {
            BTSGATE_LOG_ERROR( NextLayer::get_logger( ) )
                << fmt::format( "[{}] Error deserializing RPC message: {}", name( ), ex.what( ) );
        }
    }

    // Every call still waiting on this connection fails with the close reason.
    void on_closed( std::string reason )
    {
        for ( auto & [ id, pendingRequest ] : _pendingRequests )
        {
            if ( !pendingRequest->error )
            {
                pendingRequest->error = std::make_exception_ptr( ConnectivityError( reason ) );
            }
            pendingRequest->expiryTimer.cancel( );
        }
    }

    struct PendingRequestBase
    {
        PendingRequestBase( boost::asio::strand< boost::asio::io_context::executor_type > * strand, std::chrono::milliseconds timeout )
            : expiryTimer( *strand, timeout )
        { }

        virtual ~PendingRequestBase( ) = default;

        virtual void set_result( simdjson::ondemand::value jsonValue ) = 0;

        boost::asio::high_resolution_timer expiryTimer;
        std::exception_ptr error;
    };

    template< class ResponseType >
    struct PendingRequest : PendingRequestBase
    {
        PendingRequest( boost::asio::strand< boost::asio::io_context::executor_type > * strand, std::chrono::milliseconds timeout )
            : PendingRequestBase( strand, timeout )
        { }

        void set_result( simdjson::ondemand::value jsonValue ) override
        {
            try
            {
                response = json_to< ResponseType >( jsonValue );
            }
            catch ( const std::exception & ex )
            {
                this->error = std::make_exception_ptr( RemoteCallError( ex.what( ) ) );
            }
        }

        ResponseType response;
    };

    std::chrono::milliseconds _requestTimeout;

    uint64_t _nextRequestId = 1;
    std::unordered_map< uint64_t, std::unique_ptr< PendingRequestBase > > _pendingRequests;
};

} // namespace Io
} // namespace Btsgate
