#pragma once

#include "btsgate/Node/EndpointRegistry/EndpointRegistry.hpp"
#include "btsgate/Node/NodeConnection/NodeConnection.hpp"
#include "btsgate/Node/SessionManager/NodeSession.hpp"

#include "btsgate/Util/Logger.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/asio/awaitable.hpp>

#include <fmt/core.h>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>

namespace Btsgate
{
namespace Node
{

class SessionManager
{
public:
    SessionManager
    (
        EndpointRegistry & endpointRegistry,
        NodeConnectionFactory connectionFactory,
        std::chrono::milliseconds connectTimeout
    );

    // Opens a logged-in session against the chain's current endpoint.
    // On failure the registry is rotated once and ConnectivityError is thrown, the next request gets the next node.
    boost::asio::awaitable< std::unique_ptr< NodeSession > > do_open
    (
        Chain chain,
        std::optional< std::chrono::milliseconds > connectTimeout = std::nullopt
    );

    // Runs fn against a fresh session and closes it on every exit path.
    // A node that connected but refused a required API is rotated away from before the error is rethrown.
    template< class ResultType, class SessionFn >
    boost::asio::awaitable< ResultType > do_with_session
    (
        Chain chain,
        SessionFn sessionFn,
        std::optional< std::chrono::milliseconds > connectTimeout = std::nullopt
    )
    {
        auto session = co_await do_open( chain, connectTimeout );

        std::optional< ResultType > result;
        std::exception_ptr error;
        bool apiUnavailable = false;
        try
        {
            result.emplace( co_await sessionFn( *session ) );
        }
        catch ( const ApiUnavailableError & )
        {
            apiUnavailable = true;
            error = std::current_exception( );
        }
        catch ( const std::exception & )
        {
            error = std::current_exception( );
        }

        co_await session->do_close( );

        if ( error )
        {
            if ( apiUnavailable )
            {
                BTSGATE_LOG_INFO( _logger )
                    << fmt::format( "[{}][{}] Node lacks a required api, rotating", name( ), session->endpoint( ) );
                _endpointRegistry.rotate_if_current( chain, session->endpoint( ) );
            }
            std::rethrow_exception( error );
        }
        co_return std::move( *result );
    }

    EndpointRegistry & endpoint_registry( ) { return _endpointRegistry; }

    constexpr std::string_view name( ) const & { return "SessionManager"; }

private:
    boost::asio::awaitable< std::map< NodeApi, uint64_t > > do_login( NodeConnection & connection, const std::string & url );

    EndpointRegistry & _endpointRegistry;
    NodeConnectionFactory _connectionFactory;
    std::chrono::milliseconds _connectTimeout;

    BtsgateLogger _logger;
};

} // namespace Node
} // namespace Btsgate
