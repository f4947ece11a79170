#pragma once

#include <boost/asio/async_result.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace Btsgate
{
namespace Io
{

// Resolves host:service, completing with timed_out if the lookup outlives the deadline.
template< typename Resolver, typename CompletionToken >
auto async_resolve_until
(
    Resolver & resolver,
    std::string host,
    std::string service,
    std::chrono::steady_clock::time_point deadline,
    CompletionToken && token
)
{
    using ResolveResults = typename Resolver::results_type;

    return boost::asio::async_initiate< CompletionToken, void( boost::system::error_code, ResolveResults ) >
    (
        [ &resolver, deadline ]( auto handler, std::string resolveHost, std::string resolveService )
        {
            using Handler = decltype( handler );

            struct ResolveState
            {
                ResolveState( Handler completionHandler, const typename Resolver::executor_type & executor )
                    : handler( std::move( completionHandler ) )
                    , deadlineTimer( executor )
                { }

                std::optional< Handler > handler;
                boost::asio::steady_timer deadlineTimer;
            };

            auto state = std::make_shared< ResolveState >( std::move( handler ), resolver.get_executor( ) );

            // First completion wins, the other one finds the handler gone.
            auto complete = [ state ]( boost::system::error_code errorCode, ResolveResults results )
            {
                if ( !state->handler )
                {
                    return;
                }
                auto completionHandler = std::move( *state->handler );
                state->handler.reset( );
                state->deadlineTimer.cancel( );
                std::move( completionHandler )( errorCode, std::move( results ) );
            };

            state->deadlineTimer.expires_at( deadline );
            state->deadlineTimer.async_wait( [ state, complete, &resolver ]( boost::system::error_code waitError )
            {
                if ( waitError || !state->handler )
                {
                    return;
                }
                resolver.cancel( );
                complete( boost::asio::error::timed_out, ResolveResults( ) );
            } );

            resolver.async_resolve( resolveHost, resolveService, complete );
        },
        token,
        std::move( host ),
        std::move( service )
    );
}

} // namespace Io
} // namespace Btsgate
