#pragma once

#include "btsgate/Cache/CacheStore/CacheStore.hpp"
#include "btsgate/Gateway/GatewayTypes.hpp"
#include "btsgate/History/HistoryClient/HistoryClient.hpp"
#include "btsgate/Node/NodeConnection/NodeConnection.hpp"
#include "btsgate/Transaction/OperationType.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace Btsgate
{

template< class Service >
class GatewayServiceProvider
{
public:
    explicit GatewayServiceProvider( Service & service )
        : _service( &service )
    { }

    GatewayServiceProvider
    (
        boost::asio::io_context & ioContext,
        GatewayConfig config,
        Node::NodeConnectionFactory connectionFactory = { }
    )
        : _service( &boost::asio::make_service< Service >( ioContext, std::move( config ), std::move( connectionFactory ) ) )
    { }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::string ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto build_deeplink
    (
        Chain chain,
        Transaction::OperationType operationType,
        std::vector< boost::json::value > operationPayloads,
        CompletionToken && token = { }
    )
    {
        return initiate< std::string >
        (
            [ chain, operationType, operationPayloads = std::move( operationPayloads ) ]( auto & impl ) mutable
            {
                return impl.do_build_deeplink( chain, operationType, std::move( operationPayloads ) );
            },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, boost::json::array ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto fetch_objects( Chain chain, std::vector< std::string > ids, CompletionToken && token = { } )
    {
        return initiate< boost::json::array >
        (
            [ chain, ids = std::move( ids ) ]( auto & impl ) mutable { return impl.do_fetch_objects( chain, std::move( ids ) ); },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto account_lookup( Chain chain, std::string searchInput, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain, searchInput = std::move( searchInput ) ]( auto & impl ) mutable { return impl.do_account_lookup( chain, std::move( searchInput ) ); },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto blocked_accounts( Chain chain, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain ]( auto & impl ) { return impl.do_blocked_accounts( chain ); },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto full_account( Chain chain, std::string accountId, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain, accountId = std::move( accountId ) ]( auto & impl ) mutable { return impl.do_full_account( chain, std::move( accountId ) ); },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto account_balances( Chain chain, std::string accountId, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain, accountId = std::move( accountId ) ]( auto & impl ) mutable { return impl.do_account_balances( chain, std::move( accountId ) ); },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto account_limit_orders( Chain chain, std::string accountId, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain, accountId = std::move( accountId ) ]( auto & impl ) mutable { return impl.do_account_limit_orders( chain, std::move( accountId ) ); },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto order_book( Chain chain, std::string base, std::string quote, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain, base = std::move( base ), quote = std::move( quote ) ]( auto & impl ) mutable
            {
                return impl.do_order_book( chain, std::move( base ), std::move( quote ) );
            },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto market_limit_orders( Chain chain, std::string base, std::string quote, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain, base = std::move( base ), quote = std::move( quote ) ]( auto & impl ) mutable
            {
                return impl.do_market_limit_orders( chain, std::move( base ), std::move( quote ) );
            },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, boost::json::object ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto portfolio( Chain chain, std::string accountId, CompletionToken && token = { } )
    {
        return initiate< boost::json::object >
        (
            [ chain, accountId = std::move( accountId ) ]( auto & impl ) mutable { return impl.do_portfolio( chain, std::move( accountId ) ); },
            std::forward< CompletionToken >( token )
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, std::optional< boost::json::value > ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto account_history( Chain chain, std::string accountId, History::HistoryQuery query, CompletionToken && token = { } )
    {
        return initiate< std::optional< boost::json::value > >
        (
            [ chain, accountId = std::move( accountId ), query = std::move( query ) ]( auto & impl ) mutable
            {
                return impl.do_account_history( chain, std::move( accountId ), std::move( query ) );
            },
            std::forward< CompletionToken >( token )
        );
    }

    // The registry and the cache are safe to read from any thread.
    std::vector< std::string > current_nodes( Chain chain ) const { return _service->impl( ).current_nodes( chain ); }
    const Cache::CacheStore & cache( ) const { return _service->impl( ).cache( ); }

private:
    // Runs the impl coroutine on the gateway thread, the handler completes on its own associated executor.
    template< class ResultType, class OperationFn, class CompletionToken >
    auto initiate( OperationFn operationFn, CompletionToken && token )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, ResultType ) >
        (
            [ this, operationFn = std::move( operationFn ) ]< class Handler >( Handler && handler ) mutable
            {
                boost::asio::co_spawn
                (
                    _service->get_executor( ),
                    operationFn( _service->impl( ) ),
                    std::forward< Handler >( handler )
                );
            },
            token
        );
    }

    Service * _service;
};

} // namespace Btsgate
