#include "btsgate/Query/ChainQuery/ChainQuery.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

namespace Btsgate
{
namespace Query
{

void validate_asset_id( std::string_view assetId )
{
    constexpr std::string_view assetPrefix = "1.3.";
    if
    (
        !assetId.starts_with( assetPrefix )
        || assetId.size( ) == assetPrefix.size( )
        || assetId.find_first_not_of( "0123456789", assetPrefix.size( ) ) != std::string_view::npos
    )
    {
        throw ValidationError( fmt::format( "Invalid asset id: {}", assetId ) );
    }
}

void validate_not_empty( std::string_view value, std::string_view what )
{
    if ( value.empty( ) )
    {
        throw ValidationError( fmt::format( "Missing {}", what ) );
    }
}

ChainQuery::ChainQuery( Node::SessionManager & sessionManager, Node::RpcInvoker & rpcInvoker, Node::ObjectBatcher & objectBatcher )
    : _sessionManager( sessionManager )
    , _rpcInvoker( rpcInvoker )
    , _objectBatcher( objectBatcher )
{ }

template< class RequestType >
boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_query_list
(
    Chain chain,
    RequestType request,
    std::optional< std::chrono::milliseconds > connectTimeout
)
{
    auto result = co_await _sessionManager.do_with_session< boost::json::value >
    (
        chain,
        [ this, request = std::move( request ) ]( Node::NodeSession & session ) -> boost::asio::awaitable< boost::json::value >
        {
            co_return co_await _rpcInvoker.send_request( session, request );
        },
        connectTimeout
    );

    if ( result.is_null( ) )
    {
        co_return std::nullopt;
    }
    if ( auto * resultList = result.if_array( ); resultList && resultList->empty( ) )
    {
        co_return std::nullopt;
    }

    co_return result;
}

boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_account_lookup( Chain chain, std::string searchInput )
{
    validate_not_empty( searchInput, "account name or id" );

    auto accounts = co_await do_query_list( chain, Node::GetAccountsRequest{ .accountNamesOrIds = { searchInput } } );
    if ( !accounts || !accounts->is_array( ) )
    {
        co_return std::nullopt;
    }

    auto & account = accounts->get_array( ).front( );
    if ( account.is_null( ) )
    {
        BTSGATE_LOG_DEBUG( _logger ) << fmt::format( "[{}][{}] Account not found: {}", name( ), chain_name( chain ), searchInput );
        co_return std::nullopt;
    }
    co_return std::move( account );
}

boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_blocked_accounts( Chain chain )
{
    if ( chain != Chain::bitshares )
    {
        throw ValidationError( fmt::format( "Blocked accounts are not published on {}", chain_name( chain ) ) );
    }

    co_return co_await do_query_list
    (
        chain,
        Node::GetAccountsRequest{ .accountNamesOrIds = { std::string( BLOCKED_ACCOUNTS_MANAGER ) } }
    );
}

boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_full_account( Chain chain, std::string accountId )
{
    validate_not_empty( accountId, "account id" );

    co_return co_await do_query_list( chain, Node::GetFullAccountsRequest{ .accountNamesOrIds = { accountId }, .subscribe = false } );
}

boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_account_balances( Chain chain, std::string accountId )
{
    validate_not_empty( accountId, "account id" );

    co_return co_await do_query_list( chain, Node::GetAccountBalancesRequest{ .accountId = accountId, .assetIds = { } } );
}

boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_account_limit_orders( Chain chain, std::string accountId )
{
    validate_not_empty( accountId, "account id" );

    co_return co_await do_query_list( chain, Node::GetLimitOrdersByAccountRequest{ .accountId = accountId, .limit = 100 } );
}

boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_order_book( Chain chain, std::string base, std::string quote )
{
    validate_asset_id( base );
    validate_asset_id( quote );

    auto orderBook = co_await _sessionManager.do_with_session< boost::json::value >
    (
        chain,
        [ this, &base, &quote ]( Node::NodeSession & session ) -> boost::asio::awaitable< boost::json::value >
        {
            co_return co_await _rpcInvoker.send_request( session, Node::GetOrderBookRequest{ .base = base, .quote = quote, .depth = 50 } );
        },
        ORDER_BOOK_CONNECT_TIMEOUT
    );

    if ( orderBook.is_null( ) )
    {
        co_return std::nullopt;
    }
    co_return orderBook;
}

boost::asio::awaitable< std::optional< boost::json::value > > ChainQuery::do_market_limit_orders( Chain chain, std::string base, std::string quote )
{
    validate_asset_id( base );
    validate_asset_id( quote );

    auto limitOrders = co_await _sessionManager.do_with_session< boost::json::value >
    (
        chain,
        [ this, &base, &quote ]( Node::NodeSession & session ) -> boost::asio::awaitable< boost::json::value >
        {
            co_return co_await _rpcInvoker.send_request( session, Node::GetLimitOrdersRequest{ .base = base, .quote = quote, .limit = 100 } );
        }
    );

    if ( limitOrders.is_null( ) )
    {
        co_return std::nullopt;
    }
    co_return limitOrders;
}

boost::asio::awaitable< boost::json::array > ChainQuery::do_fetch_objects( Chain chain, std::vector< std::string > ids )
{
    if ( ids.empty( ) )
    {
        throw ValidationError( "Missing object ids" );
    }
    for ( const auto & id : ids )
    {
        validate_not_empty( id, "object id" );
    }

    auto objects = co_await _sessionManager.do_with_session< std::vector< boost::json::value > >
    (
        chain,
        [ this, &ids ]( Node::NodeSession & session ) -> boost::asio::awaitable< std::vector< boost::json::value > >
        {
            co_return co_await _objectBatcher.do_fetch_objects( session, ids );
        }
    );

    boost::json::array result;
    result.reserve( objects.size( ) );
    for ( auto & object : objects )
    {
        result.push_back( std::move( object ) );
    }
    co_return result;
}

} // namespace Query
} // namespace Btsgate
