#include "FakeNodeConnection.hpp"

#include "btsgate/Node/EndpointRegistry/EndpointRegistry.hpp"
#include "btsgate/Node/ObjectBatcher/ObjectBatcher.hpp"
#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"
#include "btsgate/Node/SessionManager/SessionManager.hpp"
#include "btsgate/Query/ChainQuery/ChainQuery.hpp"
#include "btsgate/Query/PortfolioComposer/PortfolioComposer.hpp"

#include "btsgate/Util/JsonUtils.hpp"

#include <catch2/catch.hpp>

using namespace Btsgate;
using namespace Btsgate::Node;
using namespace Btsgate::Query;
using namespace Btsgate::Test;

namespace
{

boost::json::value balances( )
{
    return boost::json::array{ boost::json::object{ { "amount", 1000 }, { "asset_id", "1.3.0" } } };
}

boost::json::value limit_orders( )
{
    return boost::json::array{ boost::json::object{ { "id", "1.7.1" }, { "seller", "1.2.100" } } };
}

struct QueryFixture
{
    QueryFixture( )
        : node( std::make_shared< FakeNode >( ) )
        , registry( { { Chain::bitshares, { "wss://x", "wss://y" } }, { Chain::bitshares_testnet, { "wss://t1" } } } )
        , sessionManager( registry, make_fake_factory( node ), std::chrono::milliseconds( 1000 ) )
        , objectBatcher( rpcInvoker )
        , chainQuery( sessionManager, rpcInvoker, objectBatcher )
        , portfolioComposer( sessionManager, rpcInvoker )
    {
        node->methods[ "get_account_balances" ] = [ ]( const boost::json::array & ) -> boost::json::value { return balances( ); };
        node->methods[ "get_limit_orders_by_account" ] = [ ]( const boost::json::array & ) -> boost::json::value { return limit_orders( ); };
    }

    std::shared_ptr< FakeNode > node;
    EndpointRegistry registry;
    SessionManager sessionManager;
    RpcInvoker rpcInvoker;
    ObjectBatcher objectBatcher;
    ChainQuery chainQuery;
    PortfolioComposer portfolioComposer;
};

} // namespace

TEST_CASE( "Asset ids must be 1.3.N", "[query]" )
{
    REQUIRE_NOTHROW( validate_asset_id( "1.3.0" ) );
    REQUIRE_NOTHROW( validate_asset_id( "1.3.5589" ) );

    REQUIRE_THROWS_AS( validate_asset_id( "1.3." ), ValidationError );
    REQUIRE_THROWS_AS( validate_asset_id( "1.2.100" ), ValidationError );
    REQUIRE_THROWS_AS( validate_asset_id( "BTS" ), ValidationError );
    REQUIRE_THROWS_AS( validate_asset_id( "1.3.1x" ), ValidationError );
}

TEST_CASE_METHOD( QueryFixture, "Portfolio combines balances and orders over one session", "[composer]" )
{
    auto portfolio = run_coroutine( portfolioComposer.do_portfolio( Chain::bitshares, "1.2.100" ) );

    REQUIRE( portfolio.at( "balances" ) == balances( ) );
    REQUIRE( portfolio.at( "limitOrders" ) == limit_orders( ) );

    REQUIRE( node->connectAttempts.size( ) == 1 );
    REQUIRE( node->closeCount == 1 );

    // Balances first, then orders with the fixed limit.
    REQUIRE( node->calls.size( ) == 2 );
    REQUIRE( node->calls[ 0 ].first == "get_account_balances" );
    REQUIRE( node->calls[ 0 ].second.at( 1 ).as_array( ).empty( ) );
    REQUIRE( node->calls[ 1 ].first == "get_limit_orders_by_account" );
    REQUIRE( node->calls[ 1 ].second.at( 1 ).to_number< uint32_t >( ) == PortfolioComposer::LIMIT_ORDER_COUNT );
}

TEST_CASE_METHOD( QueryFixture, "Portfolio fails as a whole when orders fail", "[composer]" )
{
    node->methods[ "get_limit_orders_by_account" ] = [ ]( const boost::json::array & ) -> boost::json::value
    {
        throw RemoteCallError( "Unknown account" );
    };

    REQUIRE_THROWS_AS( run_coroutine( portfolioComposer.do_portfolio( Chain::bitshares, "1.2.100" ) ), RemoteCallError );
    REQUIRE( node->call_count( "get_account_balances" ) == 1 );
    REQUIRE( node->closeCount == 1 );
}

TEST_CASE_METHOD( QueryFixture, "Portfolio fails as a whole when balances are absent", "[composer]" )
{
    node->methods[ "get_account_balances" ] = [ ]( const boost::json::array & ) -> boost::json::value { return nullptr; };

    REQUIRE_THROWS_AS( run_coroutine( portfolioComposer.do_portfolio( Chain::bitshares, "1.2.100" ) ), RemoteCallError );
    REQUIRE( node->call_count( "get_limit_orders_by_account" ) == 0 );
    REQUIRE( node->closeCount == 1 );
}

TEST_CASE_METHOD( QueryFixture, "Account lookup returns the first match or nothing", "[query]" )
{
    node->methods[ "get_accounts" ] = [ ]( const boost::json::array & params ) -> boost::json::value
    {
        const auto & name = params.at( 0 ).as_array( ).at( 0 ).as_string( );
        if ( name == "nobody" )
        {
            return boost::json::array{ nullptr };
        }
        return boost::json::array{ boost::json::object{ { "id", "1.2.100" }, { "name", name } } };
    };

    auto account = run_coroutine( chainQuery.do_account_lookup( Chain::bitshares, "alice" ) );
    REQUIRE( account );
    REQUIRE( account->at( "id" ).as_string( ) == "1.2.100" );

    REQUIRE_FALSE( run_coroutine( chainQuery.do_account_lookup( Chain::bitshares, "nobody" ) ) );
    REQUIRE_THROWS_AS( run_coroutine( chainQuery.do_account_lookup( Chain::bitshares, "" ) ), ValidationError );
}

TEST_CASE_METHOD( QueryFixture, "Empty list results are not found", "[query]" )
{
    node->methods[ "get_full_accounts" ] = [ ]( const boost::json::array & ) -> boost::json::value { return boost::json::array{ }; };
    node->methods[ "get_account_balances" ] = [ ]( const boost::json::array & ) -> boost::json::value { return boost::json::array{ }; };

    REQUIRE_FALSE( run_coroutine( chainQuery.do_full_account( Chain::bitshares, "1.2.100" ) ) );
    REQUIRE_FALSE( run_coroutine( chainQuery.do_account_balances( Chain::bitshares, "1.2.100" ) ) );
    REQUIRE( run_coroutine( chainQuery.do_account_limit_orders( Chain::bitshares, "1.2.100" ) ) );
    REQUIRE( node->closeCount == 3 );
}

TEST_CASE_METHOD( QueryFixture, "Blocked accounts are only published on the main network", "[query]" )
{
    node->methods[ "get_accounts" ] = [ ]( const boost::json::array & params ) -> boost::json::value
    {
        REQUIRE( params.at( 0 ).as_array( ).at( 0 ).as_string( ) == ChainQuery::BLOCKED_ACCOUNTS_MANAGER );
        return boost::json::array{ boost::json::object{ { "id", "1.2.3601" } } };
    };

    REQUIRE( run_coroutine( chainQuery.do_blocked_accounts( Chain::bitshares ) ) );
    REQUIRE_THROWS_AS( run_coroutine( chainQuery.do_blocked_accounts( Chain::bitshares_testnet ) ), ValidationError );
    REQUIRE( node->connectAttempts.size( ) == 1 );
}

TEST_CASE_METHOD( QueryFixture, "Order book validates asset ids before connecting", "[query]" )
{
    node->methods[ "get_order_book" ] = [ ]( const boost::json::array & params ) -> boost::json::value
    {
        if ( params.at( 1 ).as_string( ) == "1.3.999" )
        {
            return nullptr;
        }
        return boost::json::object{ { "base", params.at( 0 ) }, { "quote", params.at( 1 ) }, { "bids", boost::json::array{ } } };
    };

    REQUIRE_THROWS_AS( run_coroutine( chainQuery.do_order_book( Chain::bitshares, "1.3.0", "USD" ) ), ValidationError );
    REQUIRE( node->connectAttempts.empty( ) );

    auto orderBook = run_coroutine( chainQuery.do_order_book( Chain::bitshares, "1.3.0", "1.3.113" ) );
    REQUIRE( orderBook );
    REQUIRE( node->calls.back( ).second.at( 2 ).to_number< uint32_t >( ) == 50 );

    REQUIRE_FALSE( run_coroutine( chainQuery.do_order_book( Chain::bitshares, "1.3.0", "1.3.999" ) ) );
}

TEST_CASE_METHOD( QueryFixture, "Market limit orders pass through", "[query]" )
{
    node->methods[ "get_limit_orders" ] = [ ]( const boost::json::array & ) -> boost::json::value { return limit_orders( ); };

    auto orders = run_coroutine( chainQuery.do_market_limit_orders( Chain::bitshares, "1.3.0", "1.3.113" ) );
    REQUIRE( orders );
    REQUIRE( *orders == limit_orders( ) );
    REQUIRE( node->calls.back( ).second.at( 2 ).to_number< uint32_t >( ) == 100 );

    REQUIRE_THROWS_AS( run_coroutine( chainQuery.do_market_limit_orders( Chain::bitshares, "1.2.0", "1.3.113" ) ), ValidationError );
}
