#include "FakeNodeConnection.hpp"

#include "btsgate/Gateway/Gateway.hpp"
#include "btsgate/Gateway/GatewayTypes.hpp"
#include "btsgate/Http/HttpServer/HttpRouter.hpp"
#include "btsgate/Transaction/TransactionDraft.hpp"

#include "btsgate/Util/JsonUtils.hpp"

#include <boost/beast/http/field.hpp>

#include <boost/json/parse.hpp>

#include <catch2/catch.hpp>

using namespace Btsgate;
using namespace Btsgate::Test;

namespace beast = boost::beast;

namespace
{

GatewayConfig test_config( )
{
    GatewayConfig config;
    config.appName = "Router test";
    config.chains.emplace
    (
        Chain::bitshares,
        ChainConfig{ .nodes = { "wss://x", "wss://y" }, .historyHost = "history.invalid", .dataDirectory = "/nonexistent/btsgate/bitshares" }
    );
    config.chains.emplace
    (
        Chain::bitshares_testnet,
        ChainConfig{ .nodes = { "wss://t1" }, .historyHost = "history.invalid", .dataDirectory = "/nonexistent/btsgate/testnet" }
    );
    return config;
}

struct RouterFixture
{
    RouterFixture( )
        : node( std::make_shared< FakeNode >( ) )
        , gateway( ioContext, test_config( ), make_fake_factory( node ) )
        , router( gateway )
    {
        node->methods[ "get_objects" ] = [ ]( const boost::json::array & params ) -> boost::json::value
        {
            boost::json::array objects;
            for ( const auto & id : params.at( 0 ).as_array( ) )
            {
                if ( id.as_string( ) == "missing" )
                {
                    objects.emplace_back( nullptr );
                }
                else
                {
                    objects.emplace_back( boost::json::object{ { "id", id } } );
                }
            }
            return objects;
        };
        node->methods[ "get_accounts" ] = [ ]( const boost::json::array & ) -> boost::json::value
        {
            return boost::json::array{ nullptr };
        };
    }

    Http::HttpResponse route( beast::http::verb verb, const std::string & target, std::string body = "" )
    {
        Http::HttpRequest request( verb, target, 11 );
        request.body( ) = std::move( body );
        request.prepare_payload( );
        return run_coroutine( router.do_route( request ) );
    }

    // Declared first, destroyed last: stops the gateway thread.
    boost::asio::io_context ioContext;

    std::shared_ptr< FakeNode > node;
    Gateway gateway;
    Http::HttpRouter router;
};

} // namespace

TEST_CASE( "Failures map to response statuses", "[http]" )
{
    using beast::http::status;

    REQUIRE( Http::http_status_for( std::make_exception_ptr( ValidationError( "bad" ) ) ) == status::bad_request );
    REQUIRE( Http::http_status_for( std::make_exception_ptr( ConnectivityError( "down" ) ) ) == status::service_unavailable );
    REQUIRE( Http::http_status_for( std::make_exception_ptr( ApiUnavailableError( "no api" ) ) ) == status::service_unavailable );
    REQUIRE( Http::http_status_for( std::make_exception_ptr( RemoteCallError( "assert" ) ) ) == status::bad_gateway );
    REQUIRE( Http::http_status_for( std::make_exception_ptr( std::runtime_error( "boom" ) ) ) == status::internal_server_error );
    REQUIRE( Http::http_status_for( std::make_exception_ptr( Http::HttpError( status::not_found, "gone" ) ) ) == status::not_found );

    auto stepError = Transaction::TransactionStepError
    (
        Transaction::TransactionStep::compute_fees,
        std::make_exception_ptr( RemoteCallError( "fees" ) ),
        "compute_fees failed: fees"
    );
    REQUIRE( Http::http_status_for( std::make_exception_ptr( stepError ) ) == status::bad_gateway );
}

TEST_CASE( "Paths and queries are percent-decoded", "[http]" )
{
    REQUIRE( Http::split_path( "/api//accountLookup/bitshares/some%20one/" ) == std::vector< std::string >{ "api", "accountLookup", "bitshares", "some one" } );
    REQUIRE( Http::split_path( "/" ).empty( ) );
    REQUIRE_THROWS_AS( Http::split_path( "/api/%zz" ), ValidationError );

    auto query = Http::parse_query( "size=10&to_date=2024-01-01%2000%3A00&flag" );
    REQUIRE( query.at( "size" ) == "10" );
    REQUIRE( query.at( "to_date" ) == "2024-01-01 00:00" );
    REQUIRE( query.at( "flag" ).empty( ) );
}

TEST_CASE_METHOD( RouterFixture, "Current nodes reports the registry order", "[http]" )
{
    auto response = route( beast::http::verb::get, "/state/currentNodes/bitshares" );

    REQUIRE( response.result( ) == beast::http::status::ok );
    REQUIRE( response[ beast::http::field::content_type ] == "application/json" );
    REQUIRE( boost::json::parse( response.body( ) ) == boost::json::parse( R"([ "wss://x", "wss://y" ])" ) );
}

TEST_CASE_METHOD( RouterFixture, "Unknown routes and methods are rejected", "[http]" )
{
    REQUIRE( route( beast::http::verb::get, "/api/unknown/bitshares" ).result( ) == beast::http::status::not_found );
    REQUIRE( route( beast::http::verb::post, "/state/currentNodes/bitshares" ).result( ) == beast::http::status::method_not_allowed );

    auto badChain = route( beast::http::verb::get, "/state/currentNodes/nowhere" );
    REQUIRE( badChain.result( ) == beast::http::status::bad_request );
    REQUIRE( badChain[ beast::http::field::content_type ] == "text/plain" );
    REQUIRE( badChain.body( ).starts_with( "Error: " ) );
}

TEST_CASE_METHOD( RouterFixture, "Object lists are validated before connecting", "[http]" )
{
    REQUIRE( route( beast::http::verb::post, "/api/getObjects/bitshares" ).result( ) == beast::http::status::bad_request );
    REQUIRE( route( beast::http::verb::post, "/api/getObjects/bitshares", "[]" ).result( ) == beast::http::status::bad_request );
    REQUIRE( route( beast::http::verb::post, "/api/getObjects/bitshares", "{ not json" ).result( ) == beast::http::status::bad_request );
    REQUIRE( route( beast::http::verb::get, "/api/orderBook/bitshares/USD/1.3.0" ).result( ) == beast::http::status::bad_request );

    REQUIRE( node->connectAttempts.empty( ) );
}

TEST_CASE_METHOD( RouterFixture, "Objects are fetched through the gateway", "[http]" )
{
    auto response = route( beast::http::verb::post, "/api/getObjects/bitshares", R"([ "1.2.1", "missing", "1.2.2" ])" );

    REQUIRE( response.result( ) == beast::http::status::ok );
    REQUIRE( boost::json::parse( response.body( ) ) == boost::json::parse( R"([ { "id": "1.2.1" }, { "id": "1.2.2" } ])" ) );
    REQUIRE( node->closeCount == 1 );
}

TEST_CASE_METHOD( RouterFixture, "Absent results are not found", "[http]" )
{
    auto response = route( beast::http::verb::get, "/api/accountLookup/bitshares/nobody" );

    REQUIRE( response.result( ) == beast::http::status::not_found );
    REQUIRE( response.body( ) == "Error: Account not found" );
}

TEST_CASE_METHOD( RouterFixture, "Unreachable nodes are service unavailable", "[http]" )
{
    node->unreachable = { "wss://x" };

    auto response = route( beast::http::verb::get, "/api/fullAccount/bitshares/1.2.100" );

    REQUIRE( response.result( ) == beast::http::status::service_unavailable );
    REQUIRE( gateway.current_nodes( Chain::bitshares ) == std::vector< std::string >{ "wss://y", "wss://x" } );
}

TEST_CASE_METHOD( RouterFixture, "Failed deeplink builds report the remote failure", "[http]" )
{
    node->methods[ "get_dynamic_global_properties" ] = [ ]( const boost::json::array & ) -> boost::json::value
    {
        throw RemoteCallError( "Database lookup failed" );
    };

    auto response = route( beast::http::verb::post, "/api/deeplink/bitshares/transfer", R"([ { "from": "1.2.1", "to": "1.2.2" } ])" );

    REQUIRE( response.result( ) == beast::http::status::bad_gateway );
    REQUIRE( response.body( ) == "Error: fetch_reference_block failed: Database lookup failed" );
    REQUIRE( node->closeCount == 1 );

    REQUIRE( route( beast::http::verb::post, "/api/deeplink/bitshares/fill_order", "[ { } ]" ).result( ) == beast::http::status::bad_request );
}

TEST_CASE_METHOD( RouterFixture, "Cache routes without data are not found", "[http]" )
{
    REQUIRE( route( beast::http::verb::get, "/cache/allassets/bitshares" ).result( ) == beast::http::status::not_found );
    REQUIRE( route( beast::http::verb::get, "/cache/asset/bitshares/1.3.0" ).result( ) == beast::http::status::not_found );

    auto assets = route( beast::http::verb::post, "/cache/assets/bitshares", R"([ "1.3.0" ])" );
    REQUIRE( assets.result( ) == beast::http::status::ok );
    REQUIRE( assets.body( ) == "[]" );
}

TEST_CASE_METHOD( RouterFixture, "Localhost origins are allowed", "[http]" )
{
    Http::HttpRequest request( beast::http::verb::options, "/api/getObjects/bitshares", 11 );
    request.set( beast::http::field::origin, "http://localhost:8080" );

    auto response = run_coroutine( router.do_route( request ) );

    REQUIRE( response.result( ) == beast::http::status::no_content );
    REQUIRE( response[ beast::http::field::access_control_allow_origin ] == "http://localhost:8080" );

    Http::HttpRequest foreign( beast::http::verb::get, "/state/currentNodes/bitshares", 11 );
    foreign.set( beast::http::field::origin, "https://example.com" );
    auto foreignResponse = run_coroutine( router.do_route( foreign ) );

    REQUIRE( foreignResponse.result( ) == beast::http::status::ok );
    REQUIRE( foreignResponse.count( beast::http::field::access_control_allow_origin ) == 0 );
}
