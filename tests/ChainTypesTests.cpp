#include "btsgate/Chain/ChainTypes.hpp"
#include "btsgate/Gateway/GatewayTypes.hpp"
#include "btsgate/History/HistoryClient/HistoryClient.hpp"

#include "btsgate/Util/StringEncode.hpp"
#include "btsgate/Util/Utils.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace Btsgate;

namespace
{

// Written to a fresh file under the temp directory, removed on destruction.
class TempFile
{
public:
    TempFile( const std::string & fileName, const std::string & contents )
        : _path( std::filesystem::temp_directory_path( ) / fileName )
    {
        std::ofstream file( _path );
        file << contents;
    }

    ~TempFile( )
    {
        std::error_code errorCode;
        std::filesystem::remove( _path, errorCode );
    }

    const std::filesystem::path & path( ) const { return _path; }

private:
    std::filesystem::path _path;
};

} // namespace

TEST_CASE( "Chain names parse literally", "[chain]" )
{
    REQUIRE( parse_chain( "bitshares" ) == Chain::bitshares );
    REQUIRE( parse_chain( "bitshares_testnet" ) == Chain::bitshares_testnet );
    REQUIRE_THROWS_AS( parse_chain( "BitShares" ), ValidationError );
    REQUIRE_THROWS_AS( parse_chain( "" ), ValidationError );

    REQUIRE( chain_tag( Chain::bitshares ) == "BTS" );
    REQUIRE( chain_tag( Chain::bitshares_testnet ) == "TEST" );
}

TEST_CASE( "Node urls split into host, port and target", "[chain]" )
{
    auto secure = parse_node_endpoint( "wss://node.xbts.io/ws" );
    REQUIRE( secure.secure );
    REQUIRE( secure.host == "node.xbts.io" );
    REQUIRE( secure.service == "443" );
    REQUIRE( secure.target == "/ws" );

    auto plain = parse_node_endpoint( "ws://127.0.0.1:8090" );
    REQUIRE_FALSE( plain.secure );
    REQUIRE( plain.host == "127.0.0.1" );
    REQUIRE( plain.service == "8090" );
    REQUIRE( plain.target == "/" );

    REQUIRE_THROWS_AS( parse_node_endpoint( "https://node.xbts.io" ), ConfigurationError );
    REQUIRE_THROWS_AS( parse_node_endpoint( "wss://:443/ws" ), ConfigurationError );
    REQUIRE_THROWS_AS( parse_node_endpoint( "wss://host:port/ws" ), ConfigurationError );
}

TEST_CASE( "Uri component encoding matches encodeURIComponent", "[encode]" )
{
    REQUIRE( enc_uri_component( "abc-_.!~*'()XYZ09" ) == "abc-_.!~*'()XYZ09" );
    REQUIRE( enc_uri_component( "{\"a\": [1,2]}" ) == "%7B%22a%22%3A%20%5B1%2C2%5D%7D" );
    REQUIRE( enc_uri_component( "\xC3\xA9" ) == "%C3%A9" );

    REQUIRE( dec_uri_component( "%7B%22a%22%3A%20%5B1%2C2%5D%7D" ) == "{\"a\": [1,2]}" );
    REQUIRE( dec_uri_component( "%c3%a9" ) == "\xC3\xA9" );
    REQUIRE_THROWS_AS( dec_uri_component( "%4" ), BtsgateError );
    REQUIRE_THROWS_AS( dec_uri_component( "%zz" ), BtsgateError );
}

TEST_CASE( "History target fills defaults and encodes overrides", "[history]" )
{
    REQUIRE
    (
        History::build_history_target( "1.2.100", { } ) ==
        "/openexplorer/es/account_history?account_id=1.2.100&from_=0&size=100&from_date=2015-10-10"
        "&to_date=now&sort_by=-operation_id_num&type=data&agg_field=operation_type"
    );

    History::HistoryQuery query{ .size = "10", .toDate = "2024-01-01 00:00" };
    auto target = History::build_history_target( "1.2.100", query );
    REQUIRE( target.find( "&size=10&" ) != std::string::npos );
    REQUIRE( target.find( "&to_date=2024-01-01%2000%3A00&" ) != std::string::npos );
}

TEST_CASE( "Gateway config loads both chains", "[config]" )
{
    TempFile configFile
    (
        "btsgate_config_test.json",
        R"({
            "requestTimeoutMs": 5000,
            "chains": {
                "bitshares": { "nodes": [ "wss://a/ws", "wss://b/ws" ], "historyHost": "api.bitshares.ws", "dataDirectory": "data/bitshares" },
                "bitshares_testnet": { "nodes": [ "wss://t/ws" ], "historyHost": "api.testnet.bitshares.ws", "dataDirectory": "data/bitshares_testnet" }
            }
        })"
    );

    auto config = load_gateway_config( configFile.path( ) );

    REQUIRE( config.requestTimeout == std::chrono::milliseconds( 5000 ) );
    REQUIRE( config.connectTimeout == std::chrono::milliseconds( 10000 ) );
    REQUIRE( config.appName == "Static Bitshares Astro web app" );
    REQUIRE( config.chains.at( Chain::bitshares ).nodes == std::vector< std::string >{ "wss://a/ws", "wss://b/ws" } );
    REQUIRE( config.history_hosts( ).at( Chain::bitshares_testnet ) == "api.testnet.bitshares.ws" );
}

TEST_CASE( "Gateway config rejects missing chains and empty node lists", "[config]" )
{
    TempFile missingChain
    (
        "btsgate_config_missing_chain.json",
        R"({ "chains": { "bitshares": { "nodes": [ "wss://a/ws" ], "historyHost": "h", "dataDirectory": "d" } } })"
    );
    REQUIRE_THROWS_AS( load_gateway_config( missingChain.path( ) ), ConfigurationError );

    TempFile emptyNodes
    (
        "btsgate_config_empty_nodes.json",
        R"({ "chains": {
            "bitshares": { "nodes": [ ], "historyHost": "h", "dataDirectory": "d" },
            "bitshares_testnet": { "nodes": [ "wss://t/ws" ], "historyHost": "h", "dataDirectory": "d" } } })"
    );
    REQUIRE_THROWS_AS( load_gateway_config( emptyNodes.path( ) ), ConfigurationError );

    TempFile badUrl
    (
        "btsgate_config_bad_url.json",
        R"({ "chains": {
            "bitshares": { "nodes": [ "http://a" ], "historyHost": "h", "dataDirectory": "d" },
            "bitshares_testnet": { "nodes": [ "wss://t/ws" ], "historyHost": "h", "dataDirectory": "d" } } })"
    );
    REQUIRE_THROWS_AS( load_gateway_config( badUrl.path( ) ), ConfigurationError );

    REQUIRE_THROWS_AS( load_gateway_config( "/nonexistent/btsgate.json" ), ConfigurationError );
}
