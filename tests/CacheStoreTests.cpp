#include "btsgate/Cache/CacheStore/CacheStore.hpp"

#include "btsgate/Util/JsonUtils.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/json/parse.hpp>

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace Btsgate;
using namespace Btsgate::Cache;

namespace
{

// Cache directory under the temp directory, removed on destruction.
class TempCacheDirectory
{
public:
    explicit TempCacheDirectory( const std::string & name )
        : _path( std::filesystem::temp_directory_path( ) / name )
    {
        std::filesystem::remove_all( _path );
        std::filesystem::create_directories( _path );
    }

    ~TempCacheDirectory( )
    {
        std::error_code errorCode;
        std::filesystem::remove_all( _path, errorCode );
    }

    void write( CacheFile cacheFile, const std::string & contents ) const
    {
        std::ofstream file( _path / cache_file_name( cacheFile ) );
        file << contents;
    }

    const std::filesystem::path & path( ) const { return _path; }

private:
    std::filesystem::path _path;
};

std::string id_of( const boost::json::value & entry )
{
    return std::string( as_string_view( entry.at( "id" ).as_string( ) ) );
}

} // namespace

TEST_CASE( "Cache lookups by id", "[cache]" )
{
    TempCacheDirectory directory( "btsgate_cache_lookup" );
    directory.write( CacheFile::all_assets, R"([ { "id": "1.3.0", "symbol": "BTS" }, { "id": "1.3.113", "symbol": "CNY" } ])" );
    directory.write( CacheFile::all_pools, R"([ { "id": "1.19.0", "asset_a": "1.3.0", "asset_b": "1.3.113" } ])" );
    directory.write( CacheFile::dynamic_data, R"([ { "id": "2.3.113", "current_supply": "1000" } ])" );

    auto cache = CacheStore::load( { { Chain::bitshares, directory.path( ) } } );

    REQUIRE( id_of( *cache.asset( Chain::bitshares, "1.3.113" ) ) == "1.3.113" );
    REQUIRE_FALSE( cache.asset( Chain::bitshares, "1.3.9999" ) );
    REQUIRE_FALSE( cache.asset( Chain::bitshares_testnet, "1.3.0" ) );

    REQUIRE( id_of( *cache.pool( Chain::bitshares, "1.19.0" ) ) == "1.19.0" );
    REQUIRE_FALSE( cache.pool( Chain::bitshares, "1.19.1" ) );

    // Both the asset id and the dynamic data id resolve.
    REQUIRE( id_of( *cache.dynamic_data( Chain::bitshares, "1.3.113" ) ) == "2.3.113" );
    REQUIRE( id_of( *cache.dynamic_data( Chain::bitshares, "2.3.113" ) ) == "2.3.113" );
    REQUIRE_FALSE( cache.dynamic_data( Chain::bitshares, "1.3.0" ) );

    auto assets = cache.assets( Chain::bitshares, { "1.3.113", "1.3.404", "1.3.0" } );
    REQUIRE( assets.size( ) == 2 );
    REQUIRE( id_of( assets[ 0 ] ) == "1.3.113" );
    REQUIRE( id_of( assets[ 1 ] ) == "1.3.0" );
}

TEST_CASE( "Missing cache files mean no data", "[cache]" )
{
    TempCacheDirectory directory( "btsgate_cache_missing" );
    directory.write( CacheFile::fees, R"({ "transfer": { "fee": 86869 } })" );

    auto cache = CacheStore::load
    (
        {
            { Chain::bitshares, directory.path( ) },
            { Chain::bitshares_testnet, directory.path( ) / "absent" }
        }
    );

    REQUIRE( cache.document( Chain::bitshares, CacheFile::fees ) == boost::json::parse( R"({ "transfer": { "fee": 86869 } })" ) );
    REQUIRE_FALSE( cache.document( Chain::bitshares, CacheFile::offers ) );
    REQUIRE_FALSE( cache.document( Chain::bitshares_testnet, CacheFile::fees ) );
    REQUIRE( cache.assets( Chain::bitshares, { "1.3.0" } ).empty( ) );
}

TEST_CASE( "Malformed cache files fail the load", "[cache]" )
{
    TempCacheDirectory directory( "btsgate_cache_malformed" );
    directory.write( CacheFile::offers, "[ { \"id\": " );

    REQUIRE_THROWS_AS( CacheStore::load( { { Chain::bitshares, directory.path( ) } } ), ConfigurationError );
}
