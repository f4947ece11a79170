#include "btsgate/Cache/CacheStore/CacheStore.hpp"

#include "btsgate/Util/JsonUtils.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/json/parse.hpp>

#include <magic_enum/magic_enum.hpp>

#include <simdjson.h>

#include <fmt/core.h>

namespace Btsgate
{
namespace Cache
{

std::string_view cache_file_name( CacheFile cacheFile )
{
    switch ( cacheFile )
    {
        case CacheFile::all_assets: return "allAssets.json";
        case CacheFile::pools: return "pools.json";
        case CacheFile::all_pools: return "allPools.json";
        case CacheFile::fees: return "fees.json";
        case CacheFile::market_search: return "marketSearch.json";
        case CacheFile::min_bitassets: return "minBitassets.json";
        case CacheFile::offers: return "offers.json";
        case CacheFile::dynamic_data: return "dynamicData.json";
    }
    throw BtsgateError( "Invalid cache file" );
}

CacheStore::CacheStore( std::map< Chain, ChainDocuments > documents )
    : _documents( std::move( documents ) )
{ }

CacheStore CacheStore::load( const std::map< Chain, std::filesystem::path > & dataDirectories )
{
    std::map< Chain, ChainDocuments > documents;
    for ( const auto & [ chain, dataDirectory ] : dataDirectories )
    {
        auto & chainDocuments = documents[ chain ];
        for ( auto cacheFile : magic_enum::enum_values< CacheFile >( ) )
        {
            auto path = dataDirectory / cache_file_name( cacheFile );

            std::error_code errorCode;
            if ( !std::filesystem::is_regular_file( path, errorCode ) )
            {
                BTSGATE_LOG_INFO_GLOBAL( ) << fmt::format( "[CacheStore][{}] No cache file: {}", chain_name( chain ), path.string( ) );
                continue;
            }

            simdjson::padded_string fileContents;
            if ( auto loadError = simdjson::padded_string::load( path.string( ) ).get( fileContents ); loadError )
            {
                throw ConfigurationError( fmt::format( "Couldn't read {}: {}", path.string( ), simdjson::error_message( loadError ) ) );
            }

            try
            {
                chainDocuments.emplace( cacheFile, boost::json::parse( std::string_view( fileContents ) ) );
            }
            catch ( const std::exception & ex )
            {
                throw ConfigurationError( fmt::format( "Couldn't parse {}: {}", path.string( ), ex.what( ) ) );
            }
        }

        BTSGATE_LOG_INFO_GLOBAL( )
            << fmt::format( "[CacheStore][{}] Loaded {} cache files from {}", chain_name( chain ), chainDocuments.size( ), dataDirectory.string( ) );
    }

    return CacheStore( std::move( documents ) );
}

std::optional< boost::json::value > CacheStore::document( Chain chain, CacheFile cacheFile ) const
{
    auto findChain = _documents.find( chain );
    if ( findChain == _documents.end( ) )
    {
        return std::nullopt;
    }
    auto findDocument = findChain->second.find( cacheFile );
    if ( findDocument == findChain->second.end( ) )
    {
        return std::nullopt;
    }
    return findDocument->second;
}

std::optional< boost::json::value > CacheStore::find_by_id( Chain chain, CacheFile cacheFile, std::string_view id ) const
{
    auto findChain = _documents.find( chain );
    if ( findChain == _documents.end( ) )
    {
        return std::nullopt;
    }
    auto findDocument = findChain->second.find( cacheFile );
    if ( findDocument == findChain->second.end( ) || !findDocument->second.is_array( ) )
    {
        return std::nullopt;
    }

    for ( const auto & entry : findDocument->second.get_array( ) )
    {
        const auto * entryObject = entry.if_object( );
        if ( entryObject == nullptr )
        {
            continue;
        }
        const auto * entryId = entryObject->if_contains( "id" );
        if ( entryId && entryId->is_string( ) && as_string_view( entryId->get_string( ) ) == id )
        {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional< boost::json::value > CacheStore::asset( Chain chain, std::string_view assetId ) const
{
    return find_by_id( chain, CacheFile::all_assets, assetId );
}

std::optional< boost::json::value > CacheStore::pool( Chain chain, std::string_view poolId ) const
{
    return find_by_id( chain, CacheFile::all_pools, poolId );
}

std::optional< boost::json::value > CacheStore::dynamic_data( Chain chain, std::string_view id ) const
{
    // Asset 1.3.N keeps its supply figures in 2.3.N.
    constexpr std::string_view assetPrefix = "1.3.";
    if ( id.starts_with( assetPrefix ) )
    {
        return find_by_id( chain, CacheFile::dynamic_data, "2.3." + std::string( id.substr( assetPrefix.size( ) ) ) );
    }
    return find_by_id( chain, CacheFile::dynamic_data, id );
}

boost::json::array CacheStore::assets( Chain chain, const std::vector< std::string > & assetIds ) const
{
    boost::json::array result;
    for ( const auto & assetId : assetIds )
    {
        if ( auto found = asset( chain, assetId ) )
        {
            result.push_back( std::move( *found ) );
        }
    }
    return result;
}

} // namespace Cache
} // namespace Btsgate
