#pragma once

#include "btsgate/Chain/ChainTypes.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Btsgate
{
namespace Cache
{

// Precomputed documents, refreshed out of band.
enum class CacheFile : uint8_t
{
    all_assets,
    pools,
    all_pools,
    fees,
    market_search,
    min_bitassets,
    offers,
    dynamic_data
};

std::string_view cache_file_name( CacheFile cacheFile );

// Read-only view over each chain's cache documents, immutable once constructed.
class CacheStore
{
public:
    using ChainDocuments = std::map< CacheFile, boost::json::value >;

    explicit CacheStore( std::map< Chain, ChainDocuments > documents );

    // Missing files mean no data, a file that fails to parse is a ConfigurationError.
    static CacheStore load( const std::map< Chain, std::filesystem::path > & dataDirectories );

    // Nullopt when the file was not present.
    std::optional< boost::json::value > document( Chain chain, CacheFile cacheFile ) const;

    std::optional< boost::json::value > asset( Chain chain, std::string_view assetId ) const;
    std::optional< boost::json::value > pool( Chain chain, std::string_view poolId ) const;

    // Accepts either the asset id "1.3.N" or the dynamic data id "2.3.N".
    std::optional< boost::json::value > dynamic_data( Chain chain, std::string_view id ) const;

    // Known assets in request order, unknown ids are skipped.
    boost::json::array assets( Chain chain, const std::vector< std::string > & assetIds ) const;

    constexpr std::string_view name( ) const & { return "CacheStore"; }

private:
    // Linear scan of an array document for the element with a matching "id".
    std::optional< boost::json::value > find_by_id( Chain chain, CacheFile cacheFile, std::string_view id ) const;

    std::map< Chain, ChainDocuments > _documents;
};

} // namespace Cache
} // namespace Btsgate
