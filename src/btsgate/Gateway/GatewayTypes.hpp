#pragma once

#include "btsgate/Chain/ChainTypes.hpp"

#include "btsgate/Util/JsonUtils.hpp"

#include <simdjson.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace Btsgate
{

struct GatewayConfig
{
    friend GatewayConfig tag_invoke( json_to_tag< GatewayConfig >, simdjson::ondemand::value jsonValue );

    std::chrono::milliseconds connectTimeout{ 10000 };
    std::chrono::milliseconds requestTimeout{ 30000 };
    std::string appName = "Static Bitshares Astro web app";

    std::map< Chain, ChainConfig > chains;

    std::map< Chain, std::vector< std::string > > endpoints( ) const;
    std::map< Chain, std::string > history_hosts( ) const;
    std::map< Chain, std::filesystem::path > data_directories( ) const;
};

// Throws ConfigurationError when the file is unreadable, malformed, misses a chain or lists no nodes for one.
GatewayConfig load_gateway_config( const std::filesystem::path & configPath );

} // namespace Btsgate
