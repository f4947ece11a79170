#pragma once

#include "btsgate/Util/JsonUtils.hpp"
#include "btsgate/Util/Utils.hpp"

#include <simdjson.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Btsgate
{

// Network instances served by the gateway.
enum class Chain : uint8_t
{
    bitshares,
    bitshares_testnet
};

// Throws ValidationError for anything other than the two literal chain names.
Chain parse_chain( std::string_view text );

std::string_view chain_name( Chain chain );

// Network tag understood by the external wallet: "BTS" or "TEST".
std::string_view chain_tag( Chain chain );

struct NodeEndpoint
{
    std::string url;

    bool secure = false;
    std::string host;
    std::string service;
    std::string target;
};

// Parses "ws[s]://host[:port][/path]", throws ConfigurationError on malformed urls.
NodeEndpoint parse_node_endpoint( std::string_view url );

struct ChainConfig
{
    friend ChainConfig tag_invoke( json_to_tag< ChainConfig >, simdjson::ondemand::value jsonValue );

    std::vector< std::string > nodes;
    std::string historyHost;
    std::filesystem::path dataDirectory;
};

} // namespace Btsgate
