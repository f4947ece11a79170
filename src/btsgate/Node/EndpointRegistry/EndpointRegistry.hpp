#pragma once

#include "btsgate/Chain/ChainTypes.hpp"

#include "btsgate/Util/Logger.hpp"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Btsgate
{
namespace Node
{

// Per-chain preference order of node urls, shared by every request for the process lifetime.
// Rotation moves the failed head to the back, nothing is ever evicted.
class EndpointRegistry
{
public:
    // Throws ConfigurationError when a chain has no endpoints.
    explicit EndpointRegistry( const std::map< Chain, std::vector< std::string > > & endpoints );

    std::string current_endpoint( Chain chain ) const;

    // Treats the current head as failed and returns the new head.
    std::string rotate( Chain chain );

    // Rotates only while failedUrl is still the head, so concurrent failures against one node rotate once.
    std::string rotate_if_current( Chain chain, const std::string & failedUrl );

    std::vector< std::string > snapshot( Chain chain ) const;

    constexpr std::string_view name( ) const & { return "EndpointRegistry"; }

private:
    struct ChainEndpoints
    {
        mutable std::mutex mutex;
        std::deque< std::string > endpoints;
    };

    ChainEndpoints & chain_endpoints( Chain chain ) const;

    std::string rotate_locked( Chain chain, ChainEndpoints & chainEndpoints );

    std::map< Chain, std::unique_ptr< ChainEndpoints > > _chains;

    mutable BtsgateLogger _logger;
};

} // namespace Node
} // namespace Btsgate
