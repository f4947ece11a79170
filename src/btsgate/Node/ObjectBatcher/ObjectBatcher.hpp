#pragma once

#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"
#include "btsgate/Node/SessionManager/NodeSession.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/json/value.hpp>

#include <string>
#include <vector>

namespace Btsgate
{
namespace Node
{

// Splits large get_objects lookups into node-sized chunks.
class ObjectBatcher
{
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 50;

    explicit ObjectBatcher( RpcInvoker & rpcInvoker, size_t chunkSize = DEFAULT_CHUNK_SIZE );

    // Objects in input order with unknown ids dropped.
    // A failing chunk is logged and skipped, RemoteCallError "no objects retrievable" when nothing is left.
    boost::asio::awaitable< std::vector< boost::json::value > > do_fetch_objects( NodeSession & session, std::vector< std::string > ids );

    size_t chunk_size( ) const { return _chunkSize; }

    constexpr std::string_view name( ) const & { return "ObjectBatcher"; }

private:
    RpcInvoker & _rpcInvoker;
    size_t _chunkSize;

    BtsgateLogger _logger;
};

} // namespace Node
} // namespace Btsgate
