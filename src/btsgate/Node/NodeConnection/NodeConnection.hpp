#pragma once

#include "btsgate/Chain/ChainTypes.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace Btsgate
{
namespace Node
{

// One transport-level connection to a node.
class NodeConnection
{
public:
    virtual ~NodeConnection( ) = default;

    // Throws ConnectivityError on failure or when the timeout elapses.
    virtual boost::asio::awaitable< void > do_connect( std::chrono::milliseconds timeout ) = 0;

    // Throws RemoteCallError when the node answers with an error, ConnectivityError when the transport fails.
    virtual boost::asio::awaitable< boost::json::value > do_call( uint64_t apiId, std::string method, boost::json::array params ) = 0;

    // Must tolerate repeated calls and never throw.
    virtual boost::asio::awaitable< void > do_close( ) = 0;
};

using NodeConnectionFactory = std::function< std::unique_ptr< NodeConnection >( const NodeEndpoint & ) >;

} // namespace Node
} // namespace Btsgate
