#pragma once

#include "btsgate/Node/NodeConnection/NodeConnection.hpp"

#include "btsgate/Util/Utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Btsgate
{
namespace Test
{

// Shared between a test and every connection its factory hands out.
struct FakeNode
{
    using MethodFn = std::function< boost::json::value( const boost::json::array & ) >;

    // Urls whose connect attempts fail.
    std::set< std::string > unreachable;
    bool grantDatabase = true;

    // Database and orders calls by method name, an unscripted method is a RemoteCallError.
    std::map< std::string, MethodFn > methods;

    std::vector< std::string > connectAttempts;
    std::vector< std::pair< std::string, boost::json::array > > calls;
    size_t closeCount = 0;

    size_t call_count( const std::string & method ) const
    {
        size_t count = 0;
        for ( const auto & [ calledMethod, _ ] : calls )
        {
            if ( calledMethod == method ) ++count;
        }
        return count;
    }
};

class FakeNodeConnection : public Node::NodeConnection
{
public:
    FakeNodeConnection( NodeEndpoint endpoint, std::shared_ptr< FakeNode > node )
        : _endpoint( std::move( endpoint ) )
        , _node( std::move( node ) )
    { }

    boost::asio::awaitable< void > do_connect( std::chrono::milliseconds ) override
    {
        _node->connectAttempts.push_back( _endpoint.url );
        if ( _node->unreachable.contains( _endpoint.url ) )
        {
            throw ConnectivityError( "connection refused" );
        }
        co_return;
    }

    boost::asio::awaitable< boost::json::value > do_call( uint64_t, std::string method, boost::json::array params ) override
    {
        if ( method == "login" )
        {
            co_return true;
        }
        if ( method == "database" )
        {
            if ( !_node->grantDatabase )
            {
                throw RemoteCallError( "Api database not available" );
            }
            co_return 2;
        }
        if ( method == "orders" )
        {
            co_return 3;
        }

        _node->calls.emplace_back( method, params );

        auto findMethod = _node->methods.find( method );
        if ( findMethod == _node->methods.end( ) )
        {
            throw RemoteCallError( "Unexpected call: " + method );
        }
        co_return findMethod->second( params );
    }

    boost::asio::awaitable< void > do_close( ) override
    {
        ++_node->closeCount;
        co_return;
    }

private:
    NodeEndpoint _endpoint;
    std::shared_ptr< FakeNode > _node;
};

inline Node::NodeConnectionFactory make_fake_factory( std::shared_ptr< FakeNode > node )
{
    return [ node ]( const NodeEndpoint & endpoint ) -> std::unique_ptr< Node::NodeConnection >
    {
        return std::make_unique< FakeNodeConnection >( endpoint, node );
    };
}

// Runs a coroutine to completion on a fresh io_context, rethrowing its error.
template< class ResultType >
ResultType run_coroutine( boost::asio::awaitable< ResultType > coroutine )
{
    boost::asio::io_context ioContext;
    auto future = boost::asio::co_spawn( ioContext, std::move( coroutine ), boost::asio::use_future );
    ioContext.run( );
    return future.get( );
}

} // namespace Test
} // namespace Btsgate
