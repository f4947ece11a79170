#pragma once

#include "btsgate/Gateway/GatewayImpl.hpp"
#include "btsgate/Gateway/GatewayTypes.hpp"

#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>

#include <memory>
#include <thread>

namespace Btsgate
{

class GatewayService : public boost::asio::execution_context::service
{
public:
    // Constructor creates a thread to run a private io_service.
    GatewayService
    (
        boost::asio::execution_context & executionContext,
        GatewayConfig config,
        Node::NodeConnectionFactory connectionFactory
    )
        : boost::asio::execution_context::service( executionContext )
        , _work( boost::asio::require( _ioContext.get_executor( ),
                 boost::asio::execution::outstanding_work.tracked ) )
        , _impl( std::make_unique< GatewayImpl >( _ioContext, std::move( config ), std::move( connectionFactory ) ) )
        , _workThread( [ this ]( ){ return this->_ioContext.run( ); } )
    { }

    ~GatewayService( )
    {
        // Indicate that we have finished with the private io_context.
        // io_context::run( ) function will exit once all other work has completed.
        _work = boost::asio::any_io_executor( );
    }

    GatewayImpl & impl( ) { return *_impl; }

    boost::asio::io_context::executor_type get_executor( ) { return _ioContext.get_executor( ); }

    static inline boost::asio::execution_context::id id;

private:
    // Destroy all user-defined handler objects owned by the service.
    void shutdown( ) noexcept override { }

    // Private io_context running every node session, history request and transaction build.
    boost::asio::io_context _ioContext;
    // A work-tracking executor giving work for the private io_context to perform.
    boost::asio::any_io_executor _work;

    std::unique_ptr< GatewayImpl > _impl;

    // Declared last, the impl must exist before the thread starts running handlers.
    std::jthread _workThread;
};

} // namespace Btsgate
