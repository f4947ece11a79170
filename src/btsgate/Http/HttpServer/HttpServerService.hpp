#pragma once

#include "btsgate/Http/HttpServer/HttpRouter.hpp"

#include "btsgate/Gateway/Gateway.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <thread>

namespace Btsgate
{
namespace Http
{

class HttpServerService : public boost::asio::execution_context::service
{
public:
    // Constructor creates a thread to run a private io_service.
    HttpServerService
    (
        boost::asio::execution_context & executionContext,
        Gateway gateway,
        boost::asio::ip::tcp::endpoint listenEndpoint
    );

    ~HttpServerService( )
    {
        // Indicate that we have finished with the private io_context.
        // io_context::run( ) function will exit once all other work has completed.
        _work = boost::asio::any_io_executor( );
    }

    static inline boost::asio::execution_context::id id;

    constexpr std::string_view name( ) const & { return "HttpServer"; }

private:
    // The accept loop never runs out of work, stop it so the work thread can be joined.
    void shutdown( ) noexcept override
    {
        _ioContext.stop( );
    }

    boost::asio::awaitable< void > do_listen( boost::asio::ip::tcp::endpoint listenEndpoint );
    boost::asio::awaitable< void > do_session( boost::asio::ip::tcp::socket socket );

    // Private io_context accepting and serving client connections.
    boost::asio::io_context _ioContext;
    // A work-tracking executor giving work for the private io_context to perform.
    boost::asio::any_io_executor _work;

    boost::asio::ip::tcp::acceptor _tcpAcceptor;

    Gateway _gateway;
    HttpRouter _router;

    mutable BtsgateLogger _logger;

    // Declared last, the router must exist before the thread starts running handlers.
    std::jthread _workThread;
};

} // namespace Http
} // namespace Btsgate
