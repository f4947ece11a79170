#pragma once

#include "btsgate/Gateway/Gateway.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace Btsgate
{
namespace Http
{

template< typename Service >
class HttpServerServiceProvider
{
public:
    HttpServerServiceProvider
    (
        boost::asio::io_context & ioContext,
        Gateway gateway,
        boost::asio::ip::tcp::endpoint listenEndpoint
    )
        : _service( &boost::asio::make_service< Service >( ioContext, gateway, listenEndpoint ) )
    { }

private:
    Service * _service;
};

} // namespace Http
} // namespace Btsgate
