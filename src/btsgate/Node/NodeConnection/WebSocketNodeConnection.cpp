#include "btsgate/Node/NodeConnection/WebSocketNodeConnection.hpp"

namespace Btsgate
{
namespace Node
{

NodeConnectionFactory make_websocket_connection_factory( boost::asio::io_context & ioContext, std::chrono::milliseconds requestTimeout )
{
    return [ &ioContext, requestTimeout ]( const NodeEndpoint & endpoint ) -> std::unique_ptr< NodeConnection >
    {
        if ( endpoint.secure )
        {
            return std::make_unique< SSLNodeConnection >( ioContext, endpoint, requestTimeout );
        }
        return std::make_unique< UnsecureNodeConnection >( ioContext, endpoint, requestTimeout );
    };
}

} // namespace Node
} // namespace Btsgate
