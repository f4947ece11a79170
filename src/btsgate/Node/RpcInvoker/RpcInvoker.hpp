#pragma once

#include "btsgate/Node/RpcInvoker/GrapheneMessage.hpp"
#include "btsgate/Node/SessionManager/NodeSession.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <string>

namespace Btsgate
{
namespace Node
{

// One-shot remote calls over an open session, no retries.
// Results come back undecoded, a null result is returned as-is for the caller to interpret.
class RpcInvoker
{
public:
    // Throws ApiUnavailableError when the session was not granted the api.
    boost::asio::awaitable< boost::json::value > do_call
    (
        NodeSession & session,
        NodeApi api,
        std::string method,
        boost::json::array params
    );

    template< class RequestType >
    boost::asio::awaitable< boost::json::value > send_request( NodeSession & session, RequestType request )
    {
        auto params = boost::json::value_from( request );
        co_return co_await do_call
        (
            session,
            RequestType::api( ),
            std::string( RequestType::method_name( ) ),
            std::move( params.as_array( ) )
        );
    }

    constexpr std::string_view name( ) const & { return "RpcInvoker"; }

private:
    BtsgateLogger _logger;
};

} // namespace Node
} // namespace Btsgate
