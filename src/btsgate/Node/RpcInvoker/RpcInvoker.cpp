#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

#include <magic_enum/magic_enum.hpp>

namespace Btsgate
{
namespace Node
{

boost::asio::awaitable< boost::json::value > RpcInvoker::do_call
(
    NodeSession & session,
    NodeApi api,
    std::string method,
    boost::json::array params
)
{
    auto apiId = session.api_id( api );
    if ( !apiId )
    {
        BTSGATE_LOG_ERROR( _logger )
            << fmt::format( "[{}][{}] No {} api for {}", name( ), session.endpoint( ), magic_enum::enum_name( api ), method );
        throw ApiUnavailableError( fmt::format( "no {}_api", magic_enum::enum_name( api ) ) );
    }

    co_return co_await session.do_call( *apiId, std::move( method ), std::move( params ) );
}

} // namespace Node
} // namespace Btsgate
