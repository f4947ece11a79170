#include "btsgate/Node/RpcInvoker/GrapheneMessage.hpp"

namespace Btsgate
{
namespace Node
{

namespace
{

boost::json::array to_json_array( const std::vector< std::string > & values )
{
    boost::json::array jsonArray;
    jsonArray.reserve( values.size( ) );
    for ( const auto & value : values )
    {
        jsonArray.emplace_back( value );
    }
    return jsonArray;
}

} // namespace

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetObjectsRequest & request )
{
    boost::json::array params;
    params.emplace_back( to_json_array( request.ids ) );
    params.emplace_back( request.subscribe );
    jsonValue = std::move( params );
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetAccountsRequest & request )
{
    boost::json::array params;
    params.emplace_back( to_json_array( request.accountNamesOrIds ) );
    jsonValue = std::move( params );
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetFullAccountsRequest & request )
{
    boost::json::array params;
    params.emplace_back( to_json_array( request.accountNamesOrIds ) );
    params.emplace_back( request.subscribe );
    jsonValue = std::move( params );
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetAccountBalancesRequest & request )
{
    boost::json::array params;
    params.emplace_back( request.accountId );
    params.emplace_back( to_json_array( request.assetIds ) );
    jsonValue = std::move( params );
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetLimitOrdersByAccountRequest & request )
{
    jsonValue = boost::json::array{ request.accountId, request.limit };
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetOrderBookRequest & request )
{
    jsonValue = boost::json::array{ request.base, request.quote, request.depth };
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetLimitOrdersRequest & request )
{
    jsonValue = boost::json::array{ request.base, request.quote, request.limit };
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetDynamicGlobalPropertiesRequest & )
{
    jsonValue = boost::json::array{ };
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetRequiredFeesRequest & request )
{
    boost::json::array params;
    params.emplace_back( request.operations );
    params.emplace_back( request.feeAssetId );
    jsonValue = std::move( params );
}

} // namespace Node
} // namespace Btsgate
