#pragma once

#include "btsgate/Node/SessionManager/NodeSession.hpp"

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Database and orders API requests, each serialized to its positional params array.

namespace Btsgate
{
namespace Node
{

// get_objects( ids, subscribe )
struct GetObjectsRequest
{
    static constexpr std::string_view method_name( ) { return "get_objects"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetObjectsRequest & request );

    std::vector< std::string > ids;
    bool subscribe = false;
};

// get_accounts( names_or_ids )
struct GetAccountsRequest
{
    static constexpr std::string_view method_name( ) { return "get_accounts"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetAccountsRequest & request );

    std::vector< std::string > accountNamesOrIds;
};

// get_full_accounts( names_or_ids, subscribe )
struct GetFullAccountsRequest
{
    static constexpr std::string_view method_name( ) { return "get_full_accounts"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetFullAccountsRequest & request );

    std::vector< std::string > accountNamesOrIds;
    bool subscribe = false;
};

// get_account_balances( account_id, asset_ids ), empty asset list means every asset.
struct GetAccountBalancesRequest
{
    static constexpr std::string_view method_name( ) { return "get_account_balances"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetAccountBalancesRequest & request );

    std::string accountId;
    std::vector< std::string > assetIds;
};

// get_limit_orders_by_account( account_id, limit )
struct GetLimitOrdersByAccountRequest
{
    static constexpr std::string_view method_name( ) { return "get_limit_orders_by_account"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetLimitOrdersByAccountRequest & request );

    std::string accountId;
    uint32_t limit = 100;
};

// get_order_book( base, quote, depth )
struct GetOrderBookRequest
{
    static constexpr std::string_view method_name( ) { return "get_order_book"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetOrderBookRequest & request );

    std::string base;
    std::string quote;
    uint32_t depth = 50;
};

// get_limit_orders( base, quote, limit )
struct GetLimitOrdersRequest
{
    static constexpr std::string_view method_name( ) { return "get_limit_orders"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetLimitOrdersRequest & request );

    std::string base;
    std::string quote;
    uint32_t limit = 100;
};

// get_dynamic_global_properties( )
struct GetDynamicGlobalPropertiesRequest
{
    static constexpr std::string_view method_name( ) { return "get_dynamic_global_properties"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetDynamicGlobalPropertiesRequest & request );
};

// get_required_fees( operations, fee_asset_id )
struct GetRequiredFeesRequest
{
    static constexpr std::string_view method_name( ) { return "get_required_fees"; }
    static constexpr NodeApi api( ) { return NodeApi::database; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetRequiredFeesRequest & request );

    boost::json::array operations;
    std::string feeAssetId;
};

} // namespace Node
} // namespace Btsgate
