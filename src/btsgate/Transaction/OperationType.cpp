#include "btsgate/Transaction/OperationType.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

#include <magic_enum/magic_enum.hpp>

namespace Btsgate
{
namespace Transaction
{

OperationType parse_operation_type( std::string_view text )
{
    if ( text == "assert" )
    {
        return OperationType::assert_operation;
    }

    auto operationType = magic_enum::enum_cast< OperationType >( text );
    if ( !operationType || *operationType == OperationType::assert_operation )
    {
        throw ValidationError( fmt::format( "Unknown operation type: {}", text ) );
    }
    if ( is_virtual_operation( *operationType ) )
    {
        throw ValidationError( fmt::format( "Virtual operation cannot be submitted: {}", text ) );
    }
    return *operationType;
}

std::string_view operation_name( OperationType operationType )
{
    if ( operationType == OperationType::assert_operation )
    {
        return "assert";
    }
    return magic_enum::enum_name( operationType );
}

bool is_virtual_operation( OperationType operationType )
{
    switch ( operationType )
    {
        case OperationType::fill_order:
        case OperationType::asset_settle_cancel:
        case OperationType::fba_distribute:
        case OperationType::execute_bid:
        case OperationType::htlc_redeemed:
        case OperationType::htlc_refund:
        case OperationType::credit_deal_expired:
            return true;
        default:
            return false;
    }
}

} // namespace Transaction
} // namespace Btsgate
