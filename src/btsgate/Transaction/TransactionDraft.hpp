#pragma once

#include "btsgate/Transaction/OperationType.hpp"

#include "btsgate/Util/Utils.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace Btsgate
{
namespace Transaction
{

// Steps of building a signing request, in execution order.
enum class TransactionStep : uint8_t
{
    add_operations,
    open_session,
    fetch_reference_block,
    compute_fees,
    set_expiration,
    finalize,
    envelope
};

std::string_view step_name( TransactionStep step );

// A failed transaction build, tagged with the step that failed and carrying the underlying error.
class TransactionStepError : public BtsgateError
{
public:
    TransactionStepError( TransactionStep step, std::exception_ptr cause, const std::string & message );

    TransactionStep step( ) const { return _step; }
    std::exception_ptr cause( ) const { return _cause; }

private:
    TransactionStep _step;
    std::exception_ptr _cause;
};

enum class DraftState : uint8_t
{
    pending,
    block_fetched,
    fees_set,
    expiration_set,
    finalized
};

// Operations sharing one fee asset, priced by a single get_required_fees call.
struct FeeGroup
{
    std::string assetId;
    std::vector< size_t > operationIndexes;
    boost::json::array operations;
};

struct FeeSchedule
{
    FeeGroup group;
    // One entry per operation of the group, as returned by the node.
    boost::json::array fees;
};

// In-progress transaction. Each setter is a state transition and throws BtsgateError when called out of order.
class TransactionDraft
{
public:
    static constexpr std::string_view DEFAULT_FEE_ASSET = "1.3.0";

    // Only while pending. Throws ValidationError for a non-object payload.
    void add_operation( OperationType operationType, boost::json::value payload );

    // pending -> block_fetched, from the get_dynamic_global_properties result.
    void set_reference_block( const boost::json::object & dynamicGlobalProperties );

    std::vector< FeeGroup > fee_groups( ) const;

    // block_fetched -> fees_set
    void set_required_fees( const std::vector< FeeSchedule > & feeSchedules );

    // fees_set -> expiration_set
    void set_expiration( boost::posix_time::ptime now, boost::posix_time::time_duration window );

    // expiration_set -> finalized, the returned object is the transaction handed to the signer.
    const boost::json::object & finalize( );

    DraftState state( ) const { return _state; }

    // Empty until finalized.
    const boost::json::object & transaction( ) const & { return _finalized; }

    const boost::json::array & operations( ) const & { return _operations; }
    uint16_t ref_block_num( ) const { return _refBlockNum; }
    uint32_t ref_block_prefix( ) const { return _refBlockPrefix; }
    boost::posix_time::ptime head_block_time( ) const { return _headBlockTime; }
    boost::posix_time::ptime expiration( ) const { return _expiration; }

    constexpr std::string_view name( ) const & { return "TransactionDraft"; }

private:
    void require_state( DraftState expected, std::string_view transition ) const;

    DraftState _state = DraftState::pending;

    // Each entry is [ operation id, payload ].
    boost::json::array _operations;

    uint16_t _refBlockNum = 0;
    uint32_t _refBlockPrefix = 0;
    boost::posix_time::ptime _headBlockTime;
    boost::posix_time::ptime _expiration;

    boost::json::object _finalized;
};

// Graphene time strings: "YYYY-MM-DDTHH:MM:SS".
boost::posix_time::ptime parse_chain_time( std::string_view text );
std::string format_chain_time( boost::posix_time::ptime time );

} // namespace Transaction
} // namespace Btsgate
