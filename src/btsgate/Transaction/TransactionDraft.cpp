#include "btsgate/Transaction/TransactionDraft.hpp"

#include "btsgate/Util/JsonUtils.hpp"
#include "btsgate/Util/StringEncode.hpp"

#include <boost/date_time/posix_time/time_formatters.hpp>
#include <boost/date_time/posix_time/time_parsers.hpp>

#include <fmt/core.h>

#include <magic_enum/magic_enum.hpp>

#include <algorithm>

namespace Btsgate
{
namespace Transaction
{

namespace
{

// Past this lag behind the wall clock the head block time anchors expiration.
const boost::posix_time::seconds MAX_HEAD_BLOCK_LAG( 30 );

boost::json::object default_fee( )
{
    return boost::json::object{ { "amount", 0 }, { "asset_id", std::string( TransactionDraft::DEFAULT_FEE_ASSET ) } };
}

const boost::json::value & require_field( const boost::json::object & object, const char * key )
{
    auto * field = object.if_contains( key );
    if ( field == nullptr )
    {
        throw RemoteCallError( fmt::format( "Missing field in node response: {}", key ) );
    }
    return *field;
}

boost::posix_time::ptime truncate_to_seconds( boost::posix_time::ptime time )
{
    return boost::posix_time::ptime( time.date( ), boost::posix_time::seconds( time.time_of_day( ).total_seconds( ) ) );
}

} // namespace

std::string_view step_name( TransactionStep step )
{
    return magic_enum::enum_name( step );
}

TransactionStepError::TransactionStepError( TransactionStep step, std::exception_ptr cause, const std::string & message )
    : BtsgateError( message )
    , _step( step )
    , _cause( std::move( cause ) )
{ }

boost::posix_time::ptime parse_chain_time( std::string_view text )
{
    try
    {
        auto time = boost::posix_time::from_iso_extended_string( std::string( text ) );
        if ( time.is_not_a_date_time( ) )
        {
            throw RemoteCallError( fmt::format( "Invalid chain time: {}", text ) );
        }
        return time;
    }
    catch ( const RemoteCallError & )
    {
        throw;
    }
    catch ( const std::exception & ex )
    {
        throw RemoteCallError( fmt::format( "Invalid chain time: {}, {}", text, ex.what( ) ) );
    }
}

std::string format_chain_time( boost::posix_time::ptime time )
{
    return boost::posix_time::to_iso_extended_string( truncate_to_seconds( time ) );
}

void TransactionDraft::require_state( DraftState expected, std::string_view transition ) const
{
    if ( _state != expected )
    {
        throw BtsgateError
        (
            fmt::format
            (
                "[{}] Cannot {} in state {}, expected {}",
                name( ),
                transition,
                magic_enum::enum_name( _state ),
                magic_enum::enum_name( expected )
            )
        );
    }
}

void TransactionDraft::add_operation( OperationType operationType, boost::json::value payload )
{
    require_state( DraftState::pending, "add operation" );

    auto * payloadObject = payload.if_object( );
    if ( payloadObject == nullptr )
    {
        throw ValidationError( fmt::format( "Operation payload must be an object, operation: {}", operation_name( operationType ) ) );
    }

    auto * fee = payloadObject->if_contains( "fee" );
    if ( fee != nullptr && !fee->is_object( ) )
    {
        throw ValidationError( fmt::format( "Operation fee must be an object, operation: {}", operation_name( operationType ) ) );
    }

    auto * feeAssetId = fee != nullptr ? fee->as_object( ).if_contains( "asset_id" ) : nullptr;
    if ( feeAssetId == nullptr )
    {
        ( *payloadObject )[ "fee" ] = default_fee( );
    }
    else if ( !feeAssetId->is_string( ) )
    {
        throw ValidationError( fmt::format( "Operation fee asset id must be a string, operation: {}", operation_name( operationType ) ) );
    }

    boost::json::array operation;
    operation.emplace_back( static_cast< uint64_t >( operationType ) );
    operation.emplace_back( std::move( payload ) );
    _operations.emplace_back( std::move( operation ) );
}

void TransactionDraft::set_reference_block( const boost::json::object & dynamicGlobalProperties )
{
    require_state( DraftState::pending, "set reference block" );

    if ( _operations.empty( ) )
    {
        throw ValidationError( "Transaction has no operations" );
    }

    const auto & headBlockNumber = require_field( dynamicGlobalProperties, "head_block_number" );
    const auto & headBlockId = require_field( dynamicGlobalProperties, "head_block_id" );
    const auto & time = require_field( dynamicGlobalProperties, "time" );
    if ( !headBlockNumber.is_number( ) || !headBlockId.is_string( ) || !time.is_string( ) )
    {
        throw RemoteCallError( "Malformed dynamic global properties" );
    }

    // The prefix is the little-endian word at bytes 4..7 of the block id.
    auto blockIdBytes = dec_hex( as_string_view( headBlockId.get_string( ) ) );
    if ( blockIdBytes.size( ) < 8 )
    {
        throw RemoteCallError( fmt::format( "Invalid head block id: {}", headBlockId.get_string( ).c_str( ) ) );
    }

    _refBlockNum = static_cast< uint16_t >( headBlockNumber.to_number< uint64_t >( ) & 0xFFFF );
    _refBlockPrefix = static_cast< uint32_t >( blockIdBytes[ 4 ] )
        | ( static_cast< uint32_t >( blockIdBytes[ 5 ] ) << 8 )
        | ( static_cast< uint32_t >( blockIdBytes[ 6 ] ) << 16 )
        | ( static_cast< uint32_t >( blockIdBytes[ 7 ] ) << 24 );
    _headBlockTime = parse_chain_time( as_string_view( time.get_string( ) ) );

    _state = DraftState::block_fetched;
}

std::vector< FeeGroup > TransactionDraft::fee_groups( ) const
{
    require_state( DraftState::block_fetched, "compute fee groups" );

    std::vector< FeeGroup > groups;
    for ( size_t index = 0; index < _operations.size( ); ++index )
    {
        const auto & operation = _operations[ index ];
        std::string assetId( as_string_view( operation.as_array( )[ 1 ].as_object( ).at( "fee" ).as_object( ).at( "asset_id" ).as_string( ) ) );

        auto findGroup = std::find_if( groups.begin( ), groups.end( ), [ & ]( const FeeGroup & group ){ return group.assetId == assetId; } );
        if ( findGroup == groups.end( ) )
        {
            findGroup = groups.insert( groups.end( ), FeeGroup{ .assetId = assetId } );
        }
        findGroup->operationIndexes.push_back( index );
        findGroup->operations.push_back( operation );
    }
    return groups;
}

void TransactionDraft::set_required_fees( const std::vector< FeeSchedule > & feeSchedules )
{
    require_state( DraftState::block_fetched, "set required fees" );

    size_t pricedOperations = 0;
    for ( const auto & feeSchedule : feeSchedules )
    {
        if ( feeSchedule.fees.size( ) != feeSchedule.group.operationIndexes.size( ) )
        {
            throw RemoteCallError
            (
                fmt::format
                (
                    "Fee count mismatch for asset {}, expected: {}, received: {}",
                    feeSchedule.group.assetId,
                    feeSchedule.group.operationIndexes.size( ),
                    feeSchedule.fees.size( )
                )
            );
        }

        for ( size_t i = 0; i < feeSchedule.fees.size( ); ++i )
        {
            const auto * fee = &feeSchedule.fees[ i ];
            // Proposals are priced as [ own fee, [ nested fees ] ].
            if ( fee->is_array( ) )
            {
                if ( fee->get_array( ).empty( ) )
                {
                    throw RemoteCallError( "Empty proposal fee" );
                }
                fee = &fee->get_array( ).front( );
            }
            if ( !fee->is_object( ) || !fee->get_object( ).contains( "amount" ) || !fee->get_object( ).contains( "asset_id" ) )
            {
                throw RemoteCallError( fmt::format( "Malformed fee for asset {}", feeSchedule.group.assetId ) );
            }

            auto operationIndex = feeSchedule.group.operationIndexes[ i ];
            if ( operationIndex >= _operations.size( ) )
            {
                throw BtsgateError( "Fee group references an unknown operation" );
            }
            _operations[ operationIndex ].as_array( )[ 1 ].as_object( )[ "fee" ] = *fee;
            ++pricedOperations;
        }
    }

    if ( pricedOperations != _operations.size( ) )
    {
        throw BtsgateError( fmt::format( "Priced {} of {} operations", pricedOperations, _operations.size( ) ) );
    }

    _state = DraftState::fees_set;
}

void TransactionDraft::set_expiration( boost::posix_time::ptime now, boost::posix_time::time_duration window )
{
    require_state( DraftState::fees_set, "set expiration" );

    auto base = now - _headBlockTime > MAX_HEAD_BLOCK_LAG ? _headBlockTime : std::max( now, _headBlockTime );
    _expiration = truncate_to_seconds( base ) + window;

    _state = DraftState::expiration_set;
}

const boost::json::object & TransactionDraft::finalize( )
{
    require_state( DraftState::expiration_set, "finalize" );

    _finalized = boost::json::object
    {
        { "ref_block_num", _refBlockNum },
        { "ref_block_prefix", _refBlockPrefix },
        { "expiration", format_chain_time( _expiration ) },
        { "operations", _operations },
        { "extensions", boost::json::array{ } },
        { "signatures", boost::json::array{ } }
    };

    _state = DraftState::finalized;
    return _finalized;
}

} // namespace Transaction
} // namespace Btsgate
