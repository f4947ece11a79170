#include "btsgate/Transaction/TransactionOrchestrator/TransactionOrchestrator.hpp"

#include "btsgate/Util/Utils.hpp"

#include <fmt/core.h>

#include <magic_enum/magic_enum.hpp>

namespace Btsgate
{
namespace Transaction
{

TransactionOrchestrator::TransactionOrchestrator
(
    Node::SessionManager & sessionManager,
    Node::RpcInvoker & rpcInvoker,
    std::string appName,
    Clock clock
)
    : _sessionManager( sessionManager )
    , _rpcInvoker( rpcInvoker )
    , _appName( std::move( appName ) )
    , _clock( clock ? std::move( clock ) : Clock( [ ]( ){ return boost::posix_time::second_clock::universal_time( ); } ) )
{ }

TransactionStepError TransactionOrchestrator::make_step_error( TransactionStep step, std::exception_ptr error ) const
{
    std::string message = "unknown error";
    try
    {
        std::rethrow_exception( error );
    }
    catch ( const std::exception & ex )
    {
        message = ex.what( );
    }

    BTSGATE_LOG_ERROR( _logger ) << fmt::format( "[{}] Step {} failed: {}", name( ), step_name( step ), message );

    return TransactionStepError( step, std::move( error ), fmt::format( "{} failed: {}", step_name( step ), message ) );
}

boost::asio::awaitable< void > TransactionOrchestrator::do_prepare
(
    Node::NodeSession & session,
    TransactionDraft & draft,
    TransactionStep & step
)
{
    step = TransactionStep::fetch_reference_block;
    auto dynamicGlobalProperties = co_await _rpcInvoker.send_request( session, Node::GetDynamicGlobalPropertiesRequest{ } );
    if ( !dynamicGlobalProperties.is_object( ) )
    {
        throw RemoteCallError( "Missing dynamic global properties" );
    }
    draft.set_reference_block( dynamicGlobalProperties.get_object( ) );

    step = TransactionStep::compute_fees;
    std::vector< FeeSchedule > feeSchedules;
    for ( auto & feeGroup : draft.fee_groups( ) )
    {
        auto fees = co_await _rpcInvoker.send_request
        (
            session,
            Node::GetRequiredFeesRequest{ .operations = feeGroup.operations, .feeAssetId = feeGroup.assetId }
        );
        if ( !fees.is_array( ) )
        {
            throw RemoteCallError( fmt::format( "Missing required fees for asset {}", feeGroup.assetId ) );
        }
        feeSchedules.push_back( FeeSchedule{ .group = std::move( feeGroup ), .fees = std::move( fees.get_array( ) ) } );
    }
    draft.set_required_fees( feeSchedules );

    step = TransactionStep::set_expiration;
    draft.set_expiration( _clock( ), boost::posix_time::seconds( EXPIRATION_SECONDS ) );

    step = TransactionStep::finalize;
    const auto & transaction = draft.finalize( );

    BTSGATE_LOG_DEBUG( _logger )
        << fmt::format
        (
            "[{}] Finalized {} operations, ref block: {}/{}, expiration: {}",
            name( ),
            transaction.at( "operations" ).as_array( ).size( ),
            draft.ref_block_num( ),
            draft.ref_block_prefix( ),
            format_chain_time( draft.expiration( ) )
        );
}

boost::asio::awaitable< SigningEnvelope > TransactionOrchestrator::do_build_signing_envelope
(
    Chain chain,
    OperationType operationType,
    std::vector< boost::json::value > operationPayloads
)
{
    // Validation happens before any network activity.
    TransactionDraft draft;
    try
    {
        if ( operationPayloads.empty( ) )
        {
            throw ValidationError( "No operations supplied" );
        }
        if ( is_virtual_operation( operationType ) )
        {
            throw ValidationError( fmt::format( "Virtual operation cannot be submitted: {}", operation_name( operationType ) ) );
        }
        for ( auto & payload : operationPayloads )
        {
            draft.add_operation( operationType, std::move( payload ) );
        }
    }
    catch ( const std::exception & )
    {
        throw make_step_error( TransactionStep::add_operations, std::current_exception( ) );
    }

    std::unique_ptr< Node::NodeSession > session;
    try
    {
        session = co_await _sessionManager.do_open( chain );
    }
    catch ( const std::exception & )
    {
        throw make_step_error( TransactionStep::open_session, std::current_exception( ) );
    }

    auto step = TransactionStep::fetch_reference_block;
    std::exception_ptr error;
    bool apiUnavailable = false;
    try
    {
        co_await do_prepare( *session, draft, step );
    }
    catch ( const ApiUnavailableError & )
    {
        apiUnavailable = true;
        error = std::current_exception( );
    }
    catch ( const std::exception & )
    {
        error = std::current_exception( );
    }

    // Always released, whichever step failed.
    co_await session->do_close( );

    if ( error )
    {
        if ( apiUnavailable )
        {
            _sessionManager.endpoint_registry( ).rotate_if_current( chain, session->endpoint( ) );
        }
        throw make_step_error( step, error );
    }

    try
    {
        co_return make_signing_envelope( chain, _appName, draft.transaction( ) );
    }
    catch ( const std::exception & )
    {
        throw make_step_error( TransactionStep::envelope, std::current_exception( ) );
    }
}

boost::asio::awaitable< std::string > TransactionOrchestrator::do_build_signing_request
(
    Chain chain,
    OperationType operationType,
    std::vector< boost::json::value > operationPayloads
)
{
    const auto operationCount = operationPayloads.size( );
    auto envelope = co_await do_build_signing_envelope( chain, operationType, std::move( operationPayloads ) );

    BTSGATE_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}][{}] Built signing request {} for {} x{}",
            name( ),
            chain_name( chain ),
            envelope.id,
            operation_name( operationType ),
            operationCount
        );

    co_return encode_signing_envelope( envelope );
}

} // namespace Transaction
} // namespace Btsgate
