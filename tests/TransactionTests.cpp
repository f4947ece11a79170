#include "FakeNodeConnection.hpp"

#include "btsgate/Http/HttpServer/HttpRouter.hpp"
#include "btsgate/Node/EndpointRegistry/EndpointRegistry.hpp"
#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"
#include "btsgate/Node/SessionManager/SessionManager.hpp"
#include "btsgate/Transaction/OperationType.hpp"
#include "btsgate/Transaction/SigningEnvelope.hpp"
#include "btsgate/Transaction/TransactionDraft.hpp"
#include "btsgate/Transaction/TransactionOrchestrator/TransactionOrchestrator.hpp"

#include "btsgate/Util/JsonUtils.hpp"
#include "btsgate/Util/StringEncode.hpp"

#include <boost/json/parse.hpp>

#include <catch2/catch.hpp>

using namespace Btsgate;
using namespace Btsgate::Node;
using namespace Btsgate::Test;
using namespace Btsgate::Transaction;

namespace
{

const std::string HEAD_BLOCK_TIME = "2024-01-01T00:00:00";

boost::json::object dynamic_global_properties( )
{
    return boost::json::object
    {
        { "id", "2.1.0" },
        { "head_block_number", 12345678 },
        { "head_block_id", "00bc614e7856341200000000000000000000abcd" },
        { "time", HEAD_BLOCK_TIME }
    };
}

boost::json::value transfer_payload( int64_t amount, std::string feeAssetId = "" )
{
    boost::json::object payload
    {
        { "from", "1.2.100" },
        { "to", "1.2.200" },
        { "amount", boost::json::object{ { "amount", amount }, { "asset_id", "1.3.0" } } }
    };
    if ( !feeAssetId.empty( ) )
    {
        payload.emplace( "fee", boost::json::object{ { "amount", 0 }, { "asset_id", feeAssetId } } );
    }
    return payload;
}

// Prices every operation at 100 + its index within the request.
boost::json::value answer_required_fees( const boost::json::array & params )
{
    boost::json::array fees;
    const auto & assetId = params.at( 1 ).as_string( );
    for ( size_t i = 0; i < params.at( 0 ).as_array( ).size( ); ++i )
    {
        fees.emplace_back( boost::json::object{ { "amount", 100 + i }, { "asset_id", assetId } } );
    }
    return fees;
}

struct OrchestratorFixture
{
    OrchestratorFixture( )
        : node( std::make_shared< FakeNode >( ) )
        , registry( { { Chain::bitshares, { "wss://x", "wss://y" } }, { Chain::bitshares_testnet, { "wss://t1" } } } )
        , sessionManager( registry, make_fake_factory( node ), std::chrono::milliseconds( 1000 ) )
        , orchestrator( sessionManager, rpcInvoker, "Test app", [ this ]( ){ return now; } )
    {
        node->methods[ "get_dynamic_global_properties" ] = [ ]( const boost::json::array & ) -> boost::json::value
        {
            return dynamic_global_properties( );
        };
        node->methods[ "get_required_fees" ] = answer_required_fees;
    }

    boost::json::object build_transaction( std::vector< boost::json::value > payloads )
    {
        auto envelope = run_coroutine( orchestrator.do_build_signing_envelope( Chain::bitshares, OperationType::transfer, std::move( payloads ) ) );
        return boost::json::parse( envelope.transaction ).as_object( );
    }

    boost::posix_time::ptime now = parse_chain_time( HEAD_BLOCK_TIME );

    std::shared_ptr< FakeNode > node;
    EndpointRegistry registry;
    SessionManager sessionManager;
    RpcInvoker rpcInvoker;
    TransactionOrchestrator orchestrator;
};

} // namespace

TEST_CASE( "Operation names map to protocol ids", "[transaction]" )
{
    REQUIRE( parse_operation_type( "transfer" ) == OperationType::transfer );
    REQUIRE( static_cast< int >( parse_operation_type( "limit_order_create" ) ) == 1 );
    REQUIRE( static_cast< int >( parse_operation_type( "liquidity_pool_exchange" ) ) == 63 );
    REQUIRE( parse_operation_type( "assert" ) == OperationType::assert_operation );
    REQUIRE( operation_name( OperationType::assert_operation ) == "assert" );

    REQUIRE_THROWS_AS( parse_operation_type( "bogus" ), ValidationError );
    REQUIRE_THROWS_AS( parse_operation_type( "assert_operation" ), ValidationError );
    REQUIRE_THROWS_AS( parse_operation_type( "fill_order" ), ValidationError );
}

TEST_CASE( "Draft transitions only run in order", "[transaction][draft]" )
{
    TransactionDraft draft;
    draft.add_operation( OperationType::transfer, transfer_payload( 1 ) );

    REQUIRE_THROWS_AS( draft.finalize( ), BtsgateError );
    REQUIRE_THROWS_AS( draft.set_expiration( parse_chain_time( HEAD_BLOCK_TIME ), boost::posix_time::seconds( 60 ) ), BtsgateError );
    REQUIRE( draft.state( ) == DraftState::pending );

    draft.set_reference_block( dynamic_global_properties( ) );
    REQUIRE( draft.state( ) == DraftState::block_fetched );
    REQUIRE( draft.ref_block_num( ) == ( 12345678 & 0xFFFF ) );
    REQUIRE( draft.ref_block_prefix( ) == 0x12345678u );

    REQUIRE_THROWS_AS( draft.add_operation( OperationType::transfer, transfer_payload( 2 ) ), BtsgateError );
    REQUIRE_THROWS_AS( draft.set_reference_block( dynamic_global_properties( ) ), BtsgateError );
}

TEST_CASE( "Payloads without a fee get the default fee asset", "[transaction][draft]" )
{
    TransactionDraft draft;
    draft.add_operation( OperationType::transfer, transfer_payload( 1 ) );
    draft.add_operation( OperationType::transfer, transfer_payload( 2, "1.3.121" ) );
    draft.add_operation( OperationType::transfer, transfer_payload( 3 ) );

    REQUIRE_THROWS_AS( draft.add_operation( OperationType::transfer, boost::json::array{ } ), ValidationError );

    draft.set_reference_block( dynamic_global_properties( ) );
    auto groups = draft.fee_groups( );

    REQUIRE( groups.size( ) == 2 );
    REQUIRE( groups[ 0 ].assetId == "1.3.0" );
    REQUIRE( groups[ 0 ].operationIndexes == std::vector< size_t >{ 0, 2 } );
    REQUIRE( groups[ 1 ].assetId == "1.3.121" );
    REQUIRE( groups[ 1 ].operationIndexes == std::vector< size_t >{ 1 } );
}

TEST_CASE( "Proposal fees use their own fee", "[transaction][draft]" )
{
    TransactionDraft draft;
    draft.add_operation( OperationType::proposal_create, boost::json::object{ { "fee_paying_account", "1.2.100" } } );
    draft.set_reference_block( dynamic_global_properties( ) );

    auto groups = draft.fee_groups( );
    REQUIRE( groups.size( ) == 1 );

    boost::json::array fees;
    fees.emplace_back( boost::json::array
    {
        boost::json::object{ { "amount", 50 }, { "asset_id", "1.3.0" } },
        boost::json::array{ boost::json::object{ { "amount", 20 }, { "asset_id", "1.3.0" } } }
    } );
    draft.set_required_fees( { FeeSchedule{ .group = groups[ 0 ], .fees = fees } } );

    const auto & fee = draft.operations( )[ 0 ].as_array( )[ 1 ].as_object( ).at( "fee" ).as_object( );
    REQUIRE( fee.at( "amount" ).to_number< int64_t >( ) == 50 );
}

TEST_CASE( "Fee count mismatch is rejected", "[transaction][draft]" )
{
    TransactionDraft draft;
    draft.add_operation( OperationType::transfer, transfer_payload( 1 ) );
    draft.add_operation( OperationType::transfer, transfer_payload( 2 ) );
    draft.set_reference_block( dynamic_global_properties( ) );

    auto groups = draft.fee_groups( );
    boost::json::array fees{ boost::json::object{ { "amount", 1 }, { "asset_id", "1.3.0" } } };

    REQUIRE_THROWS_AS( draft.set_required_fees( { FeeSchedule{ .group = groups[ 0 ], .fees = fees } } ), RemoteCallError );
    REQUIRE( draft.state( ) == DraftState::block_fetched );
}

TEST_CASE( "Expiration anchors on the head block when the clock runs ahead", "[transaction][draft]" )
{
    const auto headTime = parse_chain_time( HEAD_BLOCK_TIME );
    const auto window = boost::posix_time::seconds( TransactionOrchestrator::EXPIRATION_SECONDS );

    const auto expirationAt = [ & ]( boost::posix_time::ptime now )
    {
        TransactionDraft draft;
        draft.add_operation( OperationType::transfer, transfer_payload( 1 ) );
        draft.set_reference_block( dynamic_global_properties( ) );
        boost::json::array fees{ boost::json::object{ { "amount", 1 }, { "asset_id", "1.3.0" } } };
        draft.set_required_fees( { FeeSchedule{ .group = draft.fee_groups( )[ 0 ], .fees = fees } } );
        draft.set_expiration( now, window );
        return draft.expiration( );
    };

    REQUIRE( expirationAt( headTime ) == headTime + window );
    REQUIRE( expirationAt( headTime + boost::posix_time::seconds( 10 ) ) == headTime + boost::posix_time::seconds( 10 ) + window );
    REQUIRE( expirationAt( headTime + boost::posix_time::hours( 1 ) ) == headTime + window );
    REQUIRE( expirationAt( headTime - boost::posix_time::seconds( 5 ) ) == headTime + window );
}

TEST_CASE_METHOD( OrchestratorFixture, "Single operation builds an envelope expiring 7200 s after the reference block", "[transaction]" )
{
    auto transaction = build_transaction( { transfer_payload( 42 ) } );

    REQUIRE( as_string_view( transaction.at( "expiration" ).as_string( ) ) == "2024-01-01T02:00:00" );
    REQUIRE( transaction.at( "ref_block_num" ).to_number< uint64_t >( ) == ( 12345678 & 0xFFFF ) );
    REQUIRE( transaction.at( "ref_block_prefix" ).to_number< uint64_t >( ) == 0x12345678u );
    REQUIRE( transaction.at( "extensions" ).as_array( ).empty( ) );
    REQUIRE( transaction.at( "signatures" ).as_array( ).empty( ) );

    const auto & operations = transaction.at( "operations" ).as_array( );
    REQUIRE( operations.size( ) == 1 );
    REQUIRE( operations[ 0 ].as_array( )[ 0 ].to_number< int >( ) == 0 );
    REQUIRE( operations[ 0 ].as_array( )[ 1 ].at( "fee" ).at( "amount" ).to_number< int64_t >( ) == 100 );

    REQUIRE( node->closeCount == 1 );
}

TEST_CASE_METHOD( OrchestratorFixture, "Operation order matches the input order", "[transaction]" )
{
    std::vector< boost::json::value > payloads;
    for ( int64_t i = 0; i < 5; ++i )
    {
        payloads.push_back( transfer_payload( i, i % 2 == 0 ? "1.3.0" : "1.3.121" ) );
    }

    auto transaction = build_transaction( std::move( payloads ) );

    const auto & operations = transaction.at( "operations" ).as_array( );
    REQUIRE( operations.size( ) == 5 );
    for ( size_t i = 0; i < operations.size( ); ++i )
    {
        const auto & payload = operations[ i ].as_array( )[ 1 ];
        REQUIRE( payload.at( "amount" ).at( "amount" ).to_number< size_t >( ) == i );
    }
    // One pricing call per fee asset.
    REQUIRE( node->call_count( "get_required_fees" ) == 2 );
    REQUIRE( operations[ 3 ].as_array( )[ 1 ].at( "fee" ).at( "asset_id" ).as_string( ) == "1.3.121" );
}

TEST_CASE_METHOD( OrchestratorFixture, "Fee failure aborts the build and closes the session once", "[transaction]" )
{
    node->methods[ "get_required_fees" ] = [ ]( const boost::json::array & ) -> boost::json::value
    {
        throw RemoteCallError( "Insufficient fee pool" );
    };

    try
    {
        build_transaction( { transfer_payload( 1 ) } );
        FAIL( "Expected TransactionStepError" );
    }
    catch ( const TransactionStepError & ex )
    {
        REQUIRE( ex.step( ) == TransactionStep::compute_fees );
        REQUIRE_THROWS_AS( std::rethrow_exception( ex.cause( ) ), RemoteCallError );
        REQUIRE( std::string( ex.what( ) ) == "compute_fees failed: Insufficient fee pool" );
    }

    REQUIRE( node->closeCount == 1 );
    REQUIRE( registry.current_endpoint( Chain::bitshares ) == "wss://x" );
}

TEST_CASE_METHOD( OrchestratorFixture, "Reference block failure names its step", "[transaction]" )
{
    node->methods[ "get_dynamic_global_properties" ] = [ ]( const boost::json::array & ) -> boost::json::value
    {
        return nullptr;
    };

    try
    {
        build_transaction( { transfer_payload( 1 ) } );
        FAIL( "Expected TransactionStepError" );
    }
    catch ( const TransactionStepError & ex )
    {
        REQUIRE( ex.step( ) == TransactionStep::fetch_reference_block );
    }

    REQUIRE( node->call_count( "get_required_fees" ) == 0 );
    REQUIRE( node->closeCount == 1 );
}

TEST_CASE_METHOD( OrchestratorFixture, "Invalid input fails before any connection", "[transaction]" )
{
    auto buildWith = [ this ]( OperationType operationType, std::vector< boost::json::value > payloads )
    {
        return run_coroutine( orchestrator.do_build_signing_envelope( Chain::bitshares, operationType, std::move( payloads ) ) );
    };

    REQUIRE_THROWS_AS( buildWith( OperationType::transfer, { } ), TransactionStepError );
    REQUIRE_THROWS_AS( buildWith( OperationType::fill_order, { transfer_payload( 1 ) } ), TransactionStepError );
    REQUIRE_THROWS_AS( buildWith( OperationType::transfer, { boost::json::value( "not an object" ) } ), TransactionStepError );

    REQUIRE( node->connectAttempts.empty( ) );
}

TEST_CASE_METHOD( OrchestratorFixture, "Malformed fees fail before any connection", "[transaction]" )
{
    auto buildWithFee = [ this ]( boost::json::value fee )
    {
        auto payload = transfer_payload( 1 );
        payload.as_object( )[ "fee" ] = std::move( fee );
        return run_coroutine( orchestrator.do_build_signing_envelope( Chain::bitshares, OperationType::transfer, { payload } ) );
    };

    for ( auto fee : { boost::json::value( boost::json::object{ { "amount", 0 }, { "asset_id", 5 } } ), boost::json::value( "1.3.0" ) } )
    {
        try
        {
            buildWithFee( fee );
            FAIL( "Expected TransactionStepError" );
        }
        catch ( const TransactionStepError & ex )
        {
            REQUIRE( ex.step( ) == TransactionStep::add_operations );
            REQUIRE( Http::http_status_for( std::current_exception( ) ) == boost::beast::http::status::bad_request );
        }
    }

    REQUIRE( node->connectAttempts.empty( ) );
    REQUIRE( node->calls.empty( ) );
}

TEST_CASE_METHOD( OrchestratorFixture, "Unreachable node fails the open session step", "[transaction]" )
{
    node->unreachable = { "wss://x" };

    try
    {
        build_transaction( { transfer_payload( 1 ) } );
        FAIL( "Expected TransactionStepError" );
    }
    catch ( const TransactionStepError & ex )
    {
        REQUIRE( ex.step( ) == TransactionStep::open_session );
    }
    REQUIRE( registry.current_endpoint( Chain::bitshares ) == "wss://y" );
}

TEST_CASE_METHOD( OrchestratorFixture, "Signing request decodes to the wallet envelope", "[transaction][envelope]" )
{
    auto signingRequest = run_coroutine
    (
        orchestrator.do_build_signing_request( Chain::bitshares_testnet, OperationType::transfer, { transfer_payload( 7 ) } )
    );

    // Percent-encoded, nothing outside the unreserved set survives.
    REQUIRE( signingRequest.find_first_of( "{}\":,[] " ) == std::string::npos );

    auto envelope = boost::json::parse( dec_uri_component( signingRequest ) ).as_object( );
    REQUIRE( envelope.at( "type" ).as_string( ) == "api" );
    REQUIRE( envelope.at( "id" ).as_string( ).size( ) == 36 );

    const auto & payload = envelope.at( "payload" ).as_object( );
    REQUIRE( payload.at( "method" ).as_string( ) == "injectedCall" );
    REQUIRE( payload.at( "appName" ).as_string( ) == "Test app" );
    REQUIRE( payload.at( "chain" ).as_string( ) == "TEST" );
    REQUIRE( payload.at( "browser" ).as_string( ) == "web browser" );
    REQUIRE( payload.at( "origin" ).as_string( ) == "localhost" );

    const auto & params = payload.at( "params" ).as_array( );
    REQUIRE( params.size( ) == 3 );
    REQUIRE( params[ 0 ].as_string( ) == "signAndBroadcast" );
    auto transaction = boost::json::parse( as_string_view( params[ 1 ].as_string( ) ) ).as_object( );
    REQUIRE( transaction.at( "operations" ).as_array( ).size( ) == 1 );
}

TEST_CASE( "Envelopes get distinct request ids", "[transaction][envelope]" )
{
    boost::json::object transaction{ { "operations", boost::json::array{ } } };

    auto first = make_signing_envelope( Chain::bitshares, "app", transaction );
    auto second = make_signing_envelope( Chain::bitshares, "app", transaction );

    REQUIRE( first.id != second.id );
    REQUIRE( first.transaction == second.transaction );
}
