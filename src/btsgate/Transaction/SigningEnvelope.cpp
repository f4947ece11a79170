#include "btsgate/Transaction/SigningEnvelope.hpp"

#include "btsgate/Util/StringEncode.hpp"

#include <boost/json/array.hpp>
#include <boost/json/serialize.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace Btsgate
{
namespace Transaction
{

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const SigningEnvelope & envelope )
{
    boost::json::array params;
    params.emplace_back( "signAndBroadcast" );
    params.emplace_back( envelope.transaction );
    params.emplace_back( boost::json::array{ } );

    boost::json::object payload;
    payload.emplace( "method", "injectedCall" );
    payload.emplace( "params", std::move( params ) );
    payload.emplace( "appName", envelope.appName );
    payload.emplace( "chain", std::string( chain_tag( envelope.chain ) ) );
    payload.emplace( "browser", "web browser" );
    payload.emplace( "origin", "localhost" );

    boost::json::object request;
    request.emplace( "type", "api" );
    request.emplace( "id", envelope.id );
    request.emplace( "payload", std::move( payload ) );

    jsonValue = std::move( request );
}

SigningEnvelope make_signing_envelope( Chain chain, std::string appName, const boost::json::object & transaction )
{
    boost::uuids::random_generator uuidGenerator;

    return SigningEnvelope
    {
        .id = boost::uuids::to_string( uuidGenerator( ) ),
        .chain = chain,
        .appName = std::move( appName ),
        .transaction = boost::json::serialize( transaction )
    };
}

std::string encode_signing_envelope( const SigningEnvelope & envelope )
{
    return enc_uri_component( boost::json::serialize( boost::json::value_from( envelope ) ) );
}

} // namespace Transaction
} // namespace Btsgate
