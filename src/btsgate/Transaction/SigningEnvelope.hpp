#pragma once

#include "btsgate/Chain/ChainTypes.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <string>

namespace Btsgate
{
namespace Transaction
{

// Request handed to the external wallet, which signs and broadcasts the embedded transaction.
struct SigningEnvelope
{
    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const SigningEnvelope & envelope );

    std::string id;
    Chain chain;
    std::string appName;
    // Finalized transaction, serialized.
    std::string transaction;
};

// Wraps a finalized transaction under a fresh random request id.
SigningEnvelope make_signing_envelope( Chain chain, std::string appName, const boost::json::object & transaction );

// Serialized envelope, percent-encoded for embedding in a deep link.
std::string encode_signing_envelope( const SigningEnvelope & envelope );

} // namespace Transaction
} // namespace Btsgate
