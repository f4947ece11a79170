#pragma once

#include "btsgate/Node/RpcInvoker/RpcInvoker.hpp"
#include "btsgate/Node/SessionManager/SessionManager.hpp"
#include "btsgate/Transaction/OperationType.hpp"
#include "btsgate/Transaction/SigningEnvelope.hpp"
#include "btsgate/Transaction/TransactionDraft.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <boost/json/value.hpp>

#include <functional>
#include <string>
#include <vector>

namespace Btsgate
{
namespace Transaction
{

// Builds unsigned transactions and wraps them for an external signer.
// Steps run strictly in order: reference block, fees, expiration, finalize. The session is closed before the envelope is built.
class TransactionOrchestrator
{
public:
    using Clock = std::function< boost::posix_time::ptime( ) >;

    static constexpr long EXPIRATION_SECONDS = 7200;

    TransactionOrchestrator
    (
        Node::SessionManager & sessionManager,
        Node::RpcInvoker & rpcInvoker,
        std::string appName,
        Clock clock = { }
    );

    // Throws TransactionStepError naming the failed step, nothing is returned on partial success.
    boost::asio::awaitable< SigningEnvelope > do_build_signing_envelope
    (
        Chain chain,
        OperationType operationType,
        std::vector< boost::json::value > operationPayloads
    );

    // The envelope, percent-encoded.
    boost::asio::awaitable< std::string > do_build_signing_request
    (
        Chain chain,
        OperationType operationType,
        std::vector< boost::json::value > operationPayloads
    );

    constexpr std::string_view name( ) const & { return "TransactionOrchestrator"; }

private:
    // Fetches the reference block, prices fees, sets expiration and finalizes, over one open session.
    boost::asio::awaitable< void > do_prepare( Node::NodeSession & session, TransactionDraft & draft, TransactionStep & step );

    TransactionStepError make_step_error( TransactionStep step, std::exception_ptr error ) const;

    Node::SessionManager & _sessionManager;
    Node::RpcInvoker & _rpcInvoker;
    std::string _appName;
    Clock _clock;

    mutable BtsgateLogger _logger;
};

} // namespace Transaction
} // namespace Btsgate
