#pragma once

#include "btsgate/Chain/ChainTypes.hpp"

#include "btsgate/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <boost/json/value.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace Btsgate
{
namespace History
{

// Account history window, unset fields fall back to the explorer defaults.
struct HistoryQuery
{
    std::optional< std::string > from;
    std::optional< std::string > size;
    std::optional< std::string > fromDate;
    std::optional< std::string > toDate;
    std::optional< std::string > sortBy;
    std::optional< std::string > type;
    std::optional< std::string > aggField;
};

// Request target on the explorer host, every value percent-encoded.
std::string build_history_target( std::string_view accountId, const HistoryQuery & query );

using HistoryResponse = boost::beast::http::response< boost::beast::http::string_body >;

// Explorer response to a history document. Throws RemoteCallError on a non-200 status or
// an unparsable body, nullopt for a null document.
std::optional< boost::json::value > parse_history_response( const HistoryResponse & httpResponse );

// Pass-through GET proxy to the external elasticsearch explorer.
class HistoryClient
{
public:
    HistoryClient
    (
        boost::asio::io_context & ioContext,
        std::map< Chain, std::string > historyHosts,
        std::chrono::milliseconds requestTimeout
    );

    // Throws RemoteCallError on a non-200 status, nullopt for a null document.
    boost::asio::awaitable< std::optional< boost::json::value > > do_account_history
    (
        Chain chain,
        std::string accountId,
        HistoryQuery query
    );

    constexpr std::string_view name( ) const & { return "HistoryClient"; }

private:
    boost::asio::awaitable< boost::beast::ssl_stream< boost::beast::tcp_stream > > open_connection( const std::string & host );

    std::map< Chain, std::string > _historyHosts;
    std::chrono::milliseconds _requestTimeout;

    boost::asio::strand< boost::asio::io_context::executor_type > _strand;

    // SSL context.
    boost::asio::ssl::context _sslContext;
    boost::asio::ip::tcp::resolver _tcpResolver;

    mutable BtsgateLogger _logger;
};

} // namespace History
} // namespace Btsgate
