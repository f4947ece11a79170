#pragma once

#include "btsgate/Gateway/Gateway.hpp"

#include "btsgate/Util/Logger.hpp"
#include "btsgate/Util/Utils.hpp"

#include <boost/asio/awaitable.hpp>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>

#include <boost/json/value.hpp>

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Btsgate
{
namespace Http
{

using HttpRequest = boost::beast::http::request< boost::beast::http::string_body >;
using HttpResponse = boost::beast::http::response< boost::beast::http::string_body >;

// Failure with an explicit response status: unknown route, wrong method, absent result.
class HttpError : public BtsgateError
{
public:
    HttpError( boost::beast::http::status status, const std::string & message )
        : BtsgateError( message )
        , _status( status )
    { }

    boost::beast::http::status status( ) const { return _status; }

private:
    boost::beast::http::status _status;
};

// Response status for a failed request, TransactionStepError maps through its cause.
boost::beast::http::status http_status_for( std::exception_ptr error );

struct RouteContext
{
    std::map< std::string, std::string > params;
    std::map< std::string, std::string > query;
    const std::string & body;
};

// Matches "/segment/:param/..." patterns against the request path and renders results as JSON.
class HttpRouter
{
public:
    explicit HttpRouter( Gateway & gateway );

    boost::asio::awaitable< HttpResponse > do_route( const HttpRequest & request );

    constexpr std::string_view name( ) const & { return "HttpRouter"; }

private:
    using RouteHandler = std::function< boost::asio::awaitable< boost::json::value >( RouteContext & ) >;

    struct Route
    {
        boost::beast::http::verb verb;
        std::vector< std::string > pattern;
        RouteHandler handler;
    };

    void add_route( boost::beast::http::verb verb, std::string_view pattern, RouteHandler handler );

    // Throws HttpError 404 or 405.
    std::pair< const Route *, std::map< std::string, std::string > > match( boost::beast::http::verb verb, std::string_view path ) const;

    void register_state_routes( );
    void register_api_routes( );
    void register_cache_routes( );

    Gateway & _gateway;
    std::vector< Route > _routes;

    mutable BtsgateLogger _logger;
};

// Percent-decoded path segments, empty segments dropped.
std::vector< std::string > split_path( std::string_view path );

// Percent-decoded query parameters of "a=1&b=2".
std::map< std::string, std::string > parse_query( std::string_view query );

} // namespace Http
} // namespace Btsgate
