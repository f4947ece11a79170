#include "btsgate/Http/HttpServer/HttpRouter.hpp"

#include "btsgate/Transaction/TransactionDraft.hpp"

#include "btsgate/Util/JsonUtils.hpp"
#include "btsgate/Util/StringEncode.hpp"

#include <boost/beast/http/field.hpp>

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>

#include <fmt/core.h>

namespace beast = boost::beast;

namespace Btsgate
{
namespace Http
{

namespace
{

boost::json::value parse_body( const std::string & body )
{
    if ( body.empty( ) )
    {
        throw ValidationError( "Missing request body" );
    }
    try
    {
        return boost::json::parse( body );
    }
    catch ( const std::exception & ex )
    {
        throw ValidationError( fmt::format( "Invalid JSON body: {}", ex.what( ) ) );
    }
}

// Accepts a JSON array, or an object whose values are taken in order.
std::vector< std::string > parse_id_list( const std::string & body )
{
    auto jsonBody = parse_body( body );

    std::vector< boost::json::value > entries;
    if ( auto * bodyArray = jsonBody.if_array( ) )
    {
        entries.assign( bodyArray->begin( ), bodyArray->end( ) );
    }
    else if ( auto * bodyObject = jsonBody.if_object( ) )
    {
        for ( const auto & entry : *bodyObject )
        {
            entries.push_back( entry.value( ) );
        }
    }
    else
    {
        throw ValidationError( "Expected a list of ids" );
    }

    std::vector< std::string > ids;
    ids.reserve( entries.size( ) );
    for ( const auto & entry : entries )
    {
        if ( !entry.is_string( ) )
        {
            throw ValidationError( "Ids must be strings" );
        }
        ids.emplace_back( as_string_view( entry.get_string( ) ) );
    }
    if ( ids.empty( ) )
    {
        throw ValidationError( "Missing required fields" );
    }
    return ids;
}

boost::json::value require_found( std::optional< boost::json::value > result, std::string_view what )
{
    if ( !result )
    {
        throw HttpError( beast::http::status::not_found, fmt::format( "{} not found", what ) );
    }
    return std::move( *result );
}

std::optional< std::string > find_query( const RouteContext & context, const std::string & key )
{
    auto findParam = context.query.find( key );
    if ( findParam == context.query.end( ) )
    {
        return std::nullopt;
    }
    return findParam->second;
}

} // namespace

beast::http::status http_status_for( std::exception_ptr error )
{
    try
    {
        std::rethrow_exception( error );
    }
    catch ( const HttpError & ex )
    {
        return ex.status( );
    }
    catch ( const Transaction::TransactionStepError & ex )
    {
        return ex.cause( ) ? http_status_for( ex.cause( ) ) : beast::http::status::internal_server_error;
    }
    catch ( const ValidationError & )
    {
        return beast::http::status::bad_request;
    }
    catch ( const ConnectivityError & )
    {
        return beast::http::status::service_unavailable;
    }
    catch ( const ApiUnavailableError & )
    {
        return beast::http::status::service_unavailable;
    }
    catch ( const RemoteCallError & )
    {
        return beast::http::status::bad_gateway;
    }
    catch ( const std::exception & )
    {
        return beast::http::status::internal_server_error;
    }
}

std::vector< std::string > split_path( std::string_view path )
{
    std::vector< std::string > segments;
    while ( !path.empty( ) )
    {
        auto separator = path.find( '/' );
        auto segment = path.substr( 0, separator );
        if ( !segment.empty( ) )
        {
            try
            {
                segments.push_back( dec_uri_component( segment ) );
            }
            catch ( const BtsgateError & ex )
            {
                throw ValidationError( fmt::format( "Invalid path segment {}: {}", segment, ex.what( ) ) );
            }
        }
        if ( separator == std::string_view::npos )
        {
            break;
        }
        path.remove_prefix( separator + 1 );
    }
    return segments;
}

std::map< std::string, std::string > parse_query( std::string_view query )
{
    std::map< std::string, std::string > params;
    while ( !query.empty( ) )
    {
        auto separator = query.find( '&' );
        auto pair = query.substr( 0, separator );
        if ( !pair.empty( ) )
        {
            auto equals = pair.find( '=' );
            auto key = pair.substr( 0, equals );
            auto value = equals == std::string_view::npos ? std::string_view( ) : pair.substr( equals + 1 );
            try
            {
                params.insert_or_assign( dec_uri_component( key ), dec_uri_component( value ) );
            }
            catch ( const BtsgateError & ex )
            {
                throw ValidationError( fmt::format( "Invalid query parameter {}: {}", key, ex.what( ) ) );
            }
        }
        if ( separator == std::string_view::npos )
        {
            break;
        }
        query.remove_prefix( separator + 1 );
    }
    return params;
}

HttpRouter::HttpRouter( Gateway & gateway )
    : _gateway( gateway )
{
    register_state_routes( );
    register_api_routes( );
    register_cache_routes( );
}

void HttpRouter::add_route( beast::http::verb verb, std::string_view pattern, RouteHandler handler )
{
    _routes.push_back( Route{ .verb = verb, .pattern = split_path( pattern ), .handler = std::move( handler ) } );
}

std::pair< const HttpRouter::Route *, std::map< std::string, std::string > > HttpRouter::match
(
    beast::http::verb verb,
    std::string_view path
) const
{
    auto segments = split_path( path );

    bool pathMatched = false;
    for ( const auto & route : _routes )
    {
        if ( route.pattern.size( ) != segments.size( ) )
        {
            continue;
        }

        std::map< std::string, std::string > params;
        bool matched = true;
        for ( size_t i = 0; i < segments.size( ); ++i )
        {
            const auto & patternSegment = route.pattern[ i ];
            if ( patternSegment.starts_with( ':' ) )
            {
                params.emplace( patternSegment.substr( 1 ), segments[ i ] );
            }
            else if ( patternSegment != segments[ i ] )
            {
                matched = false;
                break;
            }
        }
        if ( !matched )
        {
            continue;
        }

        pathMatched = true;
        if ( route.verb == verb )
        {
            return { &route, std::move( params ) };
        }
    }

    if ( pathMatched )
    {
        throw HttpError( beast::http::status::method_not_allowed, "Method not allowed" );
    }
    throw HttpError( beast::http::status::not_found, "Route not found" );
}

boost::asio::awaitable< HttpResponse > HttpRouter::do_route( const HttpRequest & request )
{
    HttpResponse response;
    response.version( request.version( ) );
    response.keep_alive( request.keep_alive( ) );

    // Browsers on the same machine only.
    if ( auto findOrigin = request.find( beast::http::field::origin ); findOrigin != request.end( ) )
    {
        auto origin = findOrigin->value( );
        if ( std::string_view( origin.data( ), origin.size( ) ).find( "localhost" ) != std::string_view::npos )
        {
            response.set( beast::http::field::access_control_allow_origin, origin );
            response.set( beast::http::field::vary, "Origin" );
        }
    }

    if ( request.method( ) == beast::http::verb::options )
    {
        response.result( beast::http::status::no_content );
        response.set( beast::http::field::access_control_allow_methods, "GET, POST, OPTIONS" );
        response.set( beast::http::field::access_control_allow_headers, "Content-Type" );
        response.prepare_payload( );
        co_return response;
    }

    std::string_view target( request.target( ).data( ), request.target( ).size( ) );
    auto queryStart = target.find( '?' );
    auto path = target.substr( 0, queryStart );
    auto query = queryStart == std::string_view::npos ? std::string_view( ) : target.substr( queryStart + 1 );

    std::exception_ptr error;
    boost::json::value result;
    try
    {
        auto [ route, params ] = match( request.method( ), path );
        RouteContext context{ .params = std::move( params ), .query = parse_query( query ), .body = request.body( ) };
        result = co_await route->handler( context );
    }
    catch ( const std::exception & )
    {
        error = std::current_exception( );
    }

    if ( error )
    {
        auto status = http_status_for( error );
        std::string message = "unknown error";
        try
        {
            std::rethrow_exception( error );
        }
        catch ( const std::exception & ex )
        {
            message = ex.what( );
        }

        auto method = request.method_string( );
        BTSGATE_LOG_INFO( _logger )
            << fmt::format
            (
                "[{}] {} {} failed with {}: {}",
                name( ),
                std::string_view( method.data( ), method.size( ) ),
                path,
                static_cast< unsigned >( status ),
                message
            );

        response.result( status );
        response.set( beast::http::field::content_type, "text/plain" );
        response.body( ) = fmt::format( "Error: {}", message );
        response.prepare_payload( );
        co_return response;
    }

    response.result( beast::http::status::ok );
    response.set( beast::http::field::content_type, "application/json" );
    response.body( ) = boost::json::serialize( result );
    response.prepare_payload( );
    co_return response;
}

void HttpRouter::register_state_routes( )
{
    add_route
    (
        beast::http::verb::get,
        "/state/currentNodes/:chain",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );

            boost::json::array nodes;
            for ( auto & node : _gateway.current_nodes( chain ) )
            {
                nodes.emplace_back( std::move( node ) );
            }
            co_return nodes;
        }
    );
}

void HttpRouter::register_api_routes( )
{
    add_route
    (
        beast::http::verb::post,
        "/api/deeplink/:chain/:opType",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            auto operationType = Transaction::parse_operation_type( context.params.at( "opType" ) );

            auto jsonBody = parse_body( context.body );
            auto * payloadList = jsonBody.if_array( );
            if ( payloadList == nullptr || payloadList->empty( ) )
            {
                throw ValidationError( "Missing required fields" );
            }
            std::vector< boost::json::value > payloads( payloadList->begin( ), payloadList->end( ) );

            auto deepLink = co_await _gateway.build_deeplink( chain, operationType, std::move( payloads ) );

            boost::json::object response;
            response.emplace( "generatedDeepLink", std::move( deepLink ) );
            co_return response;
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/blockedAccounts/:chain",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( co_await _gateway.blocked_accounts( chain ), "Committee account details" );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/fullAccount/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( co_await _gateway.full_account( chain, context.params.at( "id" ) ), "Account" );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/orderBook/:chain/:quote/:base",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found
            (
                co_await _gateway.order_book( chain, context.params.at( "base" ), context.params.at( "quote" ) ),
                "Order book"
            );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/limitOrders/:chain/:base/:quote",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found
            (
                co_await _gateway.market_limit_orders( chain, context.params.at( "base" ), context.params.at( "quote" ) ),
                "Limit orders"
            );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/accountLookup/:chain/:searchInput",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( co_await _gateway.account_lookup( chain, context.params.at( "searchInput" ) ), "Account" );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/getAccountBalances/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( co_await _gateway.account_balances( chain, context.params.at( "id" ) ), "Account balances" );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/getAccountLimitOrders/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( co_await _gateway.account_limit_orders( chain, context.params.at( "id" ) ), "Account limit orders" );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/getAccountHistory/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );

            History::HistoryQuery query
            {
                .from = find_query( context, "from" ),
                .size = find_query( context, "size" ),
                .fromDate = find_query( context, "from_date" ),
                .toDate = find_query( context, "to_date" ),
                .sortBy = find_query( context, "sort_by" ),
                .type = find_query( context, "type" ),
                .aggField = find_query( context, "agg_field" )
            };

            co_return require_found
            (
                co_await _gateway.account_history( chain, context.params.at( "id" ), std::move( query ) ),
                "Account history"
            );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/api/getPortfolio/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return co_await _gateway.portfolio( chain, context.params.at( "id" ) );
        }
    );

    add_route
    (
        beast::http::verb::post,
        "/api/getObjects/:chain",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return co_await _gateway.fetch_objects( chain, parse_id_list( context.body ) );
        }
    );
}

void HttpRouter::register_cache_routes( )
{
    const std::vector< std::pair< std::string_view, Cache::CacheFile > > documentRoutes
    {
        { "/cache/allassets/:chain", Cache::CacheFile::all_assets },
        { "/cache/offers/:chain", Cache::CacheFile::offers },
        { "/cache/pools/:chain", Cache::CacheFile::pools },
        { "/cache/bitassets/:chain", Cache::CacheFile::min_bitassets },
        { "/cache/feeSchedule/:chain", Cache::CacheFile::fees },
        { "/cache/marketSearch/:chain", Cache::CacheFile::market_search }
    };

    for ( const auto & [ pattern, cacheFile ] : documentRoutes )
    {
        add_route
        (
            beast::http::verb::get,
            pattern,
            [ this, cacheFile = cacheFile ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
            {
                auto chain = parse_chain( context.params.at( "chain" ) );
                co_return require_found( _gateway.cache( ).document( chain, cacheFile ), Cache::cache_file_name( cacheFile ) );
            }
        );
    }

    add_route
    (
        beast::http::verb::get,
        "/cache/pool/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( _gateway.cache( ).pool( chain, context.params.at( "id" ) ), "Pool" );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/cache/dynamic/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( _gateway.cache( ).dynamic_data( chain, context.params.at( "id" ) ), "Dynamic data" );
        }
    );

    add_route
    (
        beast::http::verb::get,
        "/cache/asset/:chain/:id",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return require_found( _gateway.cache( ).asset( chain, context.params.at( "id" ) ), "Asset" );
        }
    );

    add_route
    (
        beast::http::verb::post,
        "/cache/assets/:chain",
        [ this ]( RouteContext & context ) -> boost::asio::awaitable< boost::json::value >
        {
            auto chain = parse_chain( context.params.at( "chain" ) );
            co_return _gateway.cache( ).assets( chain, parse_id_list( context.body ) );
        }
    );
}

} // namespace Http
} // namespace Btsgate
