#include "btsgate/Node/SessionManager/SessionManager.hpp"

#include <boost/json/array.hpp>

namespace Btsgate
{
namespace Node
{

namespace
{

constexpr uint64_t LOGIN_API_ID = 1;

} // namespace

SessionManager::SessionManager
(
    EndpointRegistry & endpointRegistry,
    NodeConnectionFactory connectionFactory,
    std::chrono::milliseconds connectTimeout
)
    : _endpointRegistry( endpointRegistry )
    , _connectionFactory( std::move( connectionFactory ) )
    , _connectTimeout( connectTimeout )
{ }

boost::asio::awaitable< std::unique_ptr< NodeSession > > SessionManager::do_open
(
    Chain chain,
    std::optional< std::chrono::milliseconds > connectTimeout
)
{
    auto url = _endpointRegistry.current_endpoint( chain );
    auto connection = _connectionFactory( parse_node_endpoint( url ) );

    BTSGATE_LOG_DEBUG( _logger ) << fmt::format( "[{}][{}] Opening session: {}", name( ), chain_name( chain ), url );

    std::map< NodeApi, uint64_t > apiIds;
    std::exception_ptr error;
    std::string failure;
    try
    {
        co_await connection->do_connect( connectTimeout.value_or( _connectTimeout ) );
        apiIds = co_await do_login( *connection, url );
    }
    catch ( const std::exception & ex )
    {
        error = std::current_exception( );
        failure = ex.what( );
    }

    if ( error )
    {
        co_await connection->do_close( );
        auto next = _endpointRegistry.rotate_if_current( chain, url );
        BTSGATE_LOG_ERROR( _logger )
            << fmt::format( "[{}][{}] Couldn't open session to {}: {}, next endpoint: {}", name( ), chain_name( chain ), url, failure, next );
        throw ConnectivityError( fmt::format( "Couldn't connect to {}: {}", url, failure ) );
    }

    co_return std::make_unique< NodeSession >( chain, std::move( url ), std::move( connection ), std::move( apiIds ) );
}

boost::asio::awaitable< std::map< NodeApi, uint64_t > > SessionManager::do_login( NodeConnection & connection, const std::string & url )
{
    auto loggedIn = co_await connection.do_call( LOGIN_API_ID, "login", boost::json::array{ "", "" } );
    if ( !loggedIn.is_bool( ) || !loggedIn.get_bool( ) )
    {
        throw ConnectivityError( "Login refused" );
    }

    std::map< NodeApi, uint64_t > apiIds{ { NodeApi::login, LOGIN_API_ID } };

    const auto registerApi = [ & ]( NodeApi api, std::string_view apiName ) -> boost::asio::awaitable< void >
    {
        try
        {
            auto apiId = co_await connection.do_call( LOGIN_API_ID, std::string( apiName ), boost::json::array{ } );
            apiIds.emplace( api, apiId.to_number< uint64_t >( ) );
        }
        catch ( const RemoteCallError & ex )
        {
            BTSGATE_LOG_INFO( _logger ) << fmt::format( "[{}][{}] Api {} not granted: {}", name( ), url, apiName, ex.what( ) );
        }
        catch ( const boost::system::system_error & ex )
        {
            BTSGATE_LOG_INFO( _logger ) << fmt::format( "[{}][{}] Invalid {} api id: {}", name( ), url, apiName, ex.what( ) );
        }
    };

    co_await registerApi( NodeApi::database, "database" );
    co_await registerApi( NodeApi::orders, "orders" );

    co_return apiIds;
}

} // namespace Node
} // namespace Btsgate
