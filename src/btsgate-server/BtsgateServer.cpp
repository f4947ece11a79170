#include <boost/preprocessor/stringize.hpp>

// Gateway
#include "btsgate/Gateway/Gateway.hpp"
#include "btsgate/Gateway/GatewayTypes.hpp"

// Http
#include "btsgate/Http/HttpServer/HttpServer.hpp"

// Chain and transaction types
#include "btsgate/Chain/ChainTypes.hpp"
#include "btsgate/Transaction/OperationType.hpp"

// Utils
#include "btsgate/Util/Logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>

#include <boost/json/parse.hpp>

#include <boost/program_options.hpp>

#include <simdjson.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <unordered_map>

namespace asio = boost::asio;
namespace po = boost::program_options;
namespace fs = std::filesystem;

//
// Btsgate command-line tool.
//

namespace Btsgate
{

static std::string get_version( ) { return "0.1.0"; }

static fs::path gateway_config_default( ) { return "config/gateway.json"; }

static std::string listen_address_default( ) { return "0.0.0.0"; }
static constexpr uint16_t listen_port_default( ) { return 8080; }

// Gateway options.

#define DECLARE_GATEWAY_CONFIG_OPTION( configPath ) \
( \
    "config,c", \
    po::value< fs::path >( configPath )->default_value( gateway_config_default( ) ), \
    "Path to gateway config json file." \
)

#define DECLARE_CHAIN_OPTION( chain ) \
( \
    "chain", \
    po::value< std::string >( chain )->required( ), \
    "Target chain: bitshares or bitshares_testnet." \
)

// Transaction options.

#define DECLARE_OPERATION_TYPE_OPTION( operationType ) \
( \
    "op_type", \
    po::value< std::string >( operationType )->required( ), \
    "Operation type name, e.g. transfer or limit_order_create." \
)

#define DECLARE_PAYLOAD_FILE_OPTION( payloadFile ) \
( \
    "payload_file", \
    po::value< fs::path >( payloadFile )->required( ), \
    "Path to a json file holding the array of operation payloads." \
)

// HTTP server options.

#define DECLARE_LISTEN_ADDRESS_OPTION( listenAddress ) \
( \
    "listen_address,a", \
    po::value< std::string >( listenAddress )->default_value( listen_address_default( ) ), \
    "Gateway HTTP listen address." \
)

#define DECLARE_LISTEN_PORT_OPTION( listenPort ) \
( \
    "listen_port,l", \
    po::value< uint16_t >( listenPort )->default_value( listen_port_default( ) ), \
    "Gateway HTTP listen port." \
)

class ClientCommand
{
public:
    ClientCommand( const std::string & name ) : _name( name ), _commandOptions( _name ) { }
    virtual ~ClientCommand( ) = default;

    const std::string & command_name( ) const { return _name; }
    const po::options_description & get_command_options( ) const { return _commandOptions; }

    // Returns 0 on success, otherwise error code.
    virtual int on_command( ) const & = 0;

protected:
    std::optional< GatewayConfig > load_config( const fs::path & configPath ) const
    {
        try
        {
            return load_gateway_config( configPath );
        }
        catch ( const std::exception & ex )
        {
            BTSGATE_LOG_ERROR( _logger ) << "Error loading config: " << ex.what( );
            return { };
        }
    }

    std::string _name;
    po::options_description _commandOptions;

    mutable BtsgateLogger _logger;
};

class GatewayServerCommand : public ClientCommand
{
public:
    GatewayServerCommand( ) : ClientCommand( "gateway_server" )
    {
        _commandOptions.add_options( )
            DECLARE_GATEWAY_CONFIG_OPTION( &_configPath )
            DECLARE_LISTEN_ADDRESS_OPTION( &_listenAddress )
            DECLARE_LISTEN_PORT_OPTION( &_listenPort );
    }

    int on_command( ) const & override
    {
        boost::system::error_code errorCode;
        auto listenAddress = boost::asio::ip::make_address( _listenAddress, errorCode );
        if ( errorCode )
        {
            BTSGATE_LOG_ERROR( _logger ) << "Invalid listen address: " << errorCode.message( );
            return 1;
        }

        auto config = load_config( _configPath );
        if ( !config )
        {
            return 1;
        }

        BTSGATE_LOG_INFO( _logger ) << "Starting gateway server";

        boost::asio::io_context ioContext;
        try
        {
            Gateway gateway( ioContext, std::move( *config ) );
            Http::HttpServer httpServer( ioContext, gateway, boost::asio::ip::tcp::endpoint( listenAddress, _listenPort ) );
        }
        catch ( const std::exception & ex )
        {
            BTSGATE_LOG_ERROR( _logger ) << "Error starting gateway: " << ex.what( );
            return 1;
        }

        // Services run on their own threads, the main thread only waits for a stop signal.
        boost::asio::signal_set signals( ioContext, SIGINT, SIGTERM );
        signals.async_wait( [ this ]( const boost::system::error_code &, int signal )
        {
            BTSGATE_LOG_INFO( _logger ) << "Received signal: " << signal << ", shutting down";
        } );
        ioContext.run( );

        BTSGATE_LOG_INFO( _logger ) << "Exiting gateway server";

        return 0;
    }

private:
    fs::path _configPath;

    std::string _listenAddress;
    uint16_t _listenPort;
};

class BuildDeeplinkCommand : public ClientCommand
{
public:
    BuildDeeplinkCommand( ) : ClientCommand( "build_deeplink" )
    {
        _commandOptions.add_options( )
            DECLARE_GATEWAY_CONFIG_OPTION( &_configPath )
            DECLARE_CHAIN_OPTION( &_chain )
            DECLARE_OPERATION_TYPE_OPTION( &_operationType )
            DECLARE_PAYLOAD_FILE_OPTION( &_payloadFile );
    }

    int on_command( ) const & override
    {
        auto config = load_config( _configPath );
        if ( !config )
        {
            return 1;
        }

        Chain chain;
        Transaction::OperationType operationType;
        std::vector< boost::json::value > payloads;
        try
        {
            chain = parse_chain( _chain );
            operationType = Transaction::parse_operation_type( _operationType );

            simdjson::padded_string payloadBuffer = simdjson::padded_string::load( _payloadFile.native( ) );
            auto payloadJson = boost::json::parse( std::string_view( payloadBuffer ) );
            if ( !payloadJson.is_array( ) )
            {
                std::cerr << "Payload file must hold a json array" << std::endl;
                return 1;
            }
            payloads.assign( payloadJson.get_array( ).begin( ), payloadJson.get_array( ).end( ) );
        }
        catch ( const std::exception & ex )
        {
            std::cerr << "Invalid arguments: " << ex.what( ) << std::endl;
            return 1;
        }

        boost::asio::io_context ioContext;
        try
        {
            Gateway gateway( ioContext, std::move( *config ) );
            auto deepLink = gateway.build_deeplink( chain, operationType, std::move( payloads ), boost::asio::use_future ).get( );
            std::cout << deepLink << std::endl;
        }
        catch ( const std::exception & ex )
        {
            std::cerr << "Error building deeplink: " << ex.what( ) << std::endl;
            return 1;
        }

        return 0;
    }

private:
    fs::path _configPath;
    std::string _chain;
    std::string _operationType;
    fs::path _payloadFile;
};

class CurrentNodesCommand : public ClientCommand
{
public:
    CurrentNodesCommand( ) : ClientCommand( "current_nodes" )
    {
        _commandOptions.add_options( )
            DECLARE_GATEWAY_CONFIG_OPTION( &_configPath )
            DECLARE_CHAIN_OPTION( &_chain );
    }

    int on_command( ) const & override
    {
        auto config = load_config( _configPath );
        if ( !config )
        {
            return 1;
        }

        try
        {
            auto chain = parse_chain( _chain );
            for ( const auto & node : config->chains.at( chain ).nodes )
            {
                std::cout << node << "\n";
            }
            std::cout << std::flush;
        }
        catch ( const std::exception & ex )
        {
            std::cerr << "Error: " << ex.what( ) << std::endl;
            return 1;
        }

        return 0;
    }

private:
    fs::path _configPath;
    std::string _chain;
};

class BtsgateServer
{
public:
    explicit BtsgateServer( const std::string & programName )
        : _programName( programName )
        , _clientArguments( "Options" )
        , _optionalArguments( "optional arguments" )
    {
        _optionalArguments.add_options( )
            ( "help,h", "Show the help message and exit" )
            (
                "log_level",
                po::value< std::string >( )->default_value( "info" ),
                "Filter console logs by severity"
            )
            ( "version,V", "Show the version number and exit" );

        _clientArguments.add( _optionalArguments );

        register_command( std::make_unique< Btsgate::BuildDeeplinkCommand >( ) );
        register_command( std::make_unique< Btsgate::CurrentNodesCommand >( ) );
        register_command( std::make_unique< Btsgate::GatewayServerCommand >( ) );
    }

    std::optional< po::variables_map > parse_command_line( int argc, char ** argv )
    {
        try
        {
            po::variables_map parsedArgs;
            po::store(
                po::command_line_parser( argc, argv ).options( _clientArguments ).run( ),
                parsedArgs );
            notify( parsedArgs );
            return { parsedArgs };
        }
        catch ( std::exception & ex )
        {
            print_usage_error( ex.what( ) );
            return { };
        }
    }

    bool is_command_valid( const std::string & command ) const
    {
        return _clientCommands.contains( command );
    }

    int execute_command( const std::string & command ) const
    {
        const auto & findCommand = _clientCommands.find( command );
        if ( findCommand == _clientCommands.end( ) )
        {
            print_usage_error( "invalid command: " + command );
            return 1;
        }
        return findCommand->second->on_command( );
    }

    void add_command( const std::string & command )
    {
        const auto & findCommand = _clientCommands.find( command );
        BOOST_ASSERT_MSG( findCommand != _clientCommands.end( ), "Unknown command" );

        const auto * clientCommand = findCommand->second.get( );
        _clientArguments.add( clientCommand->get_command_options( ) );
    }

    void print_usage( ) const
    {
        std::cout << "usage: " << _programName << " [-h] command ...\n" << std::endl;
        std::cout << _programName << " serves BitShares chain queries and builds signing requests over HTTP\n" << std::endl;
    };

    void print_usage_error( const std::string & error ) const
    {
        std::cerr << "usage: " << _programName << " [-h] command ...\n";
        std::cerr << _programName << ": error: " << error << std::endl;
    }

    void print_help( ) const
    {
        print_usage( );
        std::cout << _clientArguments << std::endl;
    }

    void print_positional_help( ) const
    {
        print_help( );

        std::cout << "positional arguments:\n";
        std::cout << "  command:\n";
        for ( const auto & [ commandName, _ ] : _clientCommands )
        {
            std::cout << "    " << commandName << "\n";
        }
        std::cout << std::endl;
    }

    void print_version( )
    {
        std::cout << _programName << " version: " << get_version( ) << std::endl;
    }

private:
    void register_command( std::unique_ptr< Btsgate::ClientCommand > command )
    {
        const auto & commandName = command->command_name( );
        auto inserted = _clientCommands.emplace( commandName, std::move( command ) ).second;
        BOOST_ASSERT_MSG( inserted, "Registered duplicate command" );
    }

    std::string _programName;

    po::options_description _clientArguments;
    po::options_description _optionalArguments;
    std::unordered_map< std::string, std::unique_ptr< Btsgate::ClientCommand > > _clientCommands;
};

} // namespace Btsgate

int main( int argc, char ** argv )
{
    auto programName = fs::path( argv[ 0 ] ).filename( );
    Btsgate::BtsgateServer btsgateServer( programName );

    std::string command;
    if ( argc > 1 )
    {
        command = argv[ 1 ];
        if ( btsgateServer.is_command_valid( command ) )
        {
            btsgateServer.add_command( command );
        }
    }

    auto parsedArgs = btsgateServer.parse_command_line( argc, argv );
    if ( !parsedArgs ) return 1;

    if ( parsedArgs->count( "help" ) )
    {
        btsgateServer.is_command_valid( command ) ? btsgateServer.print_help( ) : btsgateServer.print_positional_help( );
        return 0;
    }

    if ( parsedArgs->count( "version" ) )
    {
        btsgateServer.print_version( );
        return 0;
    }

    // Initialize logger and severity filter.
    boost::log::trivial::severity_level logLevel;
    const auto & logLevelArg = parsedArgs->find( "log_level" );
    BOOST_ASSERT_MSG( logLevelArg != parsedArgs->end( ), "Expected log_level command-line option" );

    const auto & logLevelString = logLevelArg->second.as< std::string >( );
    auto success = boost::log::trivial::from_string( logLevelString.data( ), logLevelString.size( ), logLevel );
    if ( !success )
    {
        std::cerr << "Invalid log-level option, valid options are: trace, debug, info, warning, error" << std::endl;
        return 1;
    }
    Btsgate::init_logger( logLevel );

    // Execute user's command.
    return btsgateServer.execute_command( command );
};
