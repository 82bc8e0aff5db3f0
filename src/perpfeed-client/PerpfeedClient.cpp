#include "perpfeed/Anchor/AccountsCoder.hpp"
#include "perpfeed/Anchor/IdlRegistry.hpp"

#include "perpfeed/Core/PublicKey.hpp"

#include "perpfeed/Jupiter/JupiterConnectorConfig.hpp"
#include "perpfeed/Jupiter/JupiterMarketDataClient/JupiterMarketDataClient.hpp"
#include "perpfeed/Jupiter/JupiterTypes.hpp"

#include "perpfeed/Pyth/PythTypes.hpp"

#include "perpfeed/Solana/SolanaHttpClient/SolanaHttpClient.hpp"
#include "perpfeed/Solana/SolanaHttpMessage.hpp"

#include "perpfeed/Util/Logger.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <boost/json/serialize.hpp>
#include <boost/json/value_from.hpp>

#include <boost/program_options.hpp>

#include <simdjson.h>

#include <fmt/format.h>

#include <iostream>
#include <optional>
#include <unordered_map>

namespace asio = boost::asio;
namespace po = boost::program_options;
namespace fs = std::filesystem;

//
// Perpfeed command-line tool.
//

namespace Perpfeed
{

static std::string get_version( ) { return "0.1.0"; }

// Connector options. Empty values keep the config file or environment defaults.

#define DECLARE_CONFIG_PATH_OPTION( configPath ) \
( \
    "config_path", \
    po::value< fs::path >( configPath ), \
    "Path to connector config json file." \
)

#define DECLARE_SOLANA_RPC_URL_OPTION( solanaRpcUrl ) \
( \
    "solana_rpc_url,r", \
    po::value< std::string >( solanaRpcUrl ), \
    "Solana RPC endpoint url, overrides JUPITER_SOLANA_RPC_URL." \
)

#define DECLARE_POOL_ADDRESS_OPTION( poolAddress ) \
( \
    "pool_address", \
    po::value< std::string >( poolAddress ), \
    "Jupiter Perpetuals pool account address, overrides JUPITER_PERPS_POOL_ADDRESS." \
)

#define DECLARE_PROXY_URL_OPTION( proxyUrl ) \
( \
    "proxy_url", \
    po::value< std::string >( proxyUrl ), \
    "Forward proxy url, takes precedence over JUPITER_SOLANA_RPC_PROXY, HTTPS_PROXY and HTTP_PROXY." \
)

#define DECLARE_IDL_PATH_OPTION( idlPath ) \
( \
    "idl_path", \
    po::value< fs::path >( idlPath ), \
    "Path to the program interface description json file." \
)

#define DECLARE_MOCK_FEED_PATH_OPTION( mockFeedPath ) \
( \
    "mock_feed_path", \
    po::value< fs::path >( mockFeedPath ), \
    "Path to the fallback market feed, overrides PERP_MOCK_PATH." \
)

#define DECLARE_COMMITMENT_OPTION( commitment ) \
( \
    "commitment", \
    po::value< std::string >( commitment ), \
    "Commitment level: processed, confirmed or finalized." \
)

#define DECLARE_REQUEST_TIMEOUT_OPTION( requestTimeout ) \
( \
    "request_timeout", \
    po::value< uint64_t >( requestTimeout ), \
    "Network timeout in milliseconds." \
)

#define DECLARE_MODE_OPTION( mode ) \
( \
    "mode", \
    po::value< std::string >( mode ), \
    "Fetch mode: auto, live or mock." \
)

#define DECLARE_ACCOUNT_OPTION( account ) \
( \
    "account,a", \
    po::value< std::string >( account )->required( ), \
    "Account address." \
)

#define DECLARE_ACCOUNT_TYPE_OPTION( accountType ) \
( \
    "account_type,t", \
    po::value< std::string >( accountType ), \
    "Account layout name, resolved from the discriminator when omitted." \
)

struct ConnectorOptions
{
    // Throws on an unreadable config file or invalid values.
    Jupiter::JupiterConnectorConfig resolve( ) const
    {
        Jupiter::JupiterConnectorConfig config;
        if ( !configPath.empty( ) )
        {
            simdjson::ondemand::parser parser;
            simdjson::padded_string configBuffer = simdjson::padded_string::load( configPath.native( ) );
            simdjson::ondemand::document doc = parser.iterate( configBuffer );
            simdjson::ondemand::value jsonValue( doc );
            config = json_to< Jupiter::JupiterConnectorConfig >( jsonValue );
        }
        else
        {
            config = Jupiter::JupiterConnectorConfig::from_environment( );
        }

        if ( !solanaRpcUrl.empty( ) ) config.solanaRpcUrl = solanaRpcUrl;
        if ( !poolAddress.empty( ) ) config.poolAddress = Jupiter::parse_pool_address( poolAddress );
        if ( !proxyUrl.empty( ) ) config.proxyUrl = proxyUrl;
        if ( !idlPath.empty( ) ) config.idlPath = idlPath;
        if ( !mockFeedPath.empty( ) ) config.mockFeedPath = mockFeedPath;
        if ( !commitment.empty( ) ) config.commitment = Solana::commitment_from_name( commitment );
        if ( requestTimeout ) config.requestTimeout = std::chrono::milliseconds( requestTimeout );
        if ( !mode.empty( ) ) config.mode = Jupiter::fetch_mode_from_name( mode );
        return config;
    }

    fs::path configPath;
    std::string solanaRpcUrl;
    std::string poolAddress;
    std::string proxyUrl;
    fs::path idlPath;
    fs::path mockFeedPath;
    std::string commitment;
    uint64_t requestTimeout = 0;
    std::string mode;
};

static Solana::SolanaHttpClientConfig make_solana_http_client_config( const Jupiter::JupiterConnectorConfig & config )
{
    return Solana::SolanaHttpClientConfig
    {
        .endpoint = Solana::SolanaEndpointConfig::from_url( config.solanaRpcUrl ),
        .proxyLookup = Io::make_proxy_lookup( config.proxyUrl ),
        .transportOptions = { .timeout = config.requestTimeout, .verifyPeer = config.verifyPeer },
        .requestTimeout = config.requestTimeout
    };
}

static std::string discriminator_hex( const Anchor::Discriminator & discriminator )
{
    std::string hex;
    for ( auto byte : discriminator )
    {
        hex += fmt::format( "{:02x}", std::to_integer< uint8_t >( byte ) );
    }
    return hex;
}

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
    std::string _name;
    po::options_description _commandOptions;

    mutable PerpfeedLogger _logger;
};

class FetchMarketsCommand : public ClientCommand
{
public:
    FetchMarketsCommand( ) : ClientCommand( "fetch_markets" )
    {
        _commandOptions.add_options( )
            DECLARE_CONFIG_PATH_OPTION( &_options.configPath )
            DECLARE_SOLANA_RPC_URL_OPTION( &_options.solanaRpcUrl )
            DECLARE_POOL_ADDRESS_OPTION( &_options.poolAddress )
            DECLARE_PROXY_URL_OPTION( &_options.proxyUrl )
            DECLARE_IDL_PATH_OPTION( &_options.idlPath )
            DECLARE_MOCK_FEED_PATH_OPTION( &_options.mockFeedPath )
            DECLARE_COMMITMENT_OPTION( &_options.commitment )
            DECLARE_REQUEST_TIMEOUT_OPTION( &_options.requestTimeout )
            DECLARE_MODE_OPTION( &_options.mode );
    }

    int on_command( ) const & override
    {
        auto config = _options.resolve( );

        PERPFEED_LOG_INFO( _logger ) << fmt::format( "Fetching Jupiter Perps markets, mode: {}", Jupiter::fetch_mode_name( config.mode ) );

        asio::io_context ioContext;
        Jupiter::JupiterMarketDataClient marketDataClient( ioContext, config );

        auto snapshot = marketDataClient.get_markets( config.mode, asio::use_future ).get( );

        std::cout << boost::json::serialize( boost::json::value_from( snapshot ) ) << std::endl;
        return 0;
    }

private:
    ConnectorOptions _options;
};

class DecodeAccountCommand : public ClientCommand
{
public:
    DecodeAccountCommand( ) : ClientCommand( "decode_account" )
    {
        _commandOptions.add_options( )
            DECLARE_ACCOUNT_OPTION( &_account )
            DECLARE_ACCOUNT_TYPE_OPTION( &_accountType )
            DECLARE_CONFIG_PATH_OPTION( &_options.configPath )
            DECLARE_SOLANA_RPC_URL_OPTION( &_options.solanaRpcUrl )
            DECLARE_PROXY_URL_OPTION( &_options.proxyUrl )
            DECLARE_IDL_PATH_OPTION( &_options.idlPath )
            DECLARE_COMMITMENT_OPTION( &_options.commitment )
            DECLARE_REQUEST_TIMEOUT_OPTION( &_options.requestTimeout );
    }

    int on_command( ) const & override
    {
        auto config = _options.resolve( );
        auto accountAddress = Core::base58_to_public_key( _account );
        auto coder = Jupiter::make_jupiter_coder( config.idlPath );

        asio::io_context ioContext;
        Solana::SolanaHttpClient solanaHttpClient( ioContext, make_solana_http_client_config( config ) );

        auto response = solanaHttpClient.send_request< Solana::GetAccountInfoRequest, Solana::GetAccountInfoResponse >
        (
            { .accountPublicKey = accountAddress, .commitment = config.commitment },
            asio::use_future
        )
        .get( );

        if ( !response.accountInfo )
        {
            PERPFEED_LOG_ERROR( _logger ) << fmt::format( "Account {} not found", accountAddress );
            return 1;
        }

        std::string accountType = _accountType;
        Anchor::Value value;
        if ( accountType.empty( ) )
        {
            std::tie( accountType, value ) = coder->decode_any( response.accountInfo->data );
        }
        else
        {
            value = coder->decode( Anchor::to_camel_case( accountType ), response.accountInfo->data );
        }

        boost::json::object output
        {
            { "account", accountAddress.enc_base58_text( ) },
            { "accountType", accountType },
            { "slot", response.contextSlot },
            { "value", boost::json::value_from( value ) }
        };
        std::cout << boost::json::serialize( output ) << std::endl;
        return 0;
    }

private:
    std::string _account;
    std::string _accountType;
    ConnectorOptions _options;
};

class OraclePriceCommand : public ClientCommand
{
public:
    OraclePriceCommand( ) : ClientCommand( "oracle_price" )
    {
        _commandOptions.add_options( )
            DECLARE_ACCOUNT_OPTION( &_account )
            DECLARE_CONFIG_PATH_OPTION( &_options.configPath )
            DECLARE_SOLANA_RPC_URL_OPTION( &_options.solanaRpcUrl )
            DECLARE_PROXY_URL_OPTION( &_options.proxyUrl )
            DECLARE_COMMITMENT_OPTION( &_options.commitment )
            DECLARE_REQUEST_TIMEOUT_OPTION( &_options.requestTimeout );
    }

    int on_command( ) const & override
    {
        auto config = _options.resolve( );
        auto accountAddress = Core::base58_to_public_key( _account );

        asio::io_context ioContext;
        Solana::SolanaHttpClient solanaHttpClient( ioContext, make_solana_http_client_config( config ) );

        auto accountResponse = solanaHttpClient.send_request< Solana::GetAccountInfoRequest, Solana::GetAccountInfoResponse >
        (
            { .accountPublicKey = accountAddress, .commitment = config.commitment },
            asio::use_future
        )
        .get( );
        auto slotResponse = solanaHttpClient.send_request< Solana::GetSlotRequest, Solana::GetSlotResponse >
        (
            { .commitment = config.commitment },
            asio::use_future
        )
        .get( );

        if ( !accountResponse.accountInfo )
        {
            PERPFEED_LOG_ERROR( _logger ) << fmt::format( "Oracle account {} not found", accountAddress );
            return 1;
        }

        auto priceAccount = Pyth::parse_price_account( accountResponse.accountInfo->data );

        boost::json::object output
        {
            { "account", accountAddress.enc_base58_text( ) },
            { "currentSlot", slotResponse.slot },
            { "price", boost::json::value_from( priceAccount ) }
        };
        std::cout << boost::json::serialize( output ) << std::endl;
        return 0;
    }

private:
    std::string _account;
    ConnectorOptions _options;
};

class ListLayoutsCommand : public ClientCommand
{
public:
    ListLayoutsCommand( ) : ClientCommand( "list_layouts" )
    {
        _commandOptions.add_options( )
            DECLARE_CONFIG_PATH_OPTION( &_options.configPath )
            DECLARE_IDL_PATH_OPTION( &_options.idlPath );
    }

    int on_command( ) const & override
    {
        auto config = _options.resolve( );
        auto registry = Anchor::load_registry( config.idlPath );

        std::cout << "Program: " << registry.program_name( ) << std::endl;
        for ( const auto & account : registry.accounts( ) )
        {
            std::cout << account.name
                      << " [" << discriminator_hex( account.discriminator ) << "] "
                      << Anchor::type_signature( *registry.type( account.name ).type )
                      << std::endl;
        }
        return 0;
    }

private:
    ConnectorOptions _options;
};

class PerpfeedClient
{
public:
    explicit PerpfeedClient( const std::string & programName )
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

        _hiddenArguments.add_options( )
            ( "command", po::value< std::string >( ), "Command to execute" );
        _positionalArguments.add( "command", 1 );

        _clientArguments.add( _optionalArguments );
        _clientArguments.add( _hiddenArguments );

        register_command( std::make_unique< Perpfeed::FetchMarketsCommand >( ) );
        register_command( std::make_unique< Perpfeed::DecodeAccountCommand >( ) );
        register_command( std::make_unique< Perpfeed::OraclePriceCommand >( ) );
        register_command( std::make_unique< Perpfeed::ListLayoutsCommand >( ) );
    }

    std::optional< po::variables_map > parse_command_line( int argc, char ** argv )
    {
        try
        {
            po::variables_map parsedArgs;
            po::store(
                po::command_line_parser( argc, argv ).options( _clientArguments ).positional( _positionalArguments ).run( ),
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

        try
        {
            return findCommand->second->on_command( );
        }
        catch ( const std::exception & ex )
        {
            PERPFEED_LOG_ERROR_GLOBAL( ) << fmt::format( "{} failed: {}", command, ex.what( ) );
            return 1;
        }
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
        std::cout << _programName << " reads Jupiter Perpetuals market data from Solana\n" << std::endl;
    };

    void print_usage_error( const std::string & error ) const
    {
        std::cerr << "usage: " << _programName << " [-h] command ...\n";
        std::cerr << _programName << ": error: " << error << std::endl;
    }

    void print_help( ) const
    {
        print_usage( );
        std::cout << _optionalArguments << std::endl;
    }

    void print_command_help( const std::string & command ) const
    {
        print_usage( );
        std::cout << _optionalArguments << std::endl;
        std::cout << _clientCommands.at( command )->get_command_options( ) << std::endl;
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

    void print_version( ) const
    {
        std::cout << _programName << " client version: " << get_version( ) << std::endl;
    }

private:
    void register_command( std::unique_ptr< Perpfeed::ClientCommand > command )
    {
        const auto & commandName = command->command_name( );
        auto inserted = _clientCommands.emplace( commandName, std::move( command ) ).second;
        BOOST_ASSERT_MSG( inserted, "Registered duplicate command" );
    }

    std::string _programName;

    po::options_description _clientArguments;
    po::options_description _optionalArguments;
    po::options_description _hiddenArguments;
    po::positional_options_description _positionalArguments;
    std::unordered_map< std::string, std::unique_ptr< Perpfeed::ClientCommand > > _clientCommands;
};

} // namespace Perpfeed

int main( int argc, char ** argv )
{
    auto programName = fs::path( argv[ 0 ] ).filename( );
    Perpfeed::PerpfeedClient perpfeedClient( programName );

    std::string command;
    if ( argc > 1 )
    {
        command = argv[ 1 ];
        if ( perpfeedClient.is_command_valid( command ) )
        {
            perpfeedClient.add_command( command );
        }
    }

    auto parsedArgs = perpfeedClient.parse_command_line( argc, argv );
    if ( !parsedArgs ) return 1;

    if ( parsedArgs->count( "help" ) )
    {
        perpfeedClient.is_command_valid( command ) ? perpfeedClient.print_command_help( command ) : perpfeedClient.print_positional_help( );
        return 0;
    }

    if ( parsedArgs->count( "version" ) )
    {
        perpfeedClient.print_version( );
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
    Perpfeed::init_logger( logLevel );

    if ( !perpfeedClient.is_command_valid( command ) )
    {
        perpfeedClient.print_positional_help( );
        return 1;
    }

    // Execute user's command.
    return perpfeedClient.execute_command( command );
};
