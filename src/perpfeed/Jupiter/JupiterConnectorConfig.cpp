#include "perpfeed/Jupiter/JupiterConnectorConfig.hpp"

#include "perpfeed/Jupiter/JupiterTypes.hpp"
#include "perpfeed/Jupiter/MockMarketFeed.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace Perpfeed
{
namespace Jupiter
{

namespace
{

std::string environment_or( std::string_view variable, std::string_view fallback )
{
    const char * value = std::getenv( variable.data( ) );
    return value && *value ? std::string( value ) : std::string( fallback );
}

} // namespace

Core::PublicKey parse_pool_address( std::string_view text )
{
    Core::PublicKey address;
    if ( !address.init_from_base58( text ) )
    {
        throw ConfigurationError( fmt::format( "Invalid pool address '{}'", text ) );
    }
    return address;
}

JupiterConnectorConfig JupiterConnectorConfig::from_environment( )
{
    return JupiterConnectorConfig
    {
        .solanaRpcUrl = environment_or( rpc_url_variable( ), default_rpc_url( ) ),
        .poolAddress = parse_pool_address( environment_or( pool_address_variable( ), default_pool_address( ) ) ),
        .proxyUrl = std::nullopt,
        .idlPath = PERPFEED_JUPITER_IDL_PATH,
        .mockFeedPath = mock_feed_path_from_environment( )
    };
}

JupiterConnectorConfig tag_invoke( json_to_tag< JupiterConnectorConfig >, simdjson::ondemand::value jsonValue )
{
    auto config = JupiterConnectorConfig::from_environment( );

    for ( auto field : jsonValue.get_object( ) )
    {
        std::string_view key = field.unescaped_key( ).value( );
        auto value = field.value( );

        if ( key == "solanaRpcUrl" ) config.solanaRpcUrl = std::string( value.get_string( ).value( ) );
        else if ( key == "poolAddress" ) config.poolAddress = parse_pool_address( value.get_string( ).value( ) );
        else if ( key == "proxyUrl" ) config.proxyUrl = std::string( value.get_string( ).value( ) );
        else if ( key == "idlPath" ) config.idlPath = std::string( value.get_string( ).value( ) );
        else if ( key == "mockFeedPath" ) config.mockFeedPath = std::string( value.get_string( ).value( ) );
        else if ( key == "commitment" ) config.commitment = Solana::commitment_from_name( value.get_string( ).value( ) );
        else if ( key == "requestTimeoutMs" ) config.requestTimeout = std::chrono::milliseconds( value.get_uint64( ).value( ) );
        else if ( key == "mode" ) config.mode = fetch_mode_from_name( value.get_string( ).value( ) );
        else if ( key == "verifyPeer" ) config.verifyPeer = value.get_bool( ).value( );
        else
        {
            throw ConfigurationError( fmt::format( "Unknown connector config member '{}'", key ) );
        }
    }

    return config;
}

} // namespace Jupiter
} // namespace Perpfeed
