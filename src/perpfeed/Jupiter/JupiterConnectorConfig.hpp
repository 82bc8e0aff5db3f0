#pragma once

#include "perpfeed/Core/PublicKey.hpp"
#include "perpfeed/Jupiter/MarketTypes.hpp"
#include "perpfeed/Solana/SolanaTypes.hpp"
#include "perpfeed/Util/JsonUtils.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

// Interface description shipped with the sources, baked in by the build.
#ifndef PERPFEED_JUPITER_IDL_PATH
#define PERPFEED_JUPITER_IDL_PATH "idl/jupiter_perpetuals.json"
#endif

namespace Perpfeed
{
namespace Jupiter
{

static constexpr std::string_view rpc_url_variable( ) { return "JUPITER_SOLANA_RPC_URL"; }
static constexpr std::string_view pool_address_variable( ) { return "JUPITER_PERPS_POOL_ADDRESS"; }

struct JupiterConnectorConfig
{
    // Built-in defaults with environment overrides.
    static JupiterConnectorConfig from_environment( );

    // Members present in the document override from_environment( ).
    friend JupiterConnectorConfig tag_invoke( json_to_tag< JupiterConnectorConfig >, simdjson::ondemand::value jsonValue );

    std::string solanaRpcUrl;
    Core::PublicKey poolAddress;
    std::optional< std::string > proxyUrl; // Empty defers to the proxy environment variables.
    std::filesystem::path idlPath;
    std::filesystem::path mockFeedPath;
    Solana::Commitment commitment = Solana::Commitment::confirmed;
    std::chrono::milliseconds requestTimeout = std::chrono::seconds( 10 );
    FetchMode mode = FetchMode::automatic;
    bool verifyPeer = true;
};

// Throws ConfigurationError on malformed base58.
Core::PublicKey parse_pool_address( std::string_view text );

} // namespace Jupiter
} // namespace Perpfeed
