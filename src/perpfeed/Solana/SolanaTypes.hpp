#pragma once

#include "perpfeed/Core/PublicKey.hpp"

#include "perpfeed/Util/JsonUtils.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Perpfeed
{
namespace Solana
{

enum class Commitment : uint8_t
{
    invalid = 0,
    finalized = 1,
    confirmed = 2,
    processed = 3
};

// Throws ConfigurationError on an unknown name.
Commitment commitment_from_name( std::string_view name );

struct AccountInfo
{
    friend AccountInfo tag_invoke( json_to_tag< AccountInfo >, simdjson::ondemand::value jsonValue );

    bool executable;
    uint64_t lamports;
    Core::PublicKey owner;
    std::vector< std::byte > data;
};

// A null account value decodes to an empty optional.
std::optional< AccountInfo > tag_invoke( json_to_tag< std::optional< AccountInfo > >, simdjson::ondemand::value jsonValue );

struct SolanaEndpointConfig
{
    friend SolanaEndpointConfig tag_invoke( json_to_tag< SolanaEndpointConfig >, simdjson::ondemand::value jsonValue );

    // Accepts https://host[:port][/path]. Throws ConfigurationError on any other scheme or a malformed url.
    static SolanaEndpointConfig from_url( std::string_view url );

    std::string host;
    std::string service;
    std::string target;
};

} // namespace Solana
} // namespace Perpfeed
