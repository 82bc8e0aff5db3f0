#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Perpfeed
{
namespace Io
{

// Forward proxy endpoint parsed from http://[user[:password]@]host[:port][/].
struct ProxyConfig
{
    // Throws ConfigurationError on a malformed url.
    static ProxyConfig parse( std::string_view url );

    // "Basic <base64( user:password )>", empty when the url carries no credentials.
    std::optional< std::string > authorization_header( ) const;

    std::string url;
    std::string host;
    std::string service; // Defaults to 80.
    std::string username; // Percent-decoded.
    std::string password; // Percent-decoded.
};

// Returns the configured proxy url, if any.
using ProxyLookupFn = std::function< std::optional< std::string >( ) >;

// Environment variables consulted for a proxy url, first non-empty wins.
inline constexpr std::string_view proxy_environment_variables[ ] =
{
    "JUPITER_SOLANA_RPC_PROXY",
    "HTTPS_PROXY",
    "https_proxy",
    "HTTP_PROXY",
    "http_proxy"
};

std::optional< std::string > proxy_url_from_environment( );

// An explicit url takes precedence over the environment.
ProxyLookupFn make_proxy_lookup( std::optional< std::string > explicitProxyUrl );

std::string percent_decode( std::string_view text );

// CONNECT request for a tunnel to host:service.
std::string build_connect_request( std::string_view host, std::string_view service, const ProxyConfig & proxyConfig );

} // namespace Io
} // namespace Perpfeed
