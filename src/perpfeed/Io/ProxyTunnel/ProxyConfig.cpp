#include "perpfeed/Io/ProxyTunnel/ProxyConfig.hpp"

#include "perpfeed/Util/StringEncode.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace Perpfeed
{
namespace Io
{

namespace
{

int hex_value( char c )
{
    if ( c >= '0' && c <= '9' ) return c - '0';
    if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
    if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
    return -1;
}

std::string parse_port( std::string_view port, std::string_view url )
{
    if ( port.empty( ) || port.find_first_not_of( "0123456789" ) != std::string_view::npos )
    {
        throw ConfigurationError( fmt::format( "Invalid proxy port in '{}'", url ) );
    }
    return std::string( port );
}

} // namespace

std::string percent_decode( std::string_view text )
{
    std::string result;
    result.reserve( text.size( ) );
    for ( size_t i = 0; i < text.size( ); ++i )
    {
        if ( text[ i ] == '%' && i + 2 < text.size( ) )
        {
            auto high = hex_value( text[ i + 1 ] );
            auto low = hex_value( text[ i + 2 ] );
            if ( high >= 0 && low >= 0 )
            {
                result.push_back( static_cast< char >( high * 16 + low ) );
                i += 2;
                continue;
            }
        }
        result.push_back( text[ i ] );
    }
    return result;
}

ProxyConfig ProxyConfig::parse( std::string_view url )
{
    ProxyConfig config;
    config.url = std::string( url );

    auto rest = url;
    if ( auto scheme = rest.find( "://" ); scheme != std::string_view::npos )
    {
        auto schemeName = rest.substr( 0, scheme );
        if ( schemeName != "http" && schemeName != "https" )
        {
            throw ConfigurationError( fmt::format( "Unsupported proxy scheme '{}'", schemeName ) );
        }
        rest = rest.substr( scheme + 3 );
    }

    if ( auto slash = rest.find( '/' ); slash != std::string_view::npos )
    {
        rest = rest.substr( 0, slash );
    }

    if ( auto at = rest.rfind( '@' ); at != std::string_view::npos )
    {
        auto credentials = rest.substr( 0, at );
        rest = rest.substr( at + 1 );

        auto colon = credentials.find( ':' );
        config.username = percent_decode( credentials.substr( 0, colon ) );
        if ( colon != std::string_view::npos )
        {
            config.password = percent_decode( credentials.substr( colon + 1 ) );
        }
    }

    config.service = "80";

    // Bracketed IPv6 literal, the brackets are not part of the resolvable host.
    if ( rest.starts_with( '[' ) )
    {
        auto close = rest.find( ']' );
        if ( close == std::string_view::npos )
        {
            throw ConfigurationError( fmt::format( "Unterminated IPv6 proxy host in '{}'", url ) );
        }
        auto afterHost = rest.substr( close + 1 );
        if ( !afterHost.empty( ) && !afterHost.starts_with( ':' ) )
        {
            throw ConfigurationError( fmt::format( "Invalid proxy host in '{}'", url ) );
        }
        rest = rest.substr( 1, close - 1 );
        if ( !afterHost.empty( ) )
        {
            config.service = parse_port( afterHost.substr( 1 ), url );
        }
    }
    else if ( auto colon = rest.rfind( ':' ); colon != std::string_view::npos )
    {
        config.service = parse_port( rest.substr( colon + 1 ), url );
        rest = rest.substr( 0, colon );
    }

    if ( rest.empty( ) )
    {
        throw ConfigurationError( fmt::format( "Missing proxy host in '{}'", url ) );
    }
    config.host = std::string( rest );

    return config;
}

std::optional< std::string > ProxyConfig::authorization_header( ) const
{
    if ( username.empty( ) && password.empty( ) )
    {
        return std::nullopt;
    }

    auto credentials = fmt::format( "{}:{}", username, password );
    return fmt::format( "Basic {}", enc_base64( as_bytes( credentials ) ) );
}

std::optional< std::string > proxy_url_from_environment( )
{
    for ( auto variable : proxy_environment_variables )
    {
        const char * value = std::getenv( std::string( variable ).c_str( ) );
        if ( value != nullptr && *value != '\0' )
        {
            return std::string( value );
        }
    }
    return std::nullopt;
}

ProxyLookupFn make_proxy_lookup( std::optional< std::string > explicitProxyUrl )
{
    return [ explicitProxyUrl = std::move( explicitProxyUrl ) ]( ) -> std::optional< std::string >
    {
        if ( explicitProxyUrl && !explicitProxyUrl->empty( ) )
        {
            return explicitProxyUrl;
        }
        return proxy_url_from_environment( );
    };
}

std::string build_connect_request( std::string_view host, std::string_view service, const ProxyConfig & proxyConfig )
{
    auto request = fmt::format( "CONNECT {0}:{1} HTTP/1.1\r\nHost: {0}:{1}\r\n", host, service );
    if ( auto authorization = proxyConfig.authorization_header( ) )
    {
        request += fmt::format( "Proxy-Authorization: {}\r\n", *authorization );
    }
    request += "\r\n";
    return request;
}

} // namespace Io
} // namespace Perpfeed
