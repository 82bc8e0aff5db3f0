#include "perpfeed/Solana/SolanaTypes.hpp"

#include "perpfeed/Util/StringEncode.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

namespace Perpfeed
{
namespace Solana
{

Commitment commitment_from_name( std::string_view name )
{
    auto commitment = magic_enum::enum_cast< Commitment >( name );
    if ( !commitment || *commitment == Commitment::invalid )
    {
        throw ConfigurationError( fmt::format( "Unknown commitment '{}'", name ) );
    }
    return *commitment;
}

AccountInfo tag_invoke( json_to_tag< AccountInfo >, simdjson::ondemand::value jsonValue )
{
    AccountInfo response;

    response.executable = jsonValue[ "executable" ].value( ).get_bool( ).value( );
    response.lamports = jsonValue[ "lamports" ].value( ).get_uint64( ).value( );

    auto owner = jsonValue[ "owner" ].value( ).get_string( ).value( );
    if ( !response.owner.init_from_base58( owner ) )
    {
        throw TransportError( fmt::format( "Invalid account owner '{}'", owner ) );
    }

    auto dataObject = jsonValue[ "data" ].value( );

    std::optional< std::vector< std::byte > > data;
    switch ( dataObject.type( ).value( ) )
    {
        case simdjson::ondemand::json_type::string:
        {
            // Default base58 encoding.
            data = dec_base58( dataObject.get_string( ).value( ) );
            break;
        }
        case simdjson::ondemand::json_type::array:
        {
            // [ payload, encoding ]
            std::vector< std::string_view > parts;
            for ( auto part : dataObject.get_array( ) )
            {
                parts.push_back( part.get_string( ).value( ) );
            }
            if ( parts.size( ) != 2 || parts[ 1 ] != "base64" )
            {
                throw TransportError( "Unsupported account data encoding, expected [ payload, \"base64\" ]" );
            }
            auto payload = parts[ 0 ];
            data = dec_base64( payload );
            break;
        }
        default:
        {
            throw TransportError( "Invalid 'data' field type" );
        }
    }

    if ( !data )
    {
        throw TransportError( "Malformed account data payload" );
    }
    response.data = std::move( *data );

    return response;
}

std::optional< AccountInfo > tag_invoke( json_to_tag< std::optional< AccountInfo > >, simdjson::ondemand::value jsonValue )
{
    if ( jsonValue.is_null( ) )
    {
        return std::nullopt;
    }
    return json_to< AccountInfo >( jsonValue );
}

SolanaEndpointConfig tag_invoke( json_to_tag< SolanaEndpointConfig >, simdjson::ondemand::value jsonValue )
{
    return SolanaEndpointConfig
    {
        .host = std::string( jsonValue[ "host" ].get_string( ).value( ) ),
        .service = std::string( jsonValue[ "service" ].get_string( ).value( ) ),
        .target = std::string( jsonValue[ "target" ].get_string( ).value( ) )
    };
}

SolanaEndpointConfig SolanaEndpointConfig::from_url( std::string_view url )
{
    constexpr std::string_view scheme = "https://";
    if ( !url.starts_with( scheme ) )
    {
        throw ConfigurationError( fmt::format( "Unsupported rpc url '{}', expected {}host[:port][/path]", url, scheme ) );
    }

    auto authority = url.substr( scheme.size( ) );
    std::string_view target = "/";
    if ( auto slash = authority.find( '/' ); slash != std::string_view::npos )
    {
        target = authority.substr( slash );
        authority = authority.substr( 0, slash );
    }

    std::string_view host = authority;
    std::string_view service = "443";
    if ( auto colon = authority.rfind( ':' ); colon != std::string_view::npos )
    {
        host = authority.substr( 0, colon );
        service = authority.substr( colon + 1 );
        if ( service.empty( ) || service.find_first_not_of( "0123456789" ) != std::string_view::npos )
        {
            throw ConfigurationError( fmt::format( "Invalid port in rpc url '{}'", url ) );
        }
    }

    if ( host.empty( ) || host.find( '@' ) != std::string_view::npos )
    {
        throw ConfigurationError( fmt::format( "Invalid host in rpc url '{}'", url ) );
    }

    return SolanaEndpointConfig
    {
        .host = std::string( host ),
        .service = std::string( service ),
        .target = std::string( target )
    };
}

} // namespace Solana
} // namespace Perpfeed
