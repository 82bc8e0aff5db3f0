#include "perpfeed/Util/StringEncode.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstdint>

namespace Perpfeed
{

static constexpr std::string_view base58_alphabet( )
{
    return "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

static constexpr std::array< int8_t, 128 > base58_lookup( )
{
    std::array< int8_t, 128 > lookup{ };
    lookup.fill( -1 );
    for ( size_t i = 0; i < base58_alphabet( ).size( ); ++i )
    {
        lookup[ static_cast< uint8_t >( base58_alphabet( )[ i ] ) ] = static_cast< int8_t >( i );
    }
    return lookup;
}

std::string enc_base58( std::span< const std::byte > source )
{
    auto firstNonZero = std::find_if( source.begin( ), source.end( ), [ ]( std::byte b ){ return b != std::byte{ 0 }; } );
    size_t leadingZeros = std::distance( source.begin( ), firstNonZero );

    // log(256) / log(58), rounded up.
    std::vector< uint8_t > digits( ( source.size( ) - leadingZeros ) * 138 / 100 + 1, 0 );
    size_t digitCount = 0;

    for ( auto it = firstNonZero; it != source.end( ); ++it )
    {
        uint32_t carry = static_cast< uint8_t >( *it );
        size_t i = 0;
        for ( auto digit = digits.rbegin( ); ( carry != 0 || i < digitCount ) && digit != digits.rend( ); ++digit, ++i )
        {
            carry += 256 * static_cast< uint32_t >( *digit );
            *digit = static_cast< uint8_t >( carry % 58 );
            carry /= 58;
        }
        digitCount = i;
    }

    auto firstDigit = std::find_if( digits.end( ) - digitCount, digits.end( ), [ ]( uint8_t d ){ return d != 0; } );

    std::string result( leadingZeros, '1' );
    result.reserve( leadingZeros + std::distance( firstDigit, digits.end( ) ) );
    for ( auto it = firstDigit; it != digits.end( ); ++it )
    {
        result.push_back( base58_alphabet( )[ *it ] );
    }
    return result;
}

std::optional< std::vector< std::byte > > dec_base58( std::string_view text )
{
    static constexpr auto lookup = base58_lookup( );

    size_t leadingOnes = 0;
    while ( leadingOnes < text.size( ) && text[ leadingOnes ] == '1' )
    {
        ++leadingOnes;
    }

    // log(58) / log(256), rounded up.
    std::vector< uint8_t > bytes( ( text.size( ) - leadingOnes ) * 733 / 1000 + 1, 0 );
    size_t byteCount = 0;

    for ( size_t position = leadingOnes; position < text.size( ); ++position )
    {
        auto character = static_cast< uint8_t >( text[ position ] );
        if ( character >= lookup.size( ) || lookup[ character ] < 0 )
        {
            return { };
        }

        uint32_t carry = static_cast< uint32_t >( lookup[ character ] );
        size_t i = 0;
        for ( auto byte = bytes.rbegin( ); ( carry != 0 || i < byteCount ) && byte != bytes.rend( ); ++byte, ++i )
        {
            carry += 58 * static_cast< uint32_t >( *byte );
            *byte = static_cast< uint8_t >( carry & 0xff );
            carry >>= 8;
        }
        byteCount = i;
    }

    auto firstByte = std::find_if( bytes.end( ) - byteCount, bytes.end( ), [ ]( uint8_t b ){ return b != 0; } );

    std::vector< std::byte > result( leadingOnes, std::byte{ 0 } );
    result.reserve( leadingOnes + std::distance( firstByte, bytes.end( ) ) );
    std::transform( firstByte, bytes.end( ), std::back_inserter( result ), [ ]( uint8_t b ){ return std::byte{ b }; } );
    return result;
}

std::string enc_base64( std::span< const std::byte > source )
{
    std::string result( 4 * ( ( source.size( ) + 2 ) / 3 ), '\0' );
    if ( source.empty( ) )
    {
        return result;
    }

    auto written = EVP_EncodeBlock
    (
        reinterpret_cast< unsigned char * >( result.data( ) ),
        reinterpret_cast< const unsigned char * >( source.data( ) ),
        static_cast< int >( source.size( ) )
    );
    result.resize( static_cast< size_t >( written ) );
    return result;
}

std::optional< std::vector< std::byte > > dec_base64( std::string_view text )
{
    if ( text.empty( ) )
    {
        return std::vector< std::byte >{ };
    }
    if ( text.size( ) % 4 != 0 )
    {
        return { };
    }

    std::vector< std::byte > result( 3 * text.size( ) / 4 );
    auto decoded = EVP_DecodeBlock
    (
        reinterpret_cast< unsigned char * >( result.data( ) ),
        reinterpret_cast< const unsigned char * >( text.data( ) ),
        static_cast< int >( text.size( ) )
    );
    if ( decoded < 0 )
    {
        return { };
    }

    // EVP_DecodeBlock decodes padding characters as zero bytes.
    size_t padding = 0;
    if ( text.ends_with( "==" ) )
    {
        padding = 2;
    }
    else if ( text.ends_with( '=' ) )
    {
        padding = 1;
    }

    result.resize( static_cast< size_t >( decoded ) - padding );
    return result;
}

} // namespace Perpfeed
