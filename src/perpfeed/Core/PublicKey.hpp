#pragma once

#include <boost/functional/hash.hpp>

#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace Perpfeed
{
namespace Core
{

// 32-byte account address.
class PublicKey
{
public:
    static constexpr size_t size = 32;

    PublicKey( ) { _key.fill( std::byte{ 0 } ); }
    PublicKey( const PublicKey & ) = default;
    PublicKey & operator=( const PublicKey & ) = default;

    bool operator==( const PublicKey & ) const = default;

    bool is_zero( ) const;

    std::string enc_base58_text( ) const;
    bool init_from_base58( std::string_view text );

    bool init_from_bytes( std::span< const std::byte > bytes );

    std::array< std::byte, size > & data( ) & { return _key; }
    const std::array< std::byte, size > & data( ) const & { return _key; }

    friend std::ostream & operator <<( std::ostream & os, const PublicKey & publicKey );

private:
    std::array< std::byte, size > _key;
};
static_assert( sizeof( PublicKey ) == 32, "Invalid PublicKey size" );

// Throws std::invalid_argument on malformed text.
PublicKey base58_to_public_key( std::string_view text );

inline std::size_t hash_value( const PublicKey & key )
{
    return boost::hash_range( key.data( ).begin( ), key.data( ).end( ) );
}

} // namespace Core
} // namespace Perpfeed

template< >
struct std::hash< Perpfeed::Core::PublicKey >
{
    std::size_t operator( )( const Perpfeed::Core::PublicKey & key ) const noexcept
    {
        return Perpfeed::Core::hash_value( key );
    }
};

template < >
struct fmt::formatter< Perpfeed::Core::PublicKey > : fmt::formatter< std::string >
{
    // parse is inherited from formatter<string>.
    template < class FormatContext >
    auto format( const Perpfeed::Core::PublicKey & key, FormatContext & ctx ) const
    {
        return fmt::formatter< std::string >::format( key.enc_base58_text( ), ctx );
    }
};
