#include "perpfeed/Core/PublicKey.hpp"

#include "perpfeed/Util/StringEncode.hpp"

#include <algorithm>
#include <stdexcept>

namespace Perpfeed
{
namespace Core
{

bool PublicKey::is_zero( ) const
{
    return std::all_of( _key.begin( ), _key.end( ), [ ]( std::byte value ){ return value == std::byte{ 0 }; } );
}

std::string PublicKey::enc_base58_text( ) const
{
    return enc_base58( _key );
}

bool PublicKey::init_from_base58( std::string_view text )
{
    auto decoded = dec_base58( text );
    if ( !decoded )
    {
        return false;
    }
    return init_from_bytes( *decoded );
}

bool PublicKey::init_from_bytes( std::span< const std::byte > bytes )
{
    if ( bytes.size( ) != size )
    {
        return false;
    }
    std::copy( bytes.begin( ), bytes.end( ), _key.begin( ) );
    return true;
}

std::ostream & operator <<( std::ostream & os, const PublicKey & publicKey )
{
    return os << publicKey.enc_base58_text( );
}

PublicKey base58_to_public_key( std::string_view text )
{
    PublicKey key;
    if ( !key.init_from_base58( text ) )
    {
        throw std::invalid_argument( fmt::format( "Invalid base58 public key: {}", text ) );
    }
    return key;
}

} // namespace Core
} // namespace Perpfeed
