#include "perpfeed/Core/PublicKey.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <unordered_set>

using namespace Perpfeed;

TEST( PublicKeyTest, ZeroKeyText )
{
    Core::PublicKey key;
    EXPECT_TRUE( key.is_zero( ) );
    EXPECT_EQ( key.enc_base58_text( ), "11111111111111111111111111111111" );
}

TEST( PublicKeyTest, Base58RoundTrip )
{
    auto key = Core::base58_to_public_key( "So11111111111111111111111111111111111111112" );
    EXPECT_FALSE( key.is_zero( ) );
    EXPECT_EQ( key.enc_base58_text( ), "So11111111111111111111111111111111111111112" );
    EXPECT_EQ( fmt::format( "{}", key ), "So11111111111111111111111111111111111111112" );
}

TEST( PublicKeyTest, RejectsWrongLength )
{
    Core::PublicKey key;
    EXPECT_FALSE( key.init_from_base58( "2NEpo7TZRRrLZSi2U" ) );
    EXPECT_THROW( Core::base58_to_public_key( "not-base58" ), std::invalid_argument );
}

TEST( PublicKeyTest, Hashable )
{
    std::unordered_set< Core::PublicKey > keys;
    keys.insert( Core::base58_to_public_key( "So11111111111111111111111111111111111111112" ) );
    keys.insert( Core::base58_to_public_key( "So11111111111111111111111111111111111111112" ) );
    keys.insert( Core::PublicKey( ) );
    EXPECT_EQ( keys.size( ), 2u );
}
