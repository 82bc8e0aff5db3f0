#include "perpfeed/Util/StringEncode.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Perpfeed;

namespace
{

std::string as_string( const std::vector< std::byte > & bytes )
{
    return std::string( reinterpret_cast< const char * >( bytes.data( ) ), bytes.size( ) );
}

} // namespace

TEST( StringEncodeTest, Base58KnownVector )
{
    EXPECT_EQ( enc_base58( as_bytes( "Hello World!" ) ), "2NEpo7TZRRrLZSi2U" );

    auto decoded = dec_base58( "2NEpo7TZRRrLZSi2U" );
    ASSERT_TRUE( decoded.has_value( ) );
    EXPECT_EQ( as_string( *decoded ), "Hello World!" );
}

TEST( StringEncodeTest, Base58LeadingZeros )
{
    std::vector< std::byte > bytes{ std::byte{ 0 }, std::byte{ 0 }, std::byte{ 1 } };
    auto text = enc_base58( bytes );
    EXPECT_EQ( text, "112" );

    auto decoded = dec_base58( text );
    ASSERT_TRUE( decoded.has_value( ) );
    EXPECT_EQ( *decoded, bytes );
}

TEST( StringEncodeTest, Base58RejectsOutsideAlphabet )
{
    // 0, O, I and l are excluded from the alphabet.
    EXPECT_FALSE( dec_base58( "0OIl" ).has_value( ) );
    EXPECT_FALSE( dec_base58( "abc!" ).has_value( ) );
}

TEST( StringEncodeTest, Base64KnownVector )
{
    EXPECT_EQ( enc_base64( as_bytes( "hello" ) ), "aGVsbG8=" );
    EXPECT_EQ( enc_base64( as_bytes( "user:p@ss" ) ), "dXNlcjpwQHNz" );

    auto decoded = dec_base64( "aGVsbG8=" );
    ASSERT_TRUE( decoded.has_value( ) );
    EXPECT_EQ( as_string( *decoded ), "hello" );
}

TEST( StringEncodeTest, Base64Empty )
{
    EXPECT_EQ( enc_base64( as_bytes( "" ) ), "" );

    auto decoded = dec_base64( "" );
    ASSERT_TRUE( decoded.has_value( ) );
    EXPECT_TRUE( decoded->empty( ) );
}

TEST( StringEncodeTest, Base64RejectsMalformed )
{
    EXPECT_FALSE( dec_base64( "aGVsbG8" ).has_value( ) );
    EXPECT_FALSE( dec_base64( "a$Vs" ).has_value( ) );
}
