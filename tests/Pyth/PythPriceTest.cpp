#include "perpfeed/Pyth/PythTypes.hpp"

#include "perpfeed/Util/Utils.hpp"

#include "TestUtils.hpp"

#include <boost/json/serialize.hpp>
#include <boost/json/value_from.hpp>

#include <gtest/gtest.h>

using namespace Perpfeed;
using namespace Perpfeed::Pyth;

TEST( PythPriceTest, ScalesAggregatePrice )
{
    auto data = Perpfeed::Test::make_pyth_price_account( { .price = 14'250'000'000, .confidence = 1'500'000, .publishSlot = 1'000, .exponent = -8 } );

    auto account = parse_price_account( data );
    ASSERT_TRUE( account.price.has_value( ) );
    EXPECT_DOUBLE_EQ( *account.price, 142.5 );
    ASSERT_TRUE( account.confidence.has_value( ) );
    EXPECT_DOUBLE_EQ( *account.confidence, 0.015 );
    EXPECT_EQ( account.status, PriceStatus::Trading );
    EXPECT_EQ( account.publishSlot, 1'000u );
    EXPECT_EQ( account.exponent, -8 );
}

TEST( PythPriceTest, NegativePrice )
{
    auto account = parse_price_account( Perpfeed::Test::make_pyth_price_account( { .price = -250, .confidence = 1, .exponent = -2 } ) );
    ASSERT_TRUE( account.price.has_value( ) );
    EXPECT_DOUBLE_EQ( *account.price, -2.5 );
}

TEST( PythPriceTest, ZeroComponentsAreAbsent )
{
    auto account = parse_price_account( Perpfeed::Test::make_pyth_price_account( { .price = 0, .confidence = 0 } ) );
    EXPECT_FALSE( account.price.has_value( ) );
    EXPECT_FALSE( account.confidence.has_value( ) );

    auto json = boost::json::value_from( account );
    EXPECT_TRUE( json.at( "price" ).is_null( ) );
    EXPECT_TRUE( json.at( "confidence" ).is_null( ) );
}

TEST( PythPriceTest, StatusCodes )
{
    auto halted = parse_price_account( Perpfeed::Test::make_pyth_price_account( { .price = 1, .status = 2 } ) );
    EXPECT_EQ( halted.status, PriceStatus::Halted );

    auto unknown = parse_price_account( Perpfeed::Test::make_pyth_price_account( { .price = 1, .status = 42 } ) );
    EXPECT_EQ( unknown.status, PriceStatus::Unknown );
}

TEST( PythPriceTest, BadMagicThrows )
{
    auto data = Perpfeed::Test::make_pyth_price_account( { .price = 1, .magic = 0xdeadbeef } );
    EXPECT_THROW( parse_price_account( data ), OracleFormatError );
}

TEST( PythPriceTest, WrongAccountTypeThrows )
{
    // Mapping and product accounts share the magic number.
    for ( uint32_t accountType : { 1u, 2u, 4u } )
    {
        auto data = Perpfeed::Test::make_pyth_price_account( { .price = 1, .accountType = accountType } );
        EXPECT_THROW( parse_price_account( data ), OracleFormatError ) << "account type: " << accountType;
    }
}

TEST( PythPriceTest, ShortBufferThrows )
{
    auto data = Perpfeed::Test::make_pyth_price_account( { .price = 1 } );
    data.resize( PythPriceAccount::min_size( ) - 1 );
    EXPECT_THROW( parse_price_account( data ), OracleFormatError );

    EXPECT_THROW( parse_price_account( { } ), OracleFormatError );
}

TEST( PythPriceTest, JsonRendering )
{
    auto account = parse_price_account( Perpfeed::Test::make_pyth_price_account( { .price = 150, .confidence = 2, .publishSlot = 7, .exponent = -1 } ) );
    auto json = boost::json::value_from( account );

    EXPECT_DOUBLE_EQ( json.at( "price" ).as_double( ), 15.0 );
    EXPECT_EQ( json.at( "status" ).as_string( ), "Trading" );
    EXPECT_EQ( json.at( "publishSlot" ).to_number< uint64_t >( ), 7u );
    EXPECT_EQ( json.at( "exponent" ).to_number< int64_t >( ), -1 );
}
