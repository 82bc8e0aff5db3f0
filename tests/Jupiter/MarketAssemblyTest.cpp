#include "perpfeed/Jupiter/MarketAssembly.hpp"

#include "perpfeed/Util/Utils.hpp"

#include "Jupiter/JupiterTestData.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

using namespace Perpfeed;
using namespace Perpfeed::Jupiter;

namespace
{

DecodedCustody make_decoded_custody( const Perpfeed::Test::CustodyFields & fields, uint8_t addressSeed )
{
    auto value = Perpfeed::Test::jupiter_coder( )->decode( custody_account_name( ), Perpfeed::Test::encode_custody( fields ) );
    return { .address = Perpfeed::Test::make_public_key( addressSeed ), .custody = Anchor::value_to< CustodyAccount >( value ) };
}

Pyth::PythPriceAccount make_price( double price, uint64_t publishSlot, Pyth::PriceStatus status = Pyth::PriceStatus::Trading )
{
    return Pyth::PythPriceAccount
    {
        .price = price,
        .confidence = 0.05,
        .status = status,
        .publishSlot = publishSlot,
        .exponent = -8
    };
}

PoolAccount make_pool( )
{
    return { .name = "Pool", .custodies = { Perpfeed::Test::make_public_key( 10 ), Perpfeed::Test::make_public_key( 11 ) } };
}

} // namespace

TEST( MarketAssemblyTest, DecodePool )
{
    auto custodies = std::vector< Core::PublicKey >{ Perpfeed::Test::make_public_key( 10 ), Perpfeed::Test::make_public_key( 11 ) };
    auto account = Perpfeed::Test::make_account_info( Perpfeed::Test::encode_pool( "Pool", custodies ) );

    auto pool = decode_pool( *Perpfeed::Test::jupiter_coder( ), Perpfeed::Test::make_public_key( 1 ), account );
    EXPECT_EQ( pool.name, "Pool" );
    EXPECT_EQ( pool.custodies, custodies );
}

TEST( MarketAssemblyTest, MissingPoolThrows )
{
    EXPECT_THROW( decode_pool( *Perpfeed::Test::jupiter_coder( ), Perpfeed::Test::make_public_key( 1 ), std::nullopt ), EmptyResultError );

    auto empty = Perpfeed::Test::make_account_info( Perpfeed::Test::encode_pool( "Pool", { } ) );
    EXPECT_THROW( decode_pool( *Perpfeed::Test::jupiter_coder( ), Perpfeed::Test::make_public_key( 1 ), empty ), EmptyResultError );
}

TEST( MarketAssemblyTest, DecodeCustodiesSkipsBadAccounts )
{
    auto valid = Perpfeed::Test::encode_custody( { .mint = Perpfeed::Test::sol_mint( ), .oracleAccount = Perpfeed::Test::make_public_key( 20 ) } );
    auto truncated = valid;
    truncated.resize( 100 );

    std::vector< Core::PublicKey > addresses{ Perpfeed::Test::make_public_key( 10 ), Perpfeed::Test::make_public_key( 11 ), Perpfeed::Test::make_public_key( 12 ) };
    std::vector< std::optional< Solana::AccountInfo > > accounts
    {
        std::nullopt,
        Perpfeed::Test::make_account_info( truncated ),
        Perpfeed::Test::make_account_info( valid )
    };

    auto custodies = decode_custodies( *Perpfeed::Test::jupiter_coder( ), addresses, accounts );
    ASSERT_EQ( custodies.size( ), 1u );
    EXPECT_EQ( custodies[ 0 ].address, Perpfeed::Test::make_public_key( 12 ) );
    EXPECT_EQ( custodies[ 0 ].custody.mint, Perpfeed::Test::sol_mint( ) );
    EXPECT_EQ( custodies[ 0 ].custody.oracle.oracleType, OracleType::pyth );
    EXPECT_EQ( custodies[ 0 ].custody.assets.owned, 1'000'000'000u );
    EXPECT_DOUBLE_EQ( custodies[ 0 ].custody.priceImpactExponent, 1.5 );
}

TEST( MarketAssemblyTest, NoDecodableCustodyThrows )
{
    auto pool = Perpfeed::Test::encode_pool( "Pool", { Perpfeed::Test::make_public_key( 10 ) } );

    std::vector< Core::PublicKey > addresses{ Perpfeed::Test::make_public_key( 10 ), Perpfeed::Test::make_public_key( 11 ) };
    std::vector< std::optional< Solana::AccountInfo > > accounts{ std::nullopt, Perpfeed::Test::make_account_info( pool ) };

    EXPECT_THROW( decode_custodies( *Perpfeed::Test::jupiter_coder( ), addresses, accounts ), EmptyResultError );
}

TEST( MarketAssemblyTest, CollectOracleAddresses )
{
    auto oracle = Perpfeed::Test::make_public_key( 20 );
    std::vector< DecodedCustody > custodies
    {
        make_decoded_custody( { .mint = Perpfeed::Test::sol_mint( ), .oracleAccount = oracle }, 10 ),
        make_decoded_custody( { .mint = Perpfeed::Test::eth_mint( ), .oracleAccount = oracle }, 11 ),
        make_decoded_custody( { .mint = Perpfeed::Test::eth_mint( ), .oracleAccount = Perpfeed::Test::make_public_key( 21 ), .oracleType = "test" }, 12 ),
        make_decoded_custody( { .mint = Perpfeed::Test::eth_mint( ), .oracleAccount = Core::PublicKey( ) }, 13 ),
        make_decoded_custody( { .mint = Perpfeed::Test::eth_mint( ), .oracleAccount = Perpfeed::Test::make_public_key( 22 ) }, 14 )
    };

    auto addresses = collect_oracle_addresses( custodies );
    ASSERT_EQ( addresses.size( ), 2u );
    EXPECT_EQ( addresses[ 0 ], oracle );
    EXPECT_EQ( addresses[ 1 ], Perpfeed::Test::make_public_key( 22 ) );
}

TEST( MarketAssemblyTest, ParseOraclePricesSkipsBadAccounts )
{
    std::vector< Core::PublicKey > addresses{ Perpfeed::Test::make_public_key( 20 ), Perpfeed::Test::make_public_key( 21 ), Perpfeed::Test::make_public_key( 22 ) };
    std::vector< std::optional< Solana::AccountInfo > > accounts
    {
        Perpfeed::Test::make_account_info( Perpfeed::Test::make_pyth_price_account( { .price = 15'000'000'000, .publishSlot = 90 } ) ),
        std::nullopt,
        Perpfeed::Test::make_account_info( Perpfeed::Test::make_pyth_price_account( { .price = 1, .magic = 0 } ) )
    };

    auto prices = parse_oracle_prices( addresses, accounts );
    ASSERT_EQ( prices.size( ), 1u );
    ASSERT_TRUE( prices.contains( Perpfeed::Test::make_public_key( 20 ) ) );
    EXPECT_DOUBLE_EQ( *prices.at( Perpfeed::Test::make_public_key( 20 ) ).price, 150.0 );
}

TEST( MarketAssemblyTest, OracleFreshness )
{
    EXPECT_TRUE( is_oracle_fresh( 100, 100 ) );
    EXPECT_TRUE( is_oracle_fresh( 100, 75 ) );
    EXPECT_FALSE( is_oracle_fresh( 100, 74 ) );
    // A publish slot ahead of the observed slot is not stale.
    EXPECT_TRUE( is_oracle_fresh( 100, 120 ) );
}

TEST( MarketAssemblyTest, AssembleMarketRecord )
{
    auto oracle = Perpfeed::Test::make_public_key( 20 );
    std::vector< DecodedCustody > custodies{ make_decoded_custody( { .mint = Perpfeed::Test::sol_mint( ), .oracleAccount = oracle }, 10 ) };
    OraclePriceMap prices{ { oracle, make_price( 150, 990 ) } };

    auto markets = assemble_markets( make_pool( ), custodies, prices, 1'000 );
    ASSERT_EQ( markets.size( ), 1u );

    const auto & market = markets[ 0 ];
    EXPECT_EQ( market.symbol, "SOL-USD" );
    EXPECT_DOUBLE_EQ( market.markPrice, 150 );
    EXPECT_DOUBLE_EQ( market.fundingRateHourly, 0.00025 );
    EXPECT_EQ( market.fundingRateAnnualized, market.fundingRateHourly * 8'760 );
    EXPECT_DOUBLE_EQ( market.openInterestUsd, 3'000 );
    EXPECT_DOUBLE_EQ( market.takerFeeBps, 6 );
    EXPECT_DOUBLE_EQ( market.makerFeeBps, 4 );
    EXPECT_DOUBLE_EQ( market.minQty, 0 );
    ASSERT_EQ( market.depthTop5.size( ), 6u );
    EXPECT_EQ( market.depthTop5.front( ).side, Side::bid );
    EXPECT_DOUBLE_EQ( market.depthTop5.front( ).size, 15'000.0 / 150 / 3 );

    const auto & extra = market.extra;
    EXPECT_EQ( extra.at( "mint" ).as_string( ), "So11111111111111111111111111111111111111112" );
    EXPECT_EQ( extra.at( "oracleAccount" ).as_string( ), oracle.enc_base58_text( ) );
    EXPECT_DOUBLE_EQ( extra.at( "oracleConfidence" ).as_double( ), 0.05 );
    EXPECT_EQ( extra.at( "pricePublishSlot" ).to_number< uint64_t >( ), 990u );
    EXPECT_DOUBLE_EQ( extra.at( "maxLeverage" ).as_double( ), 50 );
    EXPECT_EQ( extra.at( "poolName" ).as_string( ), "Pool" );
    EXPECT_DOUBLE_EQ( extra.at( "borrowRateHourly" ).as_double( ), 0.0005 );
    EXPECT_EQ( extra.at( "depthModel" ).as_string( ), "synthetic-1pct" );
}

TEST( MarketAssemblyTest, FiltersHaltedAndStaleOracles )
{
    auto solOracle = Perpfeed::Test::make_public_key( 20 );
    auto ethOracle = Perpfeed::Test::make_public_key( 21 );
    std::vector< DecodedCustody > custodies
    {
        make_decoded_custody( { .mint = Perpfeed::Test::sol_mint( ), .oracleAccount = solOracle }, 10 ),
        make_decoded_custody( { .mint = Perpfeed::Test::eth_mint( ), .oracleAccount = ethOracle }, 11 )
    };

    OraclePriceMap prices
    {
        { solOracle, make_price( 150, 975 ) },
        { ethOracle, make_price( 3'000, 1'000, Pyth::PriceStatus::Halted ) }
    };

    auto markets = assemble_markets( make_pool( ), custodies, prices, 1'000 );
    ASSERT_EQ( markets.size( ), 1u );
    EXPECT_EQ( markets[ 0 ].symbol, "SOL-USD" );

    // One slot past the drift limit.
    prices.at( solOracle ).publishSlot = 974;
    EXPECT_THROW( assemble_markets( make_pool( ), custodies, prices, 1'000 ), EmptyResultError );
}

TEST( MarketAssemblyTest, FiltersMissingAndNonPositivePrices )
{
    auto solOracle = Perpfeed::Test::make_public_key( 20 );
    auto ethOracle = Perpfeed::Test::make_public_key( 21 );
    auto btcOracle = Perpfeed::Test::make_public_key( 22 );
    std::vector< DecodedCustody > custodies
    {
        make_decoded_custody( { .mint = Perpfeed::Test::sol_mint( ), .oracleAccount = solOracle }, 10 ),
        make_decoded_custody( { .mint = Perpfeed::Test::eth_mint( ), .oracleAccount = ethOracle }, 11 ),
        make_decoded_custody( { .mint = Perpfeed::Test::make_public_key( 99 ), .oracleAccount = btcOracle }, 12 )
    };

    auto absentPrice = make_price( 1, 1'000 );
    absentPrice.price = std::nullopt;
    OraclePriceMap prices
    {
        { ethOracle, absentPrice },
        { btcOracle, make_price( 42, 1'000 ) }
    };

    auto markets = assemble_markets( make_pool( ), custodies, prices, 1'000 );
    ASSERT_EQ( markets.size( ), 1u );
    // Unknown mints are named by address.
    EXPECT_EQ( markets[ 0 ].symbol, fmt::format( "{}-USD", Perpfeed::Test::make_public_key( 99 ) ) );
}

TEST( MarketAssemblyTest, MissingConfidenceIsNull )
{
    auto oracle = Perpfeed::Test::make_public_key( 20 );
    std::vector< DecodedCustody > custodies{ make_decoded_custody( { .mint = Perpfeed::Test::sol_mint( ), .oracleAccount = oracle }, 10 ) };

    auto price = make_price( 150, 1'000 );
    price.confidence = std::nullopt;

    auto markets = assemble_markets( make_pool( ), custodies, { { oracle, price } }, 1'000 );
    ASSERT_EQ( markets.size( ), 1u );
    EXPECT_TRUE( markets[ 0 ].extra.at( "oracleConfidence" ).is_null( ) );
}

TEST( MarketAssemblyTest, DegenerateJumpCurvePropagates )
{
    auto oracle = Perpfeed::Test::make_public_key( 20 );
    std::vector< DecodedCustody > custodies
    {
        make_decoded_custody( { .mint = Perpfeed::Test::sol_mint( ), .oracleAccount = oracle, .borrowDbps = 0, .targetUtilizationRate = 1'000'000'000 }, 10 )
    };

    EXPECT_THROW( assemble_markets( make_pool( ), custodies, { { oracle, make_price( 150, 1'000 ) } }, 1'000 ), ConfigurationError );
}
