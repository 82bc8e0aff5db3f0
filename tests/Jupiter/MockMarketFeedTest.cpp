#include "perpfeed/Jupiter/MockMarketFeed.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace Perpfeed;
using namespace Perpfeed::Jupiter;

namespace fs = std::filesystem;

namespace
{

constexpr std::string_view sample_feed( )
{
    return R"json(
    {
        "generatedAt": "2025-01-15T12:00:00.000Z",
        "schemaVersion": "1.0",
        "venues":
        {
            "jupiter_perps":
            {
                "status": "ok",
                "markets":
                [
                    {
                        "symbol": "SOL-USD",
                        "markPrice": 187.42,
                        "fundingRateHourly": 0.0000125,
                        "fundingRateAnnualized": 0.1095,
                        "openInterestUsd": 412500000,
                        "takerFeeBps": 6,
                        "makerFeeBps": 6,
                        "minQty": 0,
                        "depthTop5":
                        [
                            { "side": "bid", "price": 186.8, "size": 1800.5 },
                            { "side": "sideways", "price": 187.0, "size": 1.0 },
                            { "side": "ask", "price": 188.04, "size": 1750.25 }
                        ],
                        "maxLeverage": 250,
                        "poolName": "Pool",
                        "tags": [ "majors" ]
                    }
                ]
            },
            "synfutures": { "status": "ok", "markets": [ ] }
        }
    }
    )json";
}

class MockMarketFeedTest : public ::testing::Test
{
protected:
    void SetUp( ) override
    {
        const auto * testInfo = ::testing::UnitTest::GetInstance( )->current_test_info( );
        _feedPath = fs::temp_directory_path( ) / fmt::format( "perpfeed_{}_{}.json", testInfo->name( ), ::getpid( ) );
        write_feed( sample_feed( ) );
    }

    void TearDown( ) override
    {
        std::error_code errorCode;
        fs::remove( _feedPath, errorCode );
    }

    void write_feed( std::string_view content )
    {
        std::ofstream file( _feedPath, std::ios::trunc );
        file << content;
    }

    fs::path _feedPath;
};

} // namespace

TEST_F( MockMarketFeedTest, LoadVenue )
{
    MockMarketFeed feed( _feedPath );
    auto dataset = feed.load( "jupiter_perps" );

    EXPECT_EQ( dataset.generatedAt, "2025-01-15T12:00:00.000Z" );
    ASSERT_EQ( dataset.markets.size( ), 1u );

    const auto & market = dataset.markets[ 0 ];
    EXPECT_EQ( market.symbol, "SOL-USD" );
    EXPECT_DOUBLE_EQ( market.markPrice, 187.42 );
    EXPECT_DOUBLE_EQ( market.openInterestUsd, 412'500'000 );
    EXPECT_DOUBLE_EQ( market.takerFeeBps, 6 );
}

TEST_F( MockMarketFeedTest, InvalidDepthSideDropped )
{
    MockMarketFeed feed( _feedPath );
    auto dataset = feed.load( "jupiter_perps" );

    const auto & depth = dataset.markets.at( 0 ).depthTop5;
    ASSERT_EQ( depth.size( ), 2u );
    EXPECT_EQ( depth[ 0 ].side, Side::bid );
    EXPECT_DOUBLE_EQ( depth[ 0 ].price, 186.8 );
    EXPECT_EQ( depth[ 1 ].side, Side::ask );
    EXPECT_DOUBLE_EQ( depth[ 1 ].size, 1750.25 );
}

TEST_F( MockMarketFeedTest, UnknownKeysKeptAsMetadata )
{
    MockMarketFeed feed( _feedPath );
    auto dataset = feed.load( "jupiter_perps" );

    const auto & extra = dataset.markets.at( 0 ).extra;
    EXPECT_EQ( extra.at( "maxLeverage" ).to_number< int64_t >( ), 250 );
    EXPECT_EQ( extra.at( "poolName" ).as_string( ), "Pool" );
    ASSERT_TRUE( extra.at( "tags" ).is_array( ) );
    EXPECT_EQ( extra.at( "tags" ).as_array( ).at( 0 ).as_string( ), "majors" );
    EXPECT_FALSE( extra.contains( "symbol" ) );
}

TEST_F( MockMarketFeedTest, EmptyVenue )
{
    MockMarketFeed feed( _feedPath );
    EXPECT_TRUE( feed.load( "synfutures" ).markets.empty( ) );
}

TEST_F( MockMarketFeedTest, MissingVenueThrows )
{
    MockMarketFeed feed( _feedPath );
    EXPECT_THROW( feed.load( "drift" ), ConfigurationError );
}

TEST_F( MockMarketFeedTest, MissingFileThrows )
{
    MockMarketFeed feed( _feedPath.string( ) + ".missing" );
    EXPECT_THROW( feed.load( "jupiter_perps" ), ConfigurationError );
}

TEST_F( MockMarketFeedTest, MalformedFileThrows )
{
    write_feed( "{ \"venues\": [ " );
    MockMarketFeed feed( _feedPath );
    EXPECT_THROW( feed.load( "jupiter_perps" ), ConfigurationError );
}

TEST_F( MockMarketFeedTest, ReloadsWhenFileChanges )
{
    MockMarketFeed feed( _feedPath );
    EXPECT_EQ( feed.load( "jupiter_perps" ).markets.size( ), 1u );

    auto writeTime = fs::last_write_time( _feedPath );
    write_feed( R"json({ "generatedAt": "2025-02-01T00:00:00.000Z", "venues": { "jupiter_perps": { "markets": [ ] } } })json" );

    // Same modification time, cached copy served.
    fs::last_write_time( _feedPath, writeTime );
    EXPECT_EQ( feed.load( "jupiter_perps" ).markets.size( ), 1u );

    fs::last_write_time( _feedPath, writeTime + std::chrono::seconds( 2 ) );
    auto dataset = feed.load( "jupiter_perps" );
    EXPECT_TRUE( dataset.markets.empty( ) );
    EXPECT_EQ( dataset.generatedAt, "2025-02-01T00:00:00.000Z" );
}

TEST_F( MockMarketFeedTest, PathFromEnvironment )
{
    ::setenv( std::string( mock_feed_path_variable( ) ).c_str( ), _feedPath.c_str( ), 1 );
    EXPECT_EQ( mock_feed_path_from_environment( ), _feedPath );

    ::unsetenv( std::string( mock_feed_path_variable( ) ).c_str( ) );
    auto defaultPath = mock_feed_path_from_environment( );
    EXPECT_TRUE( defaultPath.is_absolute( ) );
    EXPECT_EQ( defaultPath, fs::absolute( mock_feed_path_default( ) ) );
}
