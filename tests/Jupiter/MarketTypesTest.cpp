#include "perpfeed/Jupiter/MarketTypes.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <boost/json/value_from.hpp>

#include <gtest/gtest.h>

using namespace Perpfeed;
using namespace Perpfeed::Jupiter;

TEST( MarketTypesTest, FetchModeNames )
{
    EXPECT_EQ( fetch_mode_from_name( "auto" ), FetchMode::automatic );
    EXPECT_EQ( fetch_mode_from_name( "live" ), FetchMode::live );
    EXPECT_EQ( fetch_mode_from_name( "mock" ), FetchMode::mock );
    EXPECT_THROW( fetch_mode_from_name( "automatic" ), ConfigurationError );

    EXPECT_EQ( fetch_mode_name( FetchMode::automatic ), "auto" );
    EXPECT_EQ( fetch_mode_name( FetchMode::mock ), "mock" );
}

TEST( MarketTypesTest, Iso8601 )
{
    auto timePoint = std::chrono::system_clock::time_point( std::chrono::milliseconds( 1'736'942'400'042 ) );
    EXPECT_EQ( format_iso8601( timePoint ), "2025-01-15T12:00:00.042Z" );
}

TEST( MarketTypesTest, SnapshotJson )
{
    MarketRecord market{ };
    market.symbol = "SOL-USD";
    market.markPrice = 150;
    market.depthTop5 = { { .side = Side::bid, .price = 149.5, .size = 10 } };
    market.extra[ "depthModel" ] = "synthetic-1pct";

    MarketSnapshot snapshot{ .markets = { market }, .lastUpdated = "2025-01-15T12:00:00.000Z", .source = MarketSource::live };
    auto json = boost::json::value_from( snapshot );

    EXPECT_EQ( json.at( "source" ).as_string( ), "live" );
    EXPECT_EQ( json.at( "lastUpdated" ).as_string( ), "2025-01-15T12:00:00.000Z" );

    const auto & record = json.at( "markets" ).as_array( ).at( 0 );
    EXPECT_EQ( record.at( "symbol" ).as_string( ), "SOL-USD" );
    EXPECT_DOUBLE_EQ( record.at( "markPrice" ).as_double( ), 150 );
    EXPECT_EQ( record.at( "depthTop5" ).as_array( ).at( 0 ).at( "side" ).as_string( ), "bid" );
    EXPECT_EQ( record.at( "extra" ).at( "depthModel" ).as_string( ), "synthetic-1pct" );
}
