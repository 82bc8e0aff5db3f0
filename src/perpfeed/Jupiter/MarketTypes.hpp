#pragma once

#include "perpfeed/Util/JsonUtils.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value_from.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace Perpfeed
{
namespace Jupiter
{

enum class Side : uint8_t
{
    bid = 0,
    ask = 1
};

enum class MarketSource : uint8_t
{
    live = 0,
    mock = 1
};

enum class FetchMode : uint8_t
{
    automatic = 0, // Live, falling back to the mock dataset on recoverable failures.
    live = 1,      // Live, errors propagate.
    mock = 2       // Mock dataset only.
};

// "auto", "live" or "mock". Throws ConfigurationError otherwise.
FetchMode fetch_mode_from_name( std::string_view name );
std::string_view fetch_mode_name( FetchMode mode );

struct DepthLevel
{
    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const DepthLevel & level );

    Side side;
    double price;
    double size;
};

struct MarketRecord
{
    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const MarketRecord & market );
    friend MarketRecord tag_invoke( json_to_tag< MarketRecord >, simdjson::ondemand::value jsonValue );

    std::string symbol;
    double markPrice;
    double fundingRateHourly;
    double fundingRateAnnualized;
    double openInterestUsd;
    double takerFeeBps;
    double makerFeeBps;
    double minQty;
    std::vector< DepthLevel > depthTop5;

    // Display metadata.
    boost::json::object extra;
};

struct MarketSnapshot
{
    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const MarketSnapshot & snapshot );

    std::vector< MarketRecord > markets;
    std::string lastUpdated; // ISO-8601 UTC.
    MarketSource source;
};

// 2024-01-31T12:00:00.000Z
std::string format_iso8601( std::chrono::system_clock::time_point timePoint );

} // namespace Jupiter
} // namespace Perpfeed
