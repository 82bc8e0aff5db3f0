#pragma once

#include "perpfeed/Jupiter/FallbackMarketSource.hpp"
#include "perpfeed/Util/Logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace Perpfeed
{
namespace Jupiter
{

static constexpr std::string_view mock_feed_path_variable( ) { return "PERP_MOCK_PATH"; }
static std::filesystem::path mock_feed_path_default( ) { return "mocks/perp_feeds/sample_feeds.json"; }

// PERP_MOCK_PATH when set, otherwise the default location, resolved against the working directory.
std::filesystem::path mock_feed_path_from_environment( );

// Reads the fallback feed file. The parsed feed is kept until the file's modification time changes.
class MockMarketFeed : public FallbackMarketSource
{
public:
    explicit MockMarketFeed( std::filesystem::path feedPath );

    constexpr std::string name( ) const & { return "MockMarketFeed"; }

    // Throws ConfigurationError if the file is missing or malformed, or the venue is not present.
    FallbackDataset load( std::string_view venueId ) override;

    const std::filesystem::path & feed_path( ) const { return _feedPath; }

private:
    struct MockVenue
    {
        std::string status;
        std::vector< MarketRecord > markets;
    };

    struct MockFeed
    {
        std::string generatedAt;
        std::string schemaVersion;
        std::unordered_map< std::string, MockVenue > venues;
    };

    const MockFeed & read_feed( );
    MockFeed parse_feed( ) const;

    std::filesystem::path _feedPath;

    std::optional< std::filesystem::file_time_type > _cachedWriteTime;
    MockFeed _cachedFeed;

    mutable PerpfeedLogger _logger;
};

} // namespace Jupiter
} // namespace Perpfeed
