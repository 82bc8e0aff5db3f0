#include "perpfeed/Jupiter/MockMarketFeed.hpp"

#include "perpfeed/Util/JsonUtils.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <simdjson.h>

#include <fmt/format.h>

#include <cstdlib>

namespace fs = std::filesystem;

namespace Perpfeed
{
namespace Jupiter
{

fs::path mock_feed_path_from_environment( )
{
    const char * customPath = std::getenv( mock_feed_path_variable( ).data( ) );
    fs::path feedPath = customPath && *customPath ? fs::path( customPath ) : mock_feed_path_default( );
    return fs::absolute( feedPath );
}

MockMarketFeed::MockMarketFeed( fs::path feedPath )
    : _feedPath( std::move( feedPath ) )
{ }

FallbackDataset MockMarketFeed::load( std::string_view venueId )
{
    const auto & feed = read_feed( );

    auto venueIt = feed.venues.find( std::string( venueId ) );
    if ( venueIt == feed.venues.end( ) )
    {
        throw ConfigurationError( fmt::format( "Mock feed missing venue \"{}\"", venueId ) );
    }

    return { .markets = venueIt->second.markets, .generatedAt = feed.generatedAt };
}

const MockMarketFeed::MockFeed & MockMarketFeed::read_feed( )
{
    std::error_code errorCode;
    auto writeTime = fs::last_write_time( _feedPath, errorCode );
    if ( errorCode )
    {
        throw ConfigurationError( fmt::format(
            "Perp mock feed not found at {}. Set {} or generate mock data.",
            _feedPath.string( ),
            mock_feed_path_variable( ) ) );
    }

    if ( _cachedWriteTime && *_cachedWriteTime == writeTime )
    {
        return _cachedFeed;
    }

    PERPFEED_LOG_DEBUG( _logger ) << fmt::format( "[{}] Loading mock feed {}", name( ), _feedPath.string( ) );

    _cachedFeed = parse_feed( );
    _cachedWriteTime = writeTime;
    return _cachedFeed;
}

MockMarketFeed::MockFeed MockMarketFeed::parse_feed( ) const
{
    MockFeed feed;
    try
    {
        simdjson::ondemand::parser parser;
        simdjson::padded_string feedBuffer = simdjson::padded_string::load( _feedPath.string( ) );
        simdjson::ondemand::document doc = parser.iterate( feedBuffer );

        for ( auto field : doc.get_object( ) )
        {
            std::string_view key = field.unescaped_key( ).value( );
            if ( key == "generatedAt" )
            {
                feed.generatedAt = std::string( field.value( ).get_string( ).value( ) );
            }
            else if ( key == "schemaVersion" )
            {
                feed.schemaVersion = std::string( field.value( ).get_string( ).value( ) );
            }
            else if ( key == "venues" )
            {
                for ( auto venueField : field.value( ).get_object( ) )
                {
                    std::string venueId( venueField.unescaped_key( ).value( ) );
                    MockVenue venue;
                    for ( auto venueMember : venueField.value( ).get_object( ) )
                    {
                        std::string_view memberKey = venueMember.unescaped_key( ).value( );
                        if ( memberKey == "status" )
                        {
                            venue.status = std::string( venueMember.value( ).get_string( ).value( ) );
                        }
                        else if ( memberKey == "markets" )
                        {
                            for ( simdjson::ondemand::value market : venueMember.value( ).get_array( ) )
                            {
                                venue.markets.push_back( json_to< MarketRecord >( market ) );
                            }
                        }
                    }
                    feed.venues.emplace( std::move( venueId ), std::move( venue ) );
                }
            }
        }
    }
    catch ( const simdjson::simdjson_error & error )
    {
        throw ConfigurationError( fmt::format( "Malformed mock feed {}: {}", _feedPath.string( ), error.what( ) ) );
    }

    return feed;
}

} // namespace Jupiter
} // namespace Perpfeed
