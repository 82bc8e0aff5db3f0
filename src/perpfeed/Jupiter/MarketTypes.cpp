#include "perpfeed/Jupiter/MarketTypes.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <boost/json/array.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

namespace Perpfeed
{
namespace Jupiter
{

FetchMode fetch_mode_from_name( std::string_view name )
{
    if ( name == "auto" )
    {
        return FetchMode::automatic;
    }
    if ( name == "live" )
    {
        return FetchMode::live;
    }
    if ( name == "mock" )
    {
        return FetchMode::mock;
    }
    throw ConfigurationError( fmt::format( "Unknown fetch mode '{}', expected auto, live or mock", name ) );
}

std::string_view fetch_mode_name( FetchMode mode )
{
    return mode == FetchMode::automatic ? "auto" : magic_enum::enum_name( mode );
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const DepthLevel & level )
{
    jsonValue = boost::json::object
    {
        { "side", magic_enum::enum_name( level.side ) },
        { "price", level.price },
        { "size", level.size }
    };
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const MarketRecord & market )
{
    boost::json::array depth;
    for ( const auto & level : market.depthTop5 )
    {
        depth.push_back( boost::json::value_from( level ) );
    }

    jsonValue = boost::json::object
    {
        { "symbol", market.symbol },
        { "markPrice", market.markPrice },
        { "fundingRateHourly", market.fundingRateHourly },
        { "fundingRateAnnualized", market.fundingRateAnnualized },
        { "openInterestUsd", market.openInterestUsd },
        { "takerFeeBps", market.takerFeeBps },
        { "makerFeeBps", market.makerFeeBps },
        { "minQty", market.minQty },
        { "depthTop5", std::move( depth ) },
        { "extra", market.extra }
    };
}

MarketRecord tag_invoke( json_to_tag< MarketRecord >, simdjson::ondemand::value jsonValue )
{
    MarketRecord market{ };

    for ( auto field : jsonValue.get_object( ) )
    {
        std::string_view key = field.unescaped_key( ).value( );
        auto value = field.value( );

        if ( key == "symbol" ) market.symbol = std::string( value.get_string( ).value( ) );
        else if ( key == "markPrice" ) market.markPrice = value.get_double( );
        else if ( key == "fundingRateHourly" ) market.fundingRateHourly = value.get_double( );
        else if ( key == "fundingRateAnnualized" ) market.fundingRateAnnualized = value.get_double( );
        else if ( key == "openInterestUsd" ) market.openInterestUsd = value.get_double( );
        else if ( key == "takerFeeBps" ) market.takerFeeBps = value.get_double( );
        else if ( key == "makerFeeBps" ) market.makerFeeBps = value.get_double( );
        else if ( key == "minQty" ) market.minQty = value.get_double( );
        else if ( key == "depthTop5" )
        {
            for ( simdjson::ondemand::object level : value.get_array( ) )
            {
                std::string_view side;
                double price = 0;
                double size = 0;
                for ( auto levelField : level )
                {
                    std::string_view levelKey = levelField.unescaped_key( ).value( );
                    if ( levelKey == "side" ) side = levelField.value( ).get_string( ).value( );
                    else if ( levelKey == "price" ) price = levelField.value( ).get_double( );
                    else if ( levelKey == "size" ) size = levelField.value( ).get_double( );
                }

                // Levels without a valid side are dropped.
                auto levelSide = magic_enum::enum_cast< Side >( side );
                if ( levelSide )
                {
                    market.depthTop5.push_back( { .side = *levelSide, .price = price, .size = size } );
                }
            }
        }
        else
        {
            // Unknown keys are kept as display metadata.
            std::string_view raw = simdjson::to_json_string( value ).value( );
            market.extra[ key ] = boost::json::parse( raw );
        }
    }

    return market;
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const MarketSnapshot & snapshot )
{
    boost::json::array markets;
    for ( const auto & market : snapshot.markets )
    {
        markets.push_back( boost::json::value_from( market ) );
    }

    jsonValue = boost::json::object
    {
        { "markets", std::move( markets ) },
        { "lastUpdated", snapshot.lastUpdated },
        { "source", magic_enum::enum_name( snapshot.source ) }
    };
}

std::string format_iso8601( std::chrono::system_clock::time_point timePoint )
{
    auto milliseconds = std::chrono::duration_cast< std::chrono::milliseconds >( timePoint.time_since_epoch( ) ).count( ) % 1000;
    return fmt::format( "{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime( std::chrono::system_clock::to_time_t( timePoint ) ), milliseconds );
}

} // namespace Jupiter
} // namespace Perpfeed
