#include "perpfeed/Jupiter/DepthSynthesizer.hpp"

#include <cmath>

namespace Perpfeed
{
namespace Jupiter
{

namespace
{

void add_side( std::vector< DepthLevel > & levels, Side side, double markPrice, double usd )
{
    if ( !( usd > 0 ) )
    {
        return;
    }

    double priceStep = depth_band( ) / depth_levels_per_side( );
    double sizePerLevel = usd / markPrice / depth_levels_per_side( );
    double direction = side == Side::bid ? -1.0 : 1.0;

    for ( size_t level = 1; level <= depth_levels_per_side( ); ++level )
    {
        levels.push_back(
        {
            .side = side,
            .price = markPrice * ( 1.0 + direction * priceStep * level ),
            .size = sizePerLevel
        } );
    }
}

} // namespace

std::vector< DepthLevel > synthesize_depth( double markPrice, double belowUsd, double aboveUsd )
{
    std::vector< DepthLevel > levels;
    if ( !std::isfinite( markPrice ) || markPrice <= 0 )
    {
        return levels;
    }

    levels.reserve( 2 * depth_levels_per_side( ) );
    add_side( levels, Side::bid, markPrice, belowUsd );
    add_side( levels, Side::ask, markPrice, aboveUsd );
    return levels;
}

} // namespace Jupiter
} // namespace Perpfeed
