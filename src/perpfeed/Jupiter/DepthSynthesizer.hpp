#pragma once

#include "perpfeed/Jupiter/MarketTypes.hpp"

#include <vector>

namespace Perpfeed
{
namespace Jupiter
{

static constexpr size_t depth_levels_per_side( ) { return 3; }
static constexpr double depth_band( ) { return 0.01; }

// Synthetic ladder approximating the liquidity quoted within one percent of mark.
// Bids come first, each side ordered outward from mark. Empty for a non-positive or non-finite mark.
std::vector< DepthLevel > synthesize_depth( double markPrice, double belowUsd, double aboveUsd );

} // namespace Jupiter
} // namespace Perpfeed
