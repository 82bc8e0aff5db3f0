#pragma once

#include "perpfeed/Jupiter/MarketTypes.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace Perpfeed
{
namespace Jupiter
{

struct FallbackDataset
{
    std::vector< MarketRecord > markets;
    std::string generatedAt;
};

// Source of substitute market data used when a live read fails.
class FallbackMarketSource
{
public:
    virtual ~FallbackMarketSource( ) = default;

    virtual FallbackDataset load( std::string_view venueId ) = 0;
};

} // namespace Jupiter
} // namespace Perpfeed
