#pragma once

#include "perpfeed/Jupiter/JupiterMarketDataClient/JupiterMarketDataClientServiceProvider.hpp"
#include "perpfeed/Jupiter/JupiterMarketDataClient/JupiterMarketDataClientService.hpp"

namespace Perpfeed
{
namespace Jupiter
{
    using JupiterMarketDataClient = JupiterMarketDataClientServiceProvider< JupiterMarketDataClientService >;
} // namespace Jupiter
} // namespace Perpfeed
