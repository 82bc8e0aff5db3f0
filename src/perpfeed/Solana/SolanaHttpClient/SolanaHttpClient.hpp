#pragma once

#include "perpfeed/Solana/SolanaHttpClient/SolanaHttpClientServiceProvider.hpp"
#include "perpfeed/Solana/SolanaHttpClient/SolanaHttpClientService.hpp"

namespace Perpfeed
{
namespace Solana
{
    using SolanaHttpClient = SolanaHttpClientServiceProvider< SolanaHttpClientService >;
} // namespace Solana
} // namespace Perpfeed
