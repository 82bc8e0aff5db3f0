#pragma once

#include "perpfeed/Anchor/AccountsCoder.hpp"
#include "perpfeed/Jupiter/JupiterTypes.hpp"
#include "perpfeed/Jupiter/MarketTypes.hpp"
#include "perpfeed/Pyth/PythTypes.hpp"
#include "perpfeed/Solana/SolanaTypes.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace Perpfeed
{
namespace Jupiter
{

struct DecodedCustody
{
    Core::PublicKey address;
    CustodyAccount custody;
};

using OraclePriceMap = std::unordered_map< Core::PublicKey, Pyth::PythPriceAccount >;

// Throws EmptyResultError when the account is missing or lists no custodies.
PoolAccount decode_pool
(
    const Anchor::AccountsCoder & coder,
    const Core::PublicKey & poolAddress,
    const std::optional< Solana::AccountInfo > & poolAccount
);

// Missing or undecodable custodies are skipped. Throws EmptyResultError when none remain.
std::vector< DecodedCustody > decode_custodies
(
    const Anchor::AccountsCoder & coder,
    const std::vector< Core::PublicKey > & custodyAddresses,
    const std::vector< std::optional< Solana::AccountInfo > > & custodyAccounts
);

// Distinct Pyth oracle addresses in first-seen order.
std::vector< Core::PublicKey > collect_oracle_addresses( const std::vector< DecodedCustody > & custodies );

// Missing or unparsable oracle accounts are skipped.
OraclePriceMap parse_oracle_prices
(
    const std::vector< Core::PublicKey > & oracleAddresses,
    const std::vector< std::optional< Solana::AccountInfo > > & oracleAccounts
);

// True when the price was published within max_oracle_slot_drift( ) slots of currentSlot.
bool is_oracle_fresh( uint64_t currentSlot, uint64_t publishSlot );

// One record per custody with a trading, fresh, positive oracle price.
// Throws EmptyResultError when every instrument is filtered out.
// ConfigurationError from the rate engine propagates.
std::vector< MarketRecord > assemble_markets
(
    const PoolAccount & pool,
    const std::vector< DecodedCustody > & custodies,
    const OraclePriceMap & oraclePrices,
    uint64_t currentSlot
);

} // namespace Jupiter
} // namespace Perpfeed
