#pragma once

#include "perpfeed/Anchor/AccountsCoder.hpp"
#include "perpfeed/Anchor/AnchorValue.hpp"
#include "perpfeed/Core/PublicKey.hpp"
#include "perpfeed/Util/Fixed.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Perpfeed
{
namespace Jupiter
{

static constexpr uint32_t usd_decimals( ) { return 6; }
static constexpr uint64_t max_leverage_scale( ) { return 100'000; }
static constexpr uint64_t hours_in_year( ) { return 24 * 365; }
static constexpr uint64_t max_oracle_slot_drift( ) { return 25; }

static constexpr uint64_t bps_power( ) { return 10'000; }
static constexpr uint64_t dbps_power( ) { return 100'000; }
static constexpr uint64_t rate_power( ) { return 1'000'000'000; }
static constexpr uint64_t debt_power( ) { return rate_power( ); }

static constexpr std::string_view venue_id( ) { return "jupiter_perps"; }
static constexpr std::string_view default_rpc_url( ) { return "https://api.mainnet-beta.solana.com"; }
static constexpr std::string_view default_pool_address( ) { return "5BUwFW4nRbftYTDMbgxykoFWqWHPzahFSNAaaaJtVKsq"; }

// Account names in the program interface description.
static constexpr std::string_view pool_account_name( ) { return "pool"; }
static constexpr std::string_view custody_account_name( ) { return "custody"; }

enum class OracleType : uint8_t
{
    none = 0,
    test = 1,
    pyth = 2,
    other = 3
};

struct PoolAccount
{
    friend PoolAccount tag_invoke( Anchor::value_to_tag< PoolAccount >, const Anchor::Value & value );

    std::string name;
    std::vector< Core::PublicKey > custodies;
};

struct OracleParams
{
    Core::PublicKey oracleAccount;
    OracleType oracleType;
    uint64_t maxPriceAgeSec;
};

struct PricingParams
{
    uint64_t maxLeverage;
    uint64_t maxGlobalLongSizes;
    uint64_t maxGlobalShortSizes;
    uint64_t onePercentDepthAbove;
    uint64_t onePercentDepthBelow;
};

struct Assets
{
    uint64_t feesReserves;
    uint64_t owned;
    uint64_t locked;
    uint64_t guaranteedUsd;
    uint64_t globalShortSizes;
    uint64_t globalShortAveragePrices;
};

struct FundingRateState
{
    Uint128 cumulativeInterestRate;
    int64_t lastUpdate;
    uint64_t hourlyFundingDbps;
};

struct JumpRateState
{
    uint64_t minRateBps;
    uint64_t maxRateBps;
    uint64_t targetRateBps;
    uint64_t targetUtilizationRate;
};

struct BorrowLendParams
{
    uint64_t borrowsLimitInBps;
    uint64_t maintainanceMarginBps;
    uint64_t protocolFeeBps;
    uint64_t liquidationMargin;
    uint64_t liquidationFeeBps;
};

struct Permissions
{
    bool allowSwap;
    bool allowIncreasePosition;
    bool allowDecreasePosition;
};

struct CustodyAccount
{
    friend CustodyAccount tag_invoke( Anchor::value_to_tag< CustodyAccount >, const Anchor::Value & value );

    Core::PublicKey mint;
    uint8_t decimals;
    bool isStable;
    OracleParams oracle;
    PricingParams pricing;
    Permissions permissions;
    Assets assets;
    FundingRateState fundingRateState;
    FundingRateState borrowsFundingRateState;
    JumpRateState jumpRateState;
    uint64_t increasePositionBps;
    uint64_t decreasePositionBps;
    BorrowLendParams borrowLendParameters;
    double priceImpactExponent;
    Uint128 debt;
    Uint128 borrowLendInterestsAccured;
};

// Decoder configured for the Jupiter program: 1-byte enum variant index.
std::shared_ptr< const Anchor::AccountsCoder > make_jupiter_coder( const std::filesystem::path & idlPath );

// Known mints map to their ticker, other mints to their base58 address.
std::string base_symbol( const Core::PublicKey & mint );

} // namespace Jupiter
} // namespace Perpfeed
