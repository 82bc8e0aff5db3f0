#include "perpfeed/Jupiter/MarketAssembly.hpp"

#include "perpfeed/Jupiter/DepthSynthesizer.hpp"
#include "perpfeed/Jupiter/RateCurve.hpp"
#include "perpfeed/Util/Logger.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <cmath>

namespace Perpfeed
{
namespace Jupiter
{

namespace
{

constexpr std::string_view component_name( ) { return "JupiterMarketAssembly"; }

double usd_amount( uint64_t amount )
{
    return static_cast< double >( amount ) / std::pow( 10.0, usd_decimals( ) );
}

boost::json::object market_metadata
(
    const PoolAccount & pool,
    const CustodyAccount & custody,
    const Core::PublicKey & oracleAddress,
    const Pyth::PythPriceAccount & oraclePrice
)
{
    BigInt borrowRate = hourly_borrow_rate( custody, true );

    boost::json::object extra;
    extra[ "mint" ] = custody.mint.enc_base58_text( );
    extra[ "oracleAccount" ] = oracleAddress.enc_base58_text( );
    if ( oraclePrice.confidence )
    {
        extra[ "oracleConfidence" ] = *oraclePrice.confidence;
    }
    else
    {
        extra[ "oracleConfidence" ] = nullptr;
    }
    extra[ "pricePublishSlot" ] = oraclePrice.publishSlot;
    extra[ "maxLeverage" ] = static_cast< double >( custody.pricing.maxLeverage ) / max_leverage_scale( );
    extra[ "maxGlobalLongUsd" ] = usd_amount( custody.pricing.maxGlobalLongSizes );
    extra[ "maxGlobalShortUsd" ] = usd_amount( custody.pricing.maxGlobalShortSizes );
    extra[ "poolName" ] = pool.name;
    extra[ "borrowLimitBps" ] = custody.borrowLendParameters.borrowsLimitInBps;
    extra[ "maintainanceMarginBps" ] = custody.borrowLendParameters.maintainanceMarginBps;
    extra[ "protocolFeeBps" ] = custody.borrowLendParameters.protocolFeeBps;
    extra[ "liquidationMargin" ] = custody.borrowLendParameters.liquidationMargin;
    extra[ "liquidationFeeBps" ] = custody.borrowLendParameters.liquidationFeeBps;
    extra[ "priceImpactExponent" ] = custody.priceImpactExponent;
    extra[ "borrowRateHourly" ] = borrowRate.convert_to< double >( ) / static_cast< double >( rate_power( ) );
    extra[ "depthModel" ] = "synthetic-1pct";
    return extra;
}

} // namespace

PoolAccount decode_pool
(
    const Anchor::AccountsCoder & coder,
    const Core::PublicKey & poolAddress,
    const std::optional< Solana::AccountInfo > & poolAccount
)
{
    if ( !poolAccount )
    {
        throw EmptyResultError( fmt::format( "Jupiter pool account not found at {}", poolAddress ) );
    }

    auto pool = Anchor::value_to< PoolAccount >( coder.decode( pool_account_name( ), poolAccount->data ) );
    if ( pool.custodies.empty( ) )
    {
        throw EmptyResultError( "Jupiter pool does not expose any custody accounts" );
    }
    return pool;
}

std::vector< DecodedCustody > decode_custodies
(
    const Anchor::AccountsCoder & coder,
    const std::vector< Core::PublicKey > & custodyAddresses,
    const std::vector< std::optional< Solana::AccountInfo > > & custodyAccounts
)
{
    std::vector< DecodedCustody > custodies;
    auto count = std::min( custodyAddresses.size( ), custodyAccounts.size( ) );
    for ( size_t index = 0; index < count; ++index )
    {
        const auto & address = custodyAddresses[ index ];
        const auto & account = custodyAccounts[ index ];
        if ( !account )
        {
            PERPFEED_LOG_WARNING_GLOBAL( ) << fmt::format( "[{}] Custody account {} not found", component_name( ), address );
            continue;
        }

        try
        {
            auto custody = Anchor::value_to< CustodyAccount >( coder.decode( custody_account_name( ), account->data ) );
            custodies.push_back( { .address = address, .custody = std::move( custody ) } );
        }
        catch ( const DecodeError & error )
        {
            PERPFEED_LOG_WARNING_GLOBAL( ) << fmt::format( "[{}] Unable to decode custody {}: {}", component_name( ), address, error.what( ) );
        }
        catch ( const SchemaError & error )
        {
            PERPFEED_LOG_WARNING_GLOBAL( ) << fmt::format( "[{}] Unable to decode custody {}: {}", component_name( ), address, error.what( ) );
        }
    }

    if ( custodies.empty( ) )
    {
        throw EmptyResultError( "Failed to decode Jupiter custody accounts" );
    }
    return custodies;
}

std::vector< Core::PublicKey > collect_oracle_addresses( const std::vector< DecodedCustody > & custodies )
{
    std::vector< Core::PublicKey > addresses;
    for ( const auto & [ address, custody ] : custodies )
    {
        if ( custody.oracle.oracleType != OracleType::pyth || custody.oracle.oracleAccount.is_zero( ) )
        {
            continue;
        }
        if ( std::find( addresses.begin( ), addresses.end( ), custody.oracle.oracleAccount ) == addresses.end( ) )
        {
            addresses.push_back( custody.oracle.oracleAccount );
        }
    }
    return addresses;
}

OraclePriceMap parse_oracle_prices
(
    const std::vector< Core::PublicKey > & oracleAddresses,
    const std::vector< std::optional< Solana::AccountInfo > > & oracleAccounts
)
{
    OraclePriceMap prices;
    auto count = std::min( oracleAddresses.size( ), oracleAccounts.size( ) );
    for ( size_t index = 0; index < count; ++index )
    {
        const auto & address = oracleAddresses[ index ];
        const auto & account = oracleAccounts[ index ];
        if ( !account )
        {
            PERPFEED_LOG_WARNING_GLOBAL( ) << fmt::format( "[{}] Oracle account {} not found", component_name( ), address );
            continue;
        }

        try
        {
            prices.emplace( address, Pyth::parse_price_account( account->data ) );
        }
        catch ( const OracleFormatError & error )
        {
            PERPFEED_LOG_WARNING_GLOBAL( ) << fmt::format( "[{}] Unable to parse Pyth account {}: {}", component_name( ), address, error.what( ) );
        }
    }
    return prices;
}

bool is_oracle_fresh( uint64_t currentSlot, uint64_t publishSlot )
{
    auto drift = static_cast< int64_t >( currentSlot ) - static_cast< int64_t >( publishSlot );
    return drift <= static_cast< int64_t >( max_oracle_slot_drift( ) );
}

std::vector< MarketRecord > assemble_markets
(
    const PoolAccount & pool,
    const std::vector< DecodedCustody > & custodies,
    const OraclePriceMap & oraclePrices,
    uint64_t currentSlot
)
{
    std::vector< MarketRecord > markets;
    for ( const auto & [ address, custody ] : custodies )
    {
        const auto & oracleAddress = custody.oracle.oracleAccount;
        auto priceIt = oraclePrices.find( oracleAddress );
        if ( priceIt == oraclePrices.end( ) )
        {
            PERPFEED_LOG_DEBUG_GLOBAL( ) << fmt::format( "[{}] No oracle price for custody {}", component_name( ), address );
            continue;
        }

        const auto & oraclePrice = priceIt->second;
        if ( oraclePrice.status != Pyth::PriceStatus::Trading )
        {
            PERPFEED_LOG_WARNING_GLOBAL( )
                << fmt::format( "[{}] Skipping custody {}, oracle status: {}", component_name( ), address, magic_enum::enum_name( oraclePrice.status ) );
            continue;
        }

        if ( !is_oracle_fresh( currentSlot, oraclePrice.publishSlot ) )
        {
            PERPFEED_LOG_WARNING_GLOBAL( )
                << fmt::format
                (
                    "[{}] Skipping custody {}, stale oracle, current slot: {}, publish slot: {}",
                    component_name( ),
                    address,
                    currentSlot,
                    oraclePrice.publishSlot
                );
            continue;
        }

        double markPrice = oraclePrice.price.value_or( 0.0 );
        if ( !std::isfinite( markPrice ) || markPrice <= 0 )
        {
            PERPFEED_LOG_WARNING_GLOBAL( ) << fmt::format( "[{}] Skipping custody {}, invalid mark price", component_name( ), address );
            continue;
        }

        auto funding = compute_funding_rates( custody );

        markets.push_back(
        {
            .symbol = fmt::format( "{}-USD", base_symbol( custody.mint ) ),
            .markPrice = markPrice,
            .fundingRateHourly = funding.hourly,
            .fundingRateAnnualized = funding.annualized,
            .openInterestUsd = ( static_cast< double >( custody.assets.guaranteedUsd ) + static_cast< double >( custody.assets.globalShortSizes ) )
                / std::pow( 10.0, usd_decimals( ) ),
            .takerFeeBps = static_cast< double >( custody.increasePositionBps ),
            .makerFeeBps = static_cast< double >( custody.decreasePositionBps ),
            .minQty = 0,
            .depthTop5 = synthesize_depth
            (
                markPrice,
                usd_amount( custody.pricing.onePercentDepthBelow ),
                usd_amount( custody.pricing.onePercentDepthAbove )
            ),
            .extra = market_metadata( pool, custody, oracleAddress, oraclePrice )
        } );
    }

    if ( markets.empty( ) )
    {
        throw EmptyResultError( "All Jupiter markets are stale or unavailable" );
    }
    return markets;
}

} // namespace Jupiter
} // namespace Perpfeed
