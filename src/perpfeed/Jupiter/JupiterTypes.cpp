#include "perpfeed/Jupiter/JupiterTypes.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <cctype>
#include <array>
#include <utility>

namespace Perpfeed
{
namespace Jupiter
{

namespace
{

constexpr std::array< std::pair< std::string_view, std::string_view >, 5 > mintSymbols =
{ {
    { "So11111111111111111111111111111111111111112", "SOL" },
    { "7vfCXTUXx5WJV5JADk17DUJ4ksgau7utNKj4b963voxs", "ETH" },
    { "3NZ9JMVBmGAqocybic2c7LQCJScmgsAZ6vQqTDzcqmJh", "BTC" },
    { "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v", "USDC" },
    { "Es9vMFrzaCERmJfrF4H2FYD4KCoNkY11McCe8BenwNYB", "USDT" }
} };

OracleType oracle_type( const Anchor::Value & value )
{
    const auto & variant = value.as_enum( ).variant;
    auto oracleType = magic_enum::enum_cast< OracleType >
    (
        variant,
        [ ]( char lhs, char rhs ) { return std::tolower( static_cast< unsigned char >( lhs ) ) == std::tolower( static_cast< unsigned char >( rhs ) ); }
    );
    return oracleType.value_or( OracleType::other );
}

FundingRateState funding_rate_state( const Anchor::Value & value )
{
    return FundingRateState
    {
        .cumulativeInterestRate = value[ "cumulativeInterestRate" ].as< Uint128 >( ),
        .lastUpdate = value[ "lastUpdate" ].as_i64( ),
        .hourlyFundingDbps = value[ "hourlyFundingDbps" ].as_u64( )
    };
}

} // namespace

PoolAccount tag_invoke( Anchor::value_to_tag< PoolAccount >, const Anchor::Value & value )
{
    PoolAccount pool;
    pool.name = value[ "name" ].as_string( );
    for ( const auto & custody : value[ "custodies" ].as_list( ) )
    {
        pool.custodies.push_back( custody.as_public_key( ) );
    }
    return pool;
}

CustodyAccount tag_invoke( Anchor::value_to_tag< CustodyAccount >, const Anchor::Value & value )
{
    const auto & oracle = value[ "oracle" ];
    const auto & pricing = value[ "pricing" ];
    const auto & permissions = value[ "permissions" ];
    const auto & assets = value[ "assets" ];
    const auto & jumpRateState = value[ "jumpRateState" ];
    const auto & borrowLendParameters = value[ "borrowLendParameters" ];

    return CustodyAccount
    {
        .mint = value[ "mint" ].as_public_key( ),
        .decimals = static_cast< uint8_t >( value[ "decimals" ].as_u64( ) ),
        .isStable = value[ "isStable" ].as_bool( ),
        .oracle =
        {
            .oracleAccount = oracle[ "oracleAccount" ].as_public_key( ),
            .oracleType = oracle_type( oracle[ "oracleType" ] ),
            .maxPriceAgeSec = oracle[ "maxPriceAgeSec" ].as_u64( )
        },
        .pricing =
        {
            .maxLeverage = pricing[ "maxLeverage" ].as_u64( ),
            .maxGlobalLongSizes = pricing[ "maxGlobalLongSizes" ].as_u64( ),
            .maxGlobalShortSizes = pricing[ "maxGlobalShortSizes" ].as_u64( ),
            .onePercentDepthAbove = pricing[ "onePercentDepthAbove" ].as_u64( ),
            .onePercentDepthBelow = pricing[ "onePercentDepthBelow" ].as_u64( )
        },
        .permissions =
        {
            .allowSwap = permissions[ "allowSwap" ].as_bool( ),
            .allowIncreasePosition = permissions[ "allowIncreasePosition" ].as_bool( ),
            .allowDecreasePosition = permissions[ "allowDecreasePosition" ].as_bool( )
        },
        .assets =
        {
            .feesReserves = assets[ "feesReserves" ].as_u64( ),
            .owned = assets[ "owned" ].as_u64( ),
            .locked = assets[ "locked" ].as_u64( ),
            .guaranteedUsd = assets[ "guaranteedUsd" ].as_u64( ),
            .globalShortSizes = assets[ "globalShortSizes" ].as_u64( ),
            .globalShortAveragePrices = assets[ "globalShortAveragePrices" ].as_u64( )
        },
        .fundingRateState = funding_rate_state( value[ "fundingRateState" ] ),
        .borrowsFundingRateState = funding_rate_state( value[ "borrowsFundingRateState" ] ),
        .jumpRateState =
        {
            .minRateBps = jumpRateState[ "minRateBps" ].as_u64( ),
            .maxRateBps = jumpRateState[ "maxRateBps" ].as_u64( ),
            .targetRateBps = jumpRateState[ "targetRateBps" ].as_u64( ),
            .targetUtilizationRate = jumpRateState[ "targetUtilizationRate" ].as_u64( )
        },
        .increasePositionBps = value[ "increasePositionBps" ].as_u64( ),
        .decreasePositionBps = value[ "decreasePositionBps" ].as_u64( ),
        .borrowLendParameters =
        {
            .borrowsLimitInBps = borrowLendParameters[ "borrowsLimitInBps" ].as_u64( ),
            .maintainanceMarginBps = borrowLendParameters[ "maintainanceMarginBps" ].as_u64( ),
            .protocolFeeBps = borrowLendParameters[ "protocolFeeBps" ].as_u64( ),
            .liquidationMargin = borrowLendParameters[ "liquidationMargin" ].as_u64( ),
            .liquidationFeeBps = borrowLendParameters[ "liquidationFeeBps" ].as_u64( )
        },
        .priceImpactExponent = value[ "priceImpactBuffer" ][ "exponent" ].as_f64( ),
        .debt = value[ "debt" ].as< Uint128 >( ),
        .borrowLendInterestsAccured = value[ "borrowLendInterestsAccured" ].as< Uint128 >( )
    };
}

std::shared_ptr< const Anchor::AccountsCoder > make_jupiter_coder( const std::filesystem::path & idlPath )
{
    auto registry = std::make_shared< const Anchor::LayoutRegistry >( Anchor::load_registry( idlPath ) );
    return std::make_shared< const Anchor::AccountsCoder >( std::move( registry ), Anchor::CoderOptions{ .enumTagWidth = Anchor::EnumTagWidth::U8 } );
}

std::string base_symbol( const Core::PublicKey & mint )
{
    auto address = mint.enc_base58_text( );
    auto it = std::find_if( mintSymbols.begin( ), mintSymbols.end( ), [ &address ]( const auto & entry ) { return entry.first == address; } );
    return it == mintSymbols.end( ) ? address : std::string( it->second );
}

} // namespace Jupiter
} // namespace Perpfeed
