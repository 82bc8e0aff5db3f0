#include "perpfeed/Jupiter/RateCurve.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <fmt/format.h>

namespace Perpfeed
{
namespace Jupiter
{

BigInt ceil_div( const BigInt & numerator, const BigInt & denominator )
{
    if ( denominator == 0 )
    {
        throw ConfigurationError( "Division by zero in rate computation" );
    }

    // cpp_int division truncates toward zero, which is already the ceiling for negative quotients.
    BigInt quotient = numerator / denominator;
    BigInt remainder = numerator % denominator;
    if ( remainder != 0 && ( ( numerator < 0 ) == ( denominator < 0 ) ) )
    {
        ++quotient;
    }
    return quotient;
}

BigInt get_debt( const CustodyAccount & custody )
{
    BigInt outstanding = BigInt( custody.debt ) - BigInt( custody.borrowLendInterestsAccured );
    if ( outstanding < 0 )
    {
        outstanding = 0;
    }
    return ceil_div( outstanding, debt_power( ) );
}

BigInt theoretically_owned( const CustodyAccount & custody )
{
    return BigInt( custody.assets.owned ) + get_debt( custody );
}

BigInt total_locked( const CustodyAccount & custody )
{
    return BigInt( custody.assets.locked ) + get_debt( custody );
}

BorrowRateMechanism borrow_rate_mechanism( const CustodyAccount & custody )
{
    return custody.borrowsFundingRateState.hourlyFundingDbps != 0 ? BorrowRateMechanism::linear : BorrowRateMechanism::jump;
}

namespace
{

BigInt linear_hourly_rate( const CustodyAccount & custody, const BigInt & owned, const BigInt & locked, bool useBorrowCurve )
{
    const FundingRateState & state = useBorrowCurve ? custody.borrowsFundingRateState : custody.fundingRateState;
    BigInt hourlyFundingRate = BigInt( state.hourlyFundingDbps ) * rate_power( ) / dbps_power( );

    if ( owned == 0 || locked == 0 )
    {
        return 0;
    }
    return ceil_div( locked * hourlyFundingRate, owned );
}

BigInt jump_hourly_rate( const CustodyAccount & custody, const BigInt & owned, const BigInt & locked )
{
    const JumpRateState & jump = custody.jumpRateState;
    BigInt minRate = jump.minRateBps;
    BigInt maxRate = jump.maxRateBps;
    BigInt targetRate = jump.targetRateBps;
    BigInt targetUtilization = jump.targetUtilizationRate;

    BigInt upperDenominator = BigInt( rate_power( ) ) - targetUtilization;
    if ( upperDenominator <= 0 )
    {
        throw ConfigurationError( fmt::format(
            "Invalid jump rate configuration: target utilization {} leaves no room below {}",
            jump.targetUtilizationRate,
            rate_power( ) ) );
    }

    if ( owned == 0 || locked == 0 )
    {
        return 0;
    }

    BigInt utilization = locked * rate_power( ) / owned;

    BigInt yearlyRate;
    if ( utilization <= targetUtilization )
    {
        BigInt slope = targetUtilization == 0 ? BigInt( 0 ) : ceil_div( ( targetRate - minRate ) * utilization, targetUtilization );
        yearlyRate = ( slope + minRate ) * rate_power( ) / bps_power( );
    }
    else
    {
        BigInt rateDiff = maxRate > targetRate ? BigInt( maxRate - targetRate ) : BigInt( 0 );
        BigInt utilizationDiff = utilization - targetUtilization;
        yearlyRate = ( ceil_div( rateDiff * utilizationDiff, upperDenominator ) + targetRate ) * rate_power( ) / bps_power( );
    }

    return yearlyRate / hours_in_year( );
}

} // namespace

BigInt hourly_borrow_rate( const CustodyAccount & custody, bool useBorrowCurve )
{
    BigInt owned = theoretically_owned( custody );
    BigInt locked = total_locked( custody );

    switch ( borrow_rate_mechanism( custody ) )
    {
        case BorrowRateMechanism::linear:
            return linear_hourly_rate( custody, owned, locked, useBorrowCurve );
        case BorrowRateMechanism::jump:
            return jump_hourly_rate( custody, owned, locked );
    }
    throw ConfigurationError( "Unknown borrow rate mechanism" );
}

FundingRates compute_funding_rates( const CustodyAccount & custody )
{
    BigInt hourlyRate = hourly_borrow_rate( custody );

    double hourly = hourlyRate.convert_to< double >( ) / static_cast< double >( rate_power( ) );
    return { .hourly = hourly, .annualized = hourly * static_cast< double >( hours_in_year( ) ) };
}

} // namespace Jupiter
} // namespace Perpfeed
