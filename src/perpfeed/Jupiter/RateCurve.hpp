#pragma once

#include "perpfeed/Jupiter/JupiterTypes.hpp"
#include "perpfeed/Util/Fixed.hpp"

namespace Perpfeed
{
namespace Jupiter
{

enum class BorrowRateMechanism : uint8_t
{
    linear = 0,
    jump = 1
};

struct FundingRates
{
    double hourly;
    double annualized;
};

// Integer division rounded toward positive infinity.
BigInt ceil_div( const BigInt & numerator, const BigInt & denominator );

// Outstanding debt in token units, never negative.
BigInt get_debt( const CustodyAccount & custody );
BigInt theoretically_owned( const CustodyAccount & custody );
BigInt total_locked( const CustodyAccount & custody );

BorrowRateMechanism borrow_rate_mechanism( const CustodyAccount & custody );

// Hourly rate in rate_power( ) units.
// Throws ConfigurationError when the jump curve has no room above its target utilization.
BigInt hourly_borrow_rate( const CustodyAccount & custody, bool useBorrowCurve = false );

FundingRates compute_funding_rates( const CustodyAccount & custody );

} // namespace Jupiter
} // namespace Perpfeed
