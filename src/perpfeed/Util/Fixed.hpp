#pragma once

#include <boost/multiprecision/cpp_int.hpp>

namespace Perpfeed
{

// Arbitrary precision integer for fixed-point rate arithmetic.
using BigInt = boost::multiprecision::cpp_int;

using Uint128 = boost::multiprecision::uint128_t;
using Int128 = boost::multiprecision::int128_t;

} // namespace Perpfeed
