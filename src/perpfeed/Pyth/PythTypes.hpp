#pragma once

#include <boost/json/value_from.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace Perpfeed
{
namespace Pyth
{

static constexpr uint32_t pyth_magic( ) { return 0xa1b2c3d4; }
static constexpr uint32_t pyth_price_account_type( ) { return 3; }

enum class PriceStatus : uint32_t
{
    Unknown = 0,
    Trading = 1,
    Halted = 2,
    Auction = 3,
    Ignored = 4
};

// Leading fields of a price account.
struct PythAccountHeader
{
    static constexpr size_t offset( ) { return 0; }

    uint32_t magic;
    uint32_t version;
    uint32_t accountType;
    uint32_t size;
    uint32_t priceType;
    int32_t exponent;
};
static_assert( sizeof( PythAccountHeader ) == 24, "Invalid PythAccountHeader size" );

// Aggregate price block.
struct PythPriceInfo
{
    static constexpr size_t offset( ) { return 208; }

    int64_t price;
    uint64_t confidence;
    uint32_t status;
    uint32_t corporateAction;
    uint64_t publishSlot;
};
static_assert( sizeof( PythPriceInfo ) == 32, "Invalid PythPriceInfo size" );

struct PythPriceAccount
{
    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const PythPriceAccount & priceAccount );

    static constexpr size_t min_size( ) { return PythPriceInfo::offset( ) + sizeof( PythPriceInfo ); }

    // Empty when the raw component is zero.
    std::optional< double > price;
    std::optional< double > confidence;
    PriceStatus status;
    uint64_t publishSlot;
    int32_t exponent;
};

// Throws OracleFormatError on a short buffer, a bad magic number or a non price account type.
// Status codes outside the known set map to PriceStatus::Unknown.
PythPriceAccount parse_price_account( std::span< const std::byte > data );

} // namespace Pyth
} // namespace Perpfeed
