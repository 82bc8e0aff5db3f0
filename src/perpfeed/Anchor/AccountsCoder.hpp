#pragma once

#include "perpfeed/Anchor/AnchorValue.hpp"
#include "perpfeed/Anchor/IdlRegistry.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Perpfeed
{
namespace Anchor
{

// Width of the variant index that prefixes an encoded enum.
enum class EnumTagWidth : uint8_t
{
    U8 = 1,
    U32 = 4
};

struct CoderOptions
{
    EnumTagWidth enumTagWidth = EnumTagWidth::U32;

    // Guard against self-referential type definitions.
    size_t maxDepth = 64;
};

// Schema driven little-endian codec for program accounts.
class AccountsCoder
{
public:
    AccountsCoder( std::shared_ptr< const LayoutRegistry > registry, CoderOptions options = { } );

    // Verifies the 8-byte discriminator then decodes the account body.
    // Throws SchemaError on an unknown account name and DecodeError on a discriminator mismatch or short read.
    // Bytes past the end of the layout are ignored.
    Value decode( std::string_view accountName, std::span< const std::byte > data ) const;

    // Resolves the account from the discriminator. Returns { account name, value }.
    std::pair< std::string, Value > decode_any( std::span< const std::byte > data ) const;

    // Decodes a named type without a discriminator.
    Value decode_type( std::string_view typeName, std::span< const std::byte > data ) const;

    // Discriminator followed by the canonical encoding. Throws SchemaError when the value does not fit the layout.
    std::vector< std::byte > encode( std::string_view accountName, const Value & value ) const;

    std::vector< std::byte > encode_type( std::string_view typeName, const Value & value ) const;

    // Zero valued instance of a type: zero numbers, empty strings and vectors, absent options, first enum variant.
    Value default_value( std::string_view typeName ) const;

    const LayoutRegistry & registry( ) const & { return *_registry; }
    const CoderOptions & options( ) const & { return _options; }

private:
    std::shared_ptr< const LayoutRegistry > _registry;
    CoderOptions _options;
};

} // namespace Anchor
} // namespace Perpfeed
