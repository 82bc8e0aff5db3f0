#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Conversions between binary-encoded and string-encoded data.

namespace Perpfeed
{

std::string enc_base58( std::span< const std::byte > source );

// Returns empty optional on a character outside the bitcoin base58 alphabet.
std::optional< std::vector< std::byte > > dec_base58( std::string_view text );

std::string enc_base64( std::span< const std::byte > source );

// Returns empty optional on malformed input.
std::optional< std::vector< std::byte > > dec_base64( std::string_view text );

inline std::span< const std::byte > as_bytes( std::string_view text )
{
    return std::span< const std::byte >( reinterpret_cast< const std::byte * >( text.data( ) ), text.size( ) );
}

} // namespace Perpfeed
