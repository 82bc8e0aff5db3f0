#pragma once

#include <string_view>

namespace Perpfeed
{
namespace Test
{

// Legacy layout: inline account types, "publicKey" spelling, snake_case names.
inline constexpr std::string_view legacy_test_idl( )
{
    return R"json(
    {
        "version": "0.1.0",
        "name": "test_program",
        "accounts":
        [
            {
                "name": "MarketState",
                "type":
                {
                    "kind": "struct",
                    "fields":
                    [
                        { "name": "authority", "type": "publicKey" },
                        { "name": "base_lot_size", "type": "u64" },
                        { "name": "side", "type": { "defined": "Side" } },
                        { "name": "tags", "type": { "vec": "string" } },
                        { "name": "limit", "type": { "option": "u128" } },
                        { "name": "history", "type": { "array": [ "i16", 3 ] } },
                        { "name": "active", "type": "bool" }
                    ]
                }
            }
        ],
        "types":
        [
            {
                "name": "Side",
                "type":
                {
                    "kind": "enum",
                    "variants":
                    [
                        { "name": "None" },
                        { "name": "Long" },
                        { "name": "Short", "fields": [ { "name": "collateral_bps", "type": "u16" } ] }
                    ]
                }
            }
        ]
    }
    )json";
}

// Current layout: explicit discriminators, account types listed under "types", object references.
inline constexpr std::string_view modern_test_idl( )
{
    return R"json(
    {
        "address": "PERPHjGBqRHArX4DySjwM6UJHiR3sWAatqfdBS2qQJu",
        "metadata": { "name": "modern_program", "version": "0.1.0" },
        "accounts":
        [
            { "name": "Vault", "discriminator": [ 1, 2, 3, 4, 5, 6, 7, 8 ] }
        ],
        "types":
        [
            {
                "name": "Vault",
                "type":
                {
                    "kind": "struct",
                    "fields":
                    [
                        { "name": "owner", "type": "pubkey" },
                        { "name": "limits", "type": { "defined": { "name": "Limits" } } },
                        { "name": "extra", "type": "bytes" }
                    ]
                }
            },
            {
                "name": "Limits",
                "type": { "kind": "struct", "fields": [ "u32", "i64" ] }
            }
        ]
    }
    )json";
}

} // namespace Test
} // namespace Perpfeed
