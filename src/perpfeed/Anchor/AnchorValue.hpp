#pragma once

#include "perpfeed/Core/PublicKey.hpp"
#include "perpfeed/Util/Fixed.hpp"

#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace Perpfeed
{
namespace Anchor
{

struct Value;
struct NamedValue;

using ValueList = std::vector< Value >;
using Bytes = std::vector< std::byte >;

// Ordered field list of a decoded struct.
struct StructValue
{
    std::vector< NamedValue > fields;

    // Throw SchemaError when the field is absent.
    const Value & at( std::string_view name ) const &;
    Value & at( std::string_view name ) &;

    const Value * find( std::string_view name ) const &;

    bool operator==( const StructValue & ) const;
};

struct EnumValue
{
    std::string variant;
    StructValue fields;

    bool operator==( const EnumValue & ) const;
};

// Structurally decoded account data.
// Narrow integers widen to 64 bits, f32 widens to double, an absent option is std::monostate.
struct Value
{
    using Storage = std::variant
    <
        std::monostate,
        bool,
        uint64_t,
        int64_t,
        Uint128,
        Int128,
        double,
        std::string,
        Bytes,
        Core::PublicKey,
        ValueList,
        StructValue,
        EnumValue
    >;

    Storage storage;

    bool is_none( ) const { return std::holds_alternative< std::monostate >( storage ); }

    template< class T >
    bool is( ) const { return std::holds_alternative< T >( storage ); }

    // Throw SchemaError on a type mismatch.
    template< class T >
    const T & as( ) const &;

    bool as_bool( ) const;
    uint64_t as_u64( ) const;
    int64_t as_i64( ) const;
    double as_f64( ) const;

    // Any integer alternative, widened.
    BigInt as_integer( ) const;

    const std::string & as_string( ) const &;
    const Core::PublicKey & as_public_key( ) const &;
    const ValueList & as_list( ) const &;
    const StructValue & as_struct( ) const &;
    StructValue & as_struct( ) &;
    const EnumValue & as_enum( ) const &;

    // Struct field access.
    const Value & operator[ ]( std::string_view field ) const &;
    Value & operator[ ]( std::string_view field ) &;

    bool operator==( const Value & ) const;

    std::string_view type_name( ) const;
};

struct NamedValue
{
    std::string name;
    Value value;

    bool operator==( const NamedValue & ) const = default;
};

template< class T >
Value make_value( T v )
{
    return Value{ Value::Storage( std::move( v ) ) };
}

// Customization point for mapping decoded accounts to typed records.
// See: boost::json::value_to
template< class T >
struct value_to_tag
{ };

template< class T >
T value_to( const Value & value )
{
    static_assert( !std::is_reference_v< T > );

    return tag_invoke( value_to_tag< typename std::remove_cv_t< T > >( ), value );
}

// Json rendering: wide integers as decimal strings, bytes as base64, keys as base58.
void tag_invoke( const boost::json::value_from_tag &, boost::json::value & json, const Value & value );

} // namespace Anchor
} // namespace Perpfeed
