#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Perpfeed
{
namespace Anchor
{

// Canonical wire primitives.
enum class Primitive : uint8_t
{
    Bool,
    U8,
    I8,
    U16,
    I16,
    U32,
    I32,
    U64,
    I64,
    U128,
    I128,
    F32,
    F64,
    String,
    Bytes,
    Pubkey
};

// Accepts the legacy "publicKey" spelling as an alias of "pubkey".
std::optional< Primitive > primitive_from_name( std::string_view name );
std::string_view primitive_name( Primitive primitive );

struct IdlType;
using IdlTypePtr = std::shared_ptr< const IdlType >;

struct IdlField
{
    std::string name; // Positional fields are named by index: "0", "1", ...
    IdlTypePtr type;
};

struct VecType
{
    IdlTypePtr element;
};

struct OptionType
{
    IdlTypePtr element;
};

struct ArrayType
{
    IdlTypePtr element;
    size_t length;
};

struct DefinedType
{
    std::string name;
};

struct StructType
{
    std::vector< IdlField > fields;
};

struct EnumVariant
{
    std::string name;
    std::vector< IdlField > fields;
};

struct EnumType
{
    std::vector< EnumVariant > variants;
};

// Closed set of schema node shapes.
struct IdlType
{
    using Node = std::variant< Primitive, VecType, OptionType, ArrayType, DefinedType, StructType, EnumType >;

    Node node;
};

template< class NodeType >
IdlTypePtr make_idl_type( NodeType node )
{
    return std::make_shared< const IdlType >( IdlType{ std::move( node ) } );
}

// Rust-like rendering, e.g. "vec<u8>", "[pubkey; 4]", "option<custody>".
std::string type_signature( const IdlType & type );

struct IdlTypeDef
{
    std::string name;
    IdlTypePtr type; // StructType or EnumType.
};

using Discriminator = std::array< std::byte, 8 >;

struct IdlAccountDef
{
    std::string name;         // Canonical name.
    std::string declaredName; // Name as written in the interface description.
    Discriminator discriminator;
};

} // namespace Anchor
} // namespace Perpfeed
