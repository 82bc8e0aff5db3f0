#include "perpfeed/Anchor/IdlRegistry.hpp"

#include "perpfeed/Util/Utils.hpp"

#include "Anchor/TestIdl.hpp"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <array>
#include <variant>

using namespace Perpfeed;
using namespace Perpfeed::Anchor;

namespace
{

Discriminator make_discriminator( std::array< int, 8 > bytes )
{
    Discriminator discriminator;
    for ( size_t i = 0; i < bytes.size( ); ++i )
    {
        discriminator[ i ] = static_cast< std::byte >( bytes[ i ] );
    }
    return discriminator;
}

std::string with_types( std::string_view types )
{
    return fmt::format( R"json({{ "name": "broken", "types": [ {} ] }})json", types );
}

} // namespace

TEST( IdlRegistryTest, CamelCaseNames )
{
    EXPECT_EQ( to_camel_case( "base_lot_size" ), "baseLotSize" );
    EXPECT_EQ( to_camel_case( "MarketState" ), "marketState" );
    EXPECT_EQ( to_camel_case( "one-percent-depth" ), "onePercentDepth" );
    EXPECT_EQ( to_camel_case( "USDCMint" ), "usdcMint" );
    EXPECT_EQ( to_camel_case( "alreadyCamel" ), "alreadyCamel" );
    EXPECT_EQ( to_camel_case( "None" ), "none" );
}

TEST( IdlRegistryTest, AccountDiscriminator )
{
    EXPECT_EQ( account_discriminator( "Custody" ), make_discriminator( { 1, 184, 48, 81, 93, 131, 63, 145 } ) );
    EXPECT_EQ( account_discriminator( "Pool" ), make_discriminator( { 241, 154, 109, 4, 17, 177, 109, 188 } ) );
}

TEST( IdlRegistryTest, LegacyLayout )
{
    auto registry = build_registry( Perpfeed::Test::legacy_test_idl( ) );

    EXPECT_EQ( registry.program_name( ), "test_program" );
    ASSERT_TRUE( registry.has_account( "marketState" ) );
    EXPECT_FALSE( registry.has_account( "MarketState" ) );

    const auto & account = registry.account( "marketState" );
    EXPECT_EQ( account.declaredName, "MarketState" );
    EXPECT_EQ( account.discriminator, make_discriminator( { 0, 125, 123, 215, 95, 96, 164, 194 } ) );

    ASSERT_TRUE( registry.has_type( "side" ) );
    const auto & side = std::get< EnumType >( registry.type( "side" ).type->node );
    ASSERT_EQ( side.variants.size( ), 3u );
    EXPECT_EQ( side.variants[ 2 ].name, "short" );
    EXPECT_EQ( side.variants[ 2 ].fields[ 0 ].name, "collateralBps" );

    EXPECT_EQ
    (
        type_signature( *registry.type( "marketState" ).type ),
        "struct { authority: pubkey, baseLotSize: u64, side: side, tags: vec<string>, limit: option<u128>, history: [i16; 3], active: bool }"
    );
}

TEST( IdlRegistryTest, PublicKeyAlias )
{
    EXPECT_EQ( primitive_from_name( "publicKey" ), Primitive::Pubkey );
    EXPECT_EQ( primitive_from_name( "pubkey" ), Primitive::Pubkey );
    EXPECT_EQ( primitive_from_name( "u256" ), std::nullopt );
    EXPECT_EQ( primitive_name( Primitive::U128 ), "u128" );
}

TEST( IdlRegistryTest, ModernLayout )
{
    auto registry = build_registry( Perpfeed::Test::modern_test_idl( ) );

    EXPECT_EQ( registry.program_name( ), "modern_program" );
    EXPECT_EQ( registry.account( "vault" ).discriminator, make_discriminator( { 1, 2, 3, 4, 5, 6, 7, 8 } ) );

    // Positional fields are named by index.
    const auto & limits = std::get< StructType >( registry.type( "limits" ).type->node );
    ASSERT_EQ( limits.fields.size( ), 2u );
    EXPECT_EQ( limits.fields[ 0 ].name, "0" );
    EXPECT_EQ( limits.fields[ 1 ].name, "1" );

    EXPECT_EQ( type_signature( *registry.type( "vault" ).type ), "struct { owner: pubkey, limits: limits, extra: bytes }" );
}

TEST( IdlRegistryTest, FindAccountByDiscriminator )
{
    auto registry = build_registry( Perpfeed::Test::modern_test_idl( ) );

    std::vector< std::byte > data{ std::byte{ 1 }, std::byte{ 2 }, std::byte{ 3 }, std::byte{ 4 }, std::byte{ 5 }, std::byte{ 6 }, std::byte{ 7 }, std::byte{ 8 }, std::byte{ 0 } };
    const auto * account = registry.find_account( data );
    ASSERT_NE( account, nullptr );
    EXPECT_EQ( account->name, "vault" );

    data[ 0 ] = std::byte{ 9 };
    EXPECT_EQ( registry.find_account( data ), nullptr );
    EXPECT_EQ( registry.find_account( std::span< const std::byte >( data ).first( 4 ) ), nullptr );
}

TEST( IdlRegistryTest, UnknownNamesThrow )
{
    auto registry = build_registry( Perpfeed::Test::legacy_test_idl( ) );

    EXPECT_THROW( registry.account( "orderBook" ), SchemaError );
    EXPECT_THROW( registry.type( "orderBook" ), SchemaError );
}

TEST( IdlRegistryTest, UnresolvedReferenceThrows )
{
    auto idl = with_types( R"json({ "name": "Holder", "type": { "kind": "struct", "fields": [ { "name": "inner", "type": { "defined": "Missing" } } ] } })json" );
    EXPECT_THROW( build_registry( idl ), SchemaError );
}

TEST( IdlRegistryTest, UnknownShapesThrow )
{
    // Unknown primitive.
    EXPECT_THROW
    (
        build_registry( with_types( R"json({ "name": "A", "type": { "kind": "struct", "fields": [ { "name": "x", "type": "u256" } ] } })json" ) ),
        SchemaError
    );

    // Unknown compound shape.
    EXPECT_THROW
    (
        build_registry( with_types( R"json({ "name": "A", "type": { "kind": "struct", "fields": [ { "name": "x", "type": { "map": [ "u8", "u8" ] } } ] } })json" ) ),
        SchemaError
    );

    // Unknown kind.
    EXPECT_THROW( build_registry( with_types( R"json({ "name": "A", "type": { "kind": "alias", "value": "u8" } })json" ) ), SchemaError );

    // Generic references.
    EXPECT_THROW
    (
        build_registry( with_types( R"json({ "name": "A", "type": { "kind": "struct", "fields": [ { "name": "x", "type": { "defined": { "name": "A", "generics": [ { "kind": "type", "type": "u8" } ] } } } ] } })json" ) ),
        SchemaError
    );

    // Malformed array.
    EXPECT_THROW
    (
        build_registry( with_types( R"json({ "name": "A", "type": { "kind": "struct", "fields": [ { "name": "x", "type": { "array": [ "u8" ] } } ] } })json" ) ),
        SchemaError
    );
}

TEST( IdlRegistryTest, MalformedDocumentThrows )
{
    EXPECT_THROW( build_registry( "{ not json" ), SchemaError );
    EXPECT_THROW( build_registry( "[ 1, 2 ]" ), SchemaError );
    EXPECT_THROW( build_registry( R"json({ "name": "x", "accounts": [ { "name": "Orphan" } ] })json" ), SchemaError );
    EXPECT_THROW
    (
        build_registry( R"json({ "name": "x", "accounts": [ { "name": "Short", "discriminator": [ 1, 2, 3 ] , "type": { "kind": "struct", "fields": [ ] } } ] })json" ),
        SchemaError
    );
}

TEST( IdlRegistryTest, DuplicateTypeThrows )
{
    auto idl = with_types
    (
        R"json({ "name": "Dup", "type": { "kind": "struct", "fields": [ ] } }, { "name": "dup", "type": { "kind": "struct", "fields": [ ] } })json"
    );
    EXPECT_THROW( build_registry( idl ), SchemaError );
}
