#include "perpfeed/Anchor/IdlRegistry.hpp"

#include "perpfeed/Util/Logger.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <boost/json.hpp>

#include <fmt/format.h>

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <unordered_set>

namespace json = boost::json;

namespace Perpfeed
{
namespace Anchor
{

namespace
{

constexpr std::pair< std::string_view, Primitive > primitiveNames[ ] =
{
    { "bool", Primitive::Bool },
    { "u8", Primitive::U8 },
    { "i8", Primitive::I8 },
    { "u16", Primitive::U16 },
    { "i16", Primitive::I16 },
    { "u32", Primitive::U32 },
    { "i32", Primitive::I32 },
    { "u64", Primitive::U64 },
    { "i64", Primitive::I64 },
    { "u128", Primitive::U128 },
    { "i128", Primitive::I128 },
    { "f32", Primitive::F32 },
    { "f64", Primitive::F64 },
    { "string", Primitive::String },
    { "bytes", Primitive::Bytes },
    { "pubkey", Primitive::Pubkey }
};

std::string describe( const json::value & value )
{
    return json::serialize( value );
}

std::string_view expect_string( const json::object & object, std::string_view key, std::string_view context )
{
    const auto * value = object.if_contains( key );
    if ( value == nullptr || !value->is_string( ) )
    {
        throw SchemaError( fmt::format( "{}: missing string member '{}'", context, key ) );
    }
    return value->get_string( );
}

class IdlNormalizer
{
public:
    IdlTypePtr normalize_type( const json::value & raw, std::string_view context )
    {
        if ( raw.is_string( ) )
        {
            auto primitive = primitive_from_name( raw.get_string( ) );
            if ( !primitive )
            {
                throw SchemaError( fmt::format( "{}: unknown primitive '{}'", context, std::string_view( raw.get_string( ) ) ) );
            }
            return make_idl_type( *primitive );
        }

        if ( !raw.is_object( ) )
        {
            throw SchemaError( fmt::format( "{}: unsupported type shape {}", context, describe( raw ) ) );
        }

        const auto & object = raw.get_object( );
        if ( const auto * defined = object.if_contains( "defined" ) )
        {
            return make_idl_type( DefinedType{ .name = defined_name( *defined, context ) } );
        }
        if ( const auto * vec = object.if_contains( "vec" ) )
        {
            return make_idl_type( VecType{ .element = normalize_type( *vec, context ) } );
        }
        if ( const auto * option = object.if_contains( "option" ) )
        {
            return make_idl_type( OptionType{ .element = normalize_type( *option, context ) } );
        }
        if ( const auto * array = object.if_contains( "array" ) )
        {
            return normalize_array( *array, context );
        }
        if ( object.contains( "kind" ) )
        {
            return normalize_inline( object, context );
        }

        throw SchemaError( fmt::format( "{}: unsupported type shape {}", context, describe( raw ) ) );
    }

    IdlTypePtr normalize_inline( const json::object & object, std::string_view context )
    {
        auto kind = expect_string( object, "kind", context );
        if ( kind == "struct" )
        {
            StructType structType;
            if ( const auto * fields = object.if_contains( "fields" ) )
            {
                structType.fields = normalize_fields( *fields, context );
            }
            return make_idl_type( std::move( structType ) );
        }
        if ( kind == "enum" )
        {
            const auto * variants = object.if_contains( "variants" );
            if ( variants == nullptr || !variants->is_array( ) )
            {
                throw SchemaError( fmt::format( "{}: enum without variants", context ) );
            }

            EnumType enumType;
            for ( const auto & rawVariant : variants->get_array( ) )
            {
                if ( !rawVariant.is_object( ) )
                {
                    throw SchemaError( fmt::format( "{}: malformed enum variant {}", context, describe( rawVariant ) ) );
                }
                const auto & variantObject = rawVariant.get_object( );

                EnumVariant variant{ .name = to_camel_case( expect_string( variantObject, "name", context ) ), .fields = { } };
                auto variantContext = fmt::format( "{}::{}", context, variant.name );
                if ( const auto * fields = variantObject.if_contains( "fields" ) )
                {
                    if ( fields->is_object( ) && fields->get_object( ).contains( "type" ) )
                    {
                        // Single nested type.
                        variant.fields.push_back( { .name = "0", .type = normalize_type( fields->get_object( ).at( "type" ), variantContext ) } );
                    }
                    else
                    {
                        variant.fields = normalize_fields( *fields, variantContext );
                    }
                }
                enumType.variants.push_back( std::move( variant ) );
            }
            return make_idl_type( std::move( enumType ) );
        }

        throw SchemaError( fmt::format( "{}: unsupported type kind '{}'", context, kind ) );
    }

    // Named ( { name, type } ) or positional ( bare type ) field lists.
    std::vector< IdlField > normalize_fields( const json::value & raw, std::string_view context )
    {
        if ( !raw.is_array( ) )
        {
            throw SchemaError( fmt::format( "{}: field list must be an array", context ) );
        }

        std::vector< IdlField > fields;
        size_t position = 0;
        for ( const auto & rawField : raw.get_array( ) )
        {
            if ( rawField.is_object( ) && rawField.get_object( ).contains( "name" ) )
            {
                const auto & fieldObject = rawField.get_object( );
                auto name = to_camel_case( expect_string( fieldObject, "name", context ) );
                const auto * type = fieldObject.if_contains( "type" );
                if ( type == nullptr )
                {
                    throw SchemaError( fmt::format( "{}.{}: field without type", context, name ) );
                }
                auto fieldContext = fmt::format( "{}.{}", context, name );
                fields.push_back( { .name = std::move( name ), .type = normalize_type( *type, fieldContext ) } );
            }
            else
            {
                auto name = std::to_string( position );
                auto fieldContext = fmt::format( "{}.{}", context, name );
                fields.push_back( { .name = std::move( name ), .type = normalize_type( rawField, fieldContext ) } );
            }
            ++position;
        }
        return fields;
    }

    const std::unordered_set< std::string > & references( ) const & { return _references; }

private:
    std::string defined_name( const json::value & raw, std::string_view context )
    {
        std::string name;
        if ( raw.is_string( ) )
        {
            name = to_camel_case( raw.get_string( ) );
        }
        else if ( raw.is_object( ) )
        {
            const auto & object = raw.get_object( );
            if ( const auto * generics = object.if_contains( "generics" ); generics != nullptr && generics->is_array( ) && !generics->get_array( ).empty( ) )
            {
                throw SchemaError( fmt::format( "{}: generic type references are not supported", context ) );
            }
            name = to_camel_case( expect_string( object, "name", context ) );
        }
        else
        {
            throw SchemaError( fmt::format( "{}: malformed type reference {}", context, describe( raw ) ) );
        }

        _references.insert( name );
        return name;
    }

    IdlTypePtr normalize_array( const json::value & raw, std::string_view context )
    {
        if ( !raw.is_array( ) || raw.get_array( ).size( ) != 2 )
        {
            throw SchemaError( fmt::format( "{}: array type must be [ element, length ]", context ) );
        }

        const auto & pair = raw.get_array( );
        const auto & rawLength = pair[ 1 ];
        if ( !rawLength.is_int64( ) && !rawLength.is_uint64( ) )
        {
            throw SchemaError( fmt::format( "{}: array length must be an integer, got {}", context, describe( rawLength ) ) );
        }
        auto length = rawLength.to_number< int64_t >( );
        if ( length < 0 )
        {
            throw SchemaError( fmt::format( "{}: negative array length {}", context, length ) );
        }

        return make_idl_type( ArrayType{ .element = normalize_type( pair[ 0 ], context ), .length = static_cast< size_t >( length ) } );
    }

    std::unordered_set< std::string > _references;
};

Discriminator parse_discriminator( const json::value & raw, std::string_view context )
{
    if ( !raw.is_array( ) || raw.get_array( ).size( ) != 8 )
    {
        throw SchemaError( fmt::format( "{}: discriminator must hold 8 bytes", context ) );
    }

    Discriminator discriminator;
    for ( size_t i = 0; i < discriminator.size( ); ++i )
    {
        const auto & byte = raw.get_array( )[ i ];
        if ( !byte.is_int64( ) && !byte.is_uint64( ) )
        {
            throw SchemaError( fmt::format( "{}: discriminator byte {} is not an integer", context, i ) );
        }
        auto number = byte.to_number< int64_t >( );
        if ( number < 0 || number > 255 )
        {
            throw SchemaError( fmt::format( "{}: discriminator byte {} out of range", context, i ) );
        }
        discriminator[ i ] = static_cast< std::byte >( number );
    }
    return discriminator;
}

void check_references( const std::unordered_set< std::string > & references, const std::vector< IdlTypeDef > & types )
{
    for ( const auto & reference : references )
    {
        auto found = std::any_of( types.begin( ), types.end( ), [ &reference ]( const auto & typeDef ) { return typeDef.name == reference; } );
        if ( !found )
        {
            throw SchemaError( fmt::format( "Unresolved type reference '{}'", reference ) );
        }
    }
}

} // namespace

std::optional< Primitive > primitive_from_name( std::string_view name )
{
    if ( name == "publicKey" )
    {
        return Primitive::Pubkey;
    }

    for ( const auto & [ primitiveName, primitive ] : primitiveNames )
    {
        if ( primitiveName == name )
        {
            return primitive;
        }
    }
    return std::nullopt;
}

std::string_view primitive_name( Primitive primitive )
{
    for ( const auto & [ primitiveName, candidate ] : primitiveNames )
    {
        if ( candidate == primitive )
        {
            return primitiveName;
        }
    }
    return "unknown";
}

namespace
{

std::string fields_signature( const std::vector< IdlField > & fields )
{
    std::string signature;
    for ( const auto & field : fields )
    {
        if ( !signature.empty( ) )
        {
            signature += ", ";
        }
        signature += fmt::format( "{}: {}", field.name, type_signature( *field.type ) );
    }
    return signature;
}

} // namespace

std::string type_signature( const IdlType & type )
{
    return std::visit( [ ]( const auto & node ) -> std::string
    {
        using NodeType = std::decay_t< decltype( node ) >;
        if constexpr ( std::is_same_v< NodeType, Primitive > )
        {
            return std::string( primitive_name( node ) );
        }
        else if constexpr ( std::is_same_v< NodeType, VecType > )
        {
            return fmt::format( "vec<{}>", type_signature( *node.element ) );
        }
        else if constexpr ( std::is_same_v< NodeType, OptionType > )
        {
            return fmt::format( "option<{}>", type_signature( *node.element ) );
        }
        else if constexpr ( std::is_same_v< NodeType, ArrayType > )
        {
            return fmt::format( "[{}; {}]", type_signature( *node.element ), node.length );
        }
        else if constexpr ( std::is_same_v< NodeType, DefinedType > )
        {
            return node.name;
        }
        else if constexpr ( std::is_same_v< NodeType, StructType > )
        {
            return fmt::format( "struct {{ {} }}", fields_signature( node.fields ) );
        }
        else
        {
            std::string variants;
            for ( const auto & variant : node.variants )
            {
                if ( !variants.empty( ) )
                {
                    variants += ", ";
                }
                variants += variant.fields.empty( ) ? variant.name : fmt::format( "{}( {} )", variant.name, fields_signature( variant.fields ) );
            }
            return fmt::format( "enum {{ {} }}", variants );
        }
    }, type.node );
}

std::string to_camel_case( std::string_view name )
{
    std::vector< std::string > words;
    std::string current;

    auto flush = [ & ]( )
    {
        if ( !current.empty( ) )
        {
            words.push_back( std::move( current ) );
            current.clear( );
        }
    };

    for ( size_t i = 0; i < name.size( ); ++i )
    {
        auto c = static_cast< unsigned char >( name[ i ] );
        if ( c == '_' || c == '-' || c == ' ' )
        {
            flush( );
            continue;
        }

        if ( std::isupper( c ) && !current.empty( ) )
        {
            auto previous = static_cast< unsigned char >( name[ i - 1 ] );
            auto nextIsLower = i + 1 < name.size( ) && std::islower( static_cast< unsigned char >( name[ i + 1 ] ) );
            // Boundary at "aB" and at the last capital of an acronym ( "ABc" ).
            if ( std::islower( previous ) || std::isdigit( previous ) || ( std::isupper( previous ) && nextIsLower ) )
            {
                flush( );
            }
        }
        current.push_back( static_cast< char >( c ) );
    }
    flush( );

    std::string result;
    for ( size_t i = 0; i < words.size( ); ++i )
    {
        auto word = words[ i ];
        std::transform( word.begin( ), word.end( ), word.begin( ), [ ]( unsigned char c ) { return static_cast< char >( std::tolower( c ) ); } );
        if ( i > 0 )
        {
            word[ 0 ] = static_cast< char >( std::toupper( static_cast< unsigned char >( word[ 0 ] ) ) );
        }
        result += word;
    }
    return result;
}

Discriminator account_discriminator( std::string_view declaredAccountName )
{
    auto preimage = fmt::format( "account:{}", declaredAccountName );

    unsigned char digest[ SHA256_DIGEST_LENGTH ];
    SHA256( reinterpret_cast< const unsigned char * >( preimage.data( ) ), preimage.size( ), digest );

    Discriminator discriminator;
    std::transform( digest, digest + discriminator.size( ), discriminator.begin( ), [ ]( unsigned char b ) { return static_cast< std::byte >( b ); } );
    return discriminator;
}

LayoutRegistry::LayoutRegistry( std::string programName, std::vector< IdlTypeDef > types, std::vector< IdlAccountDef > accounts )
    : _programName( std::move( programName ) )
    , _accounts( std::move( accounts ) )
{
    for ( auto & typeDef : types )
    {
        auto name = typeDef.name;
        _types.emplace( std::move( name ), std::move( typeDef ) );
    }
}

const IdlTypeDef & LayoutRegistry::type( std::string_view name ) const &
{
    auto it = _types.find( std::string( name ) );
    if ( it == _types.end( ) )
    {
        throw SchemaError( fmt::format( "Unknown type '{}' in program '{}'", name, _programName ) );
    }
    return it->second;
}

const IdlAccountDef & LayoutRegistry::account( std::string_view name ) const &
{
    auto it = std::find_if( _accounts.begin( ), _accounts.end( ), [ name ]( const auto & account ) { return account.name == name; } );
    if ( it == _accounts.end( ) )
    {
        throw SchemaError( fmt::format( "Unknown account '{}' in program '{}'", name, _programName ) );
    }
    return *it;
}

bool LayoutRegistry::has_type( std::string_view name ) const
{
    return _types.contains( std::string( name ) );
}

bool LayoutRegistry::has_account( std::string_view name ) const
{
    return std::any_of( _accounts.begin( ), _accounts.end( ), [ name ]( const auto & account ) { return account.name == name; } );
}

const IdlAccountDef * LayoutRegistry::find_account( std::span< const std::byte > data ) const &
{
    if ( data.size( ) < sizeof( Discriminator ) )
    {
        return nullptr;
    }

    for ( const auto & account : _accounts )
    {
        if ( std::equal( account.discriminator.begin( ), account.discriminator.end( ), data.begin( ) ) )
        {
            return &account;
        }
    }
    return nullptr;
}

LayoutRegistry build_registry( std::string_view idlJson )
{
    json::value root;
    try
    {
        root = json::parse( idlJson );
    }
    catch ( const std::exception & ex )
    {
        throw SchemaError( fmt::format( "Malformed interface description: {}", ex.what( ) ) );
    }

    if ( !root.is_object( ) )
    {
        throw SchemaError( "Interface description must be a json object" );
    }
    const auto & idl = root.get_object( );

    std::string programName;
    if ( const auto * name = idl.if_contains( "name" ); name != nullptr && name->is_string( ) )
    {
        programName = name->get_string( );
    }
    else if ( const auto * metadata = idl.if_contains( "metadata" ); metadata != nullptr && metadata->is_object( ) )
    {
        if ( const auto * metadataName = metadata->get_object( ).if_contains( "name" ); metadataName != nullptr && metadataName->is_string( ) )
        {
            programName = metadataName->get_string( );
        }
    }

    IdlNormalizer normalizer;
    std::vector< IdlTypeDef > types;

    if ( const auto * rawTypes = idl.if_contains( "types" ) )
    {
        if ( !rawTypes->is_array( ) )
        {
            throw SchemaError( "'types' must be an array" );
        }
        for ( const auto & rawType : rawTypes->get_array( ) )
        {
            if ( !rawType.is_object( ) )
            {
                throw SchemaError( fmt::format( "Malformed type definition {}", describe( rawType ) ) );
            }
            const auto & typeObject = rawType.get_object( );
            auto name = to_camel_case( expect_string( typeObject, "name", "types" ) );
            const auto * type = typeObject.if_contains( "type" );
            if ( type == nullptr || !type->is_object( ) )
            {
                throw SchemaError( fmt::format( "Type '{}' has no definition", name ) );
            }
            if ( std::any_of( types.begin( ), types.end( ), [ &name ]( const auto & typeDef ) { return typeDef.name == name; } ) )
            {
                throw SchemaError( fmt::format( "Duplicate type definition '{}'", name ) );
            }

            auto normalized = normalizer.normalize_inline( type->get_object( ), name );
            types.push_back( { .name = std::move( name ), .type = std::move( normalized ) } );
        }
    }

    std::vector< IdlAccountDef > accounts;
    if ( const auto * rawAccounts = idl.if_contains( "accounts" ) )
    {
        if ( !rawAccounts->is_array( ) )
        {
            throw SchemaError( "'accounts' must be an array" );
        }
        for ( const auto & rawAccount : rawAccounts->get_array( ) )
        {
            if ( !rawAccount.is_object( ) )
            {
                throw SchemaError( fmt::format( "Malformed account definition {}", describe( rawAccount ) ) );
            }
            const auto & accountObject = rawAccount.get_object( );
            std::string declaredName( expect_string( accountObject, "name", "accounts" ) );
            auto name = to_camel_case( declaredName );

            auto hasTypeDef = std::any_of( types.begin( ), types.end( ), [ &name ]( const auto & typeDef ) { return typeDef.name == name; } );
            if ( !hasTypeDef )
            {
                // Synthesize the type definition from the account's own field list.
                const auto * type = accountObject.if_contains( "type" );
                if ( type == nullptr || !type->is_object( ) )
                {
                    throw SchemaError( fmt::format( "Account '{}' has neither a type definition nor a field list", declaredName ) );
                }
                types.push_back( { .name = name, .type = normalizer.normalize_inline( type->get_object( ), name ) } );
            }

            auto discriminator = accountObject.contains( "discriminator" )
                ? parse_discriminator( accountObject.at( "discriminator" ), declaredName )
                : account_discriminator( declaredName );

            accounts.push_back( { .name = std::move( name ), .declaredName = std::move( declaredName ), .discriminator = discriminator } );
        }
    }

    check_references( normalizer.references( ), types );

    PERPFEED_LOG_DEBUG_GLOBAL( ) << fmt::format( "[Registry] program: {}, types: {}, accounts: {}", programName, types.size( ), accounts.size( ) );

    return LayoutRegistry( std::move( programName ), std::move( types ), std::move( accounts ) );
}

LayoutRegistry load_registry( const std::filesystem::path & idlPath )
{
    std::ifstream file( idlPath );
    if ( !file )
    {
        throw ConfigurationError( fmt::format( "Unable to open interface description '{}'", idlPath.string( ) ) );
    }

    std::stringstream buffer;
    buffer << file.rdbuf( );
    return build_registry( buffer.str( ) );
}

} // namespace Anchor
} // namespace Perpfeed
