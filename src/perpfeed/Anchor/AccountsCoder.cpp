#include "perpfeed/Anchor/AccountsCoder.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <boost/endian/conversion.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <limits>

namespace Perpfeed
{
namespace Anchor
{

namespace
{

class ByteReader
{
public:
    explicit ByteReader( std::span< const std::byte > data )
        : _data( data )
    { }

    template< class T >
    T read( )
    {
        auto bytes = take( sizeof( T ) );
        T value;
        std::memcpy( &value, bytes.data( ), sizeof( T ) );
        return boost::endian::little_to_native( value );
    }

    std::span< const std::byte > take( size_t size )
    {
        if ( _data.size( ) - _offset < size )
        {
            throw DecodeError( fmt::format( "Short read: need {} bytes at offset {}, buffer holds {}", size, _offset, _data.size( ) ) );
        }
        auto result = _data.subspan( _offset, size );
        _offset += size;
        return result;
    }

    size_t offset( ) const { return _offset; }
    size_t remaining( ) const { return _data.size( ) - _offset; }

private:
    std::span< const std::byte > _data;
    size_t _offset = 0;
};

class ByteWriter
{
public:
    template< class T >
    void write( T value )
    {
        value = boost::endian::native_to_little( value );
        const auto * begin = reinterpret_cast< const std::byte * >( &value );
        _data.insert( _data.end( ), begin, begin + sizeof( T ) );
    }

    void append( std::span< const std::byte > bytes )
    {
        _data.insert( _data.end( ), bytes.begin( ), bytes.end( ) );
    }

    std::vector< std::byte > release( ) { return std::move( _data ); }

private:
    std::vector< std::byte > _data;
};

const Uint128 lowMask = Uint128( std::numeric_limits< uint64_t >::max( ) );

Uint128 read_u128( ByteReader & reader )
{
    auto low = reader.read< uint64_t >( );
    auto high = reader.read< uint64_t >( );
    return ( Uint128( high ) << 64 ) | Uint128( low );
}

// Two's complement reinterpretation of the raw 128 bits.
Int128 to_signed( const Uint128 & raw )
{
    if ( bit_test( raw, 127 ) )
    {
        Uint128 magnitude = ~raw + 1;
        return -Int128( magnitude );
    }
    return Int128( raw );
}

Uint128 to_unsigned( const Int128 & value )
{
    if ( value < 0 )
    {
        Uint128 magnitude = static_cast< Uint128 >( -value );
        return ~magnitude + 1;
    }
    return static_cast< Uint128 >( value );
}

void write_u128( ByteWriter & writer, const Uint128 & value )
{
    writer.write( static_cast< uint64_t >( value & lowMask ) );
    writer.write( static_cast< uint64_t >( value >> 64 ) );
}

template< class T >
T checked_narrow( const Value & value, std::string_view context )
{
    if constexpr ( std::is_unsigned_v< T > )
    {
        auto wide = value.as_u64( );
        if ( wide > std::numeric_limits< T >::max( ) )
        {
            throw SchemaError( fmt::format( "{}: {} does not fit the field width", context, wide ) );
        }
        return static_cast< T >( wide );
    }
    else
    {
        auto wide = value.as_i64( );
        if ( wide < std::numeric_limits< T >::min( ) || wide > std::numeric_limits< T >::max( ) )
        {
            throw SchemaError( fmt::format( "{}: {} does not fit the field width", context, wide ) );
        }
        return static_cast< T >( wide );
    }
}

uint32_t checked_length( size_t size, std::string_view context )
{
    if ( size > std::numeric_limits< uint32_t >::max( ) )
    {
        throw SchemaError( fmt::format( "{}: length {} exceeds the u32 prefix", context, size ) );
    }
    return static_cast< uint32_t >( size );
}

// Recursive descent over one registry.
class Codec
{
public:
    Codec( const LayoutRegistry & registry, const CoderOptions & options )
        : _registry( registry )
        , _options( options )
    { }

    Value decode( const IdlType & type, ByteReader & reader, size_t depth ) const
    {
        check_depth( depth );
        return std::visit( [ & ]( const auto & node ) { return decode_node( node, reader, depth ); }, type.node );
    }

    void encode( const IdlType & type, const Value & value, ByteWriter & writer, size_t depth ) const
    {
        check_depth( depth );
        std::visit( [ & ]( const auto & node ) { encode_node( node, value, writer, depth ); }, type.node );
    }

    Value default_value( const IdlType & type, size_t depth ) const
    {
        check_depth( depth );
        return std::visit( [ & ]( const auto & node ) { return default_node( node, depth ); }, type.node );
    }

private:
    void check_depth( size_t depth ) const
    {
        if ( depth > _options.maxDepth )
        {
            throw SchemaError( fmt::format( "Type nesting exceeds {} levels", _options.maxDepth ) );
        }
    }

    // decode

    Value decode_node( Primitive primitive, ByteReader & reader, size_t ) const
    {
        switch ( primitive )
        {
            case Primitive::Bool:
            {
                auto flag = reader.read< uint8_t >( );
                if ( flag > 1 )
                {
                    throw DecodeError( fmt::format( "Invalid bool byte {} at offset {}", flag, reader.offset( ) - 1 ) );
                }
                return make_value( flag == 1 );
            }
            case Primitive::U8: return make_value( uint64_t( reader.read< uint8_t >( ) ) );
            case Primitive::I8: return make_value( int64_t( reader.read< int8_t >( ) ) );
            case Primitive::U16: return make_value( uint64_t( reader.read< uint16_t >( ) ) );
            case Primitive::I16: return make_value( int64_t( reader.read< int16_t >( ) ) );
            case Primitive::U32: return make_value( uint64_t( reader.read< uint32_t >( ) ) );
            case Primitive::I32: return make_value( int64_t( reader.read< int32_t >( ) ) );
            case Primitive::U64: return make_value( reader.read< uint64_t >( ) );
            case Primitive::I64: return make_value( reader.read< int64_t >( ) );
            case Primitive::U128: return make_value( read_u128( reader ) );
            case Primitive::I128: return make_value( to_signed( read_u128( reader ) ) );
            case Primitive::F32:
            {
                auto bits = reader.read< uint32_t >( );
                float number;
                std::memcpy( &number, &bits, sizeof( number ) );
                return make_value( double( number ) );
            }
            case Primitive::F64:
            {
                auto bits = reader.read< uint64_t >( );
                double number;
                std::memcpy( &number, &bits, sizeof( number ) );
                return make_value( number );
            }
            case Primitive::String:
            {
                auto length = reader.read< uint32_t >( );
                auto bytes = reader.take( length );
                return make_value( std::string( reinterpret_cast< const char * >( bytes.data( ) ), bytes.size( ) ) );
            }
            case Primitive::Bytes:
            {
                auto length = reader.read< uint32_t >( );
                auto bytes = reader.take( length );
                return make_value( Bytes( bytes.begin( ), bytes.end( ) ) );
            }
            case Primitive::Pubkey:
            {
                Core::PublicKey key;
                if ( !key.init_from_bytes( reader.take( Core::PublicKey::size ) ) )
                {
                    throw DecodeError( fmt::format( "Invalid pubkey at offset {}", reader.offset( ) ) );
                }
                return make_value( key );
            }
        }
        throw SchemaError( fmt::format( "Unhandled primitive {}", static_cast< int >( primitive ) ) );
    }

    Value decode_node( const VecType & vec, ByteReader & reader, size_t depth ) const
    {
        auto count = reader.read< uint32_t >( );
        if ( count > reader.remaining( ) )
        {
            throw DecodeError( fmt::format( "Vec length {} at offset {} exceeds {} remaining bytes", count, reader.offset( ) - 4, reader.remaining( ) ) );
        }

        ValueList elements;
        elements.reserve( count );
        for ( uint32_t i = 0; i < count; ++i )
        {
            auto elementOffset = reader.offset( );
            elements.push_back( decode( *vec.element, reader, depth + 1 ) );

            // Zero sized elements would let the count alone drive the loop.
            if ( reader.offset( ) == elementOffset )
            {
                throw DecodeError( fmt::format( "Vec of zero sized elements at offset {}", elementOffset ) );
            }
        }
        return make_value( std::move( elements ) );
    }

    Value decode_node( const OptionType & option, ByteReader & reader, size_t depth ) const
    {
        auto flag = reader.read< uint8_t >( );
        switch ( flag )
        {
            case 0: return Value{ };
            case 1: return decode( *option.element, reader, depth + 1 );
            default:
                throw DecodeError( fmt::format( "Invalid option flag {} at offset {}", flag, reader.offset( ) - 1 ) );
        }
    }

    Value decode_node( const ArrayType & array, ByteReader & reader, size_t depth ) const
    {
        ValueList elements;
        elements.reserve( array.length );
        for ( size_t i = 0; i < array.length; ++i )
        {
            elements.push_back( decode( *array.element, reader, depth + 1 ) );
        }
        return make_value( std::move( elements ) );
    }

    Value decode_node( const DefinedType & defined, ByteReader & reader, size_t depth ) const
    {
        return decode( *_registry.type( defined.name ).type, reader, depth + 1 );
    }

    Value decode_node( const StructType & structType, ByteReader & reader, size_t depth ) const
    {
        return make_value( decode_fields( structType.fields, reader, depth ) );
    }

    Value decode_node( const EnumType & enumType, ByteReader & reader, size_t depth ) const
    {
        uint32_t index = _options.enumTagWidth == EnumTagWidth::U8
            ? reader.read< uint8_t >( )
            : reader.read< uint32_t >( );
        if ( index >= enumType.variants.size( ) )
        {
            throw DecodeError( fmt::format( "Enum variant index {} out of range, {} variants", index, enumType.variants.size( ) ) );
        }

        const auto & variant = enumType.variants[ index ];
        return make_value( EnumValue{ .variant = variant.name, .fields = decode_fields( variant.fields, reader, depth ) } );
    }

    StructValue decode_fields( const std::vector< IdlField > & fields, ByteReader & reader, size_t depth ) const
    {
        StructValue result;
        result.fields.reserve( fields.size( ) );
        for ( const auto & field : fields )
        {
            result.fields.push_back( { .name = field.name, .value = decode( *field.type, reader, depth + 1 ) } );
        }
        return result;
    }

    // encode

    void encode_node( Primitive primitive, const Value & value, ByteWriter & writer, size_t ) const
    {
        auto name = primitive_name( primitive );
        switch ( primitive )
        {
            case Primitive::Bool: writer.write( uint8_t( value.as_bool( ) ? 1 : 0 ) ); return;
            case Primitive::U8: writer.write( checked_narrow< uint8_t >( value, name ) ); return;
            case Primitive::I8: writer.write( checked_narrow< int8_t >( value, name ) ); return;
            case Primitive::U16: writer.write( checked_narrow< uint16_t >( value, name ) ); return;
            case Primitive::I16: writer.write( checked_narrow< int16_t >( value, name ) ); return;
            case Primitive::U32: writer.write( checked_narrow< uint32_t >( value, name ) ); return;
            case Primitive::I32: writer.write( checked_narrow< int32_t >( value, name ) ); return;
            case Primitive::U64: writer.write( value.as_u64( ) ); return;
            case Primitive::I64: writer.write( value.as_i64( ) ); return;
            case Primitive::U128: write_u128( writer, value.as< Uint128 >( ) ); return;
            case Primitive::I128: write_u128( writer, to_unsigned( value.as< Int128 >( ) ) ); return;
            case Primitive::F32:
            {
                auto number = static_cast< float >( value.as_f64( ) );
                uint32_t bits;
                std::memcpy( &bits, &number, sizeof( bits ) );
                writer.write( bits );
                return;
            }
            case Primitive::F64:
            {
                auto number = value.as_f64( );
                uint64_t bits;
                std::memcpy( &bits, &number, sizeof( bits ) );
                writer.write( bits );
                return;
            }
            case Primitive::String:
            {
                const auto & text = value.as_string( );
                writer.write( checked_length( text.size( ), name ) );
                writer.append( std::span< const std::byte >( reinterpret_cast< const std::byte * >( text.data( ) ), text.size( ) ) );
                return;
            }
            case Primitive::Bytes:
            {
                const auto & bytes = value.as< Bytes >( );
                writer.write( checked_length( bytes.size( ), name ) );
                writer.append( bytes );
                return;
            }
            case Primitive::Pubkey:
                writer.append( value.as_public_key( ).data( ) );
                return;
        }
        throw SchemaError( fmt::format( "Unhandled primitive {}", static_cast< int >( primitive ) ) );
    }

    void encode_node( const VecType & vec, const Value & value, ByteWriter & writer, size_t depth ) const
    {
        const auto & elements = value.as_list( );
        writer.write( checked_length( elements.size( ), "vec" ) );
        for ( const auto & element : elements )
        {
            encode( *vec.element, element, writer, depth + 1 );
        }
    }

    void encode_node( const OptionType & option, const Value & value, ByteWriter & writer, size_t depth ) const
    {
        if ( value.is_none( ) )
        {
            writer.write( uint8_t( 0 ) );
            return;
        }
        writer.write( uint8_t( 1 ) );
        encode( *option.element, value, writer, depth + 1 );
    }

    void encode_node( const ArrayType & array, const Value & value, ByteWriter & writer, size_t depth ) const
    {
        const auto & elements = value.as_list( );
        if ( elements.size( ) != array.length )
        {
            throw SchemaError( fmt::format( "Array expects {} elements, got {}", array.length, elements.size( ) ) );
        }
        for ( const auto & element : elements )
        {
            encode( *array.element, element, writer, depth + 1 );
        }
    }

    void encode_node( const DefinedType & defined, const Value & value, ByteWriter & writer, size_t depth ) const
    {
        encode( *_registry.type( defined.name ).type, value, writer, depth + 1 );
    }

    void encode_node( const StructType & structType, const Value & value, ByteWriter & writer, size_t depth ) const
    {
        encode_fields( structType.fields, value.as_struct( ), writer, depth );
    }

    void encode_node( const EnumType & enumType, const Value & value, ByteWriter & writer, size_t depth ) const
    {
        const auto & enumValue = value.as_enum( );
        auto it = std::find_if( enumType.variants.begin( ), enumType.variants.end( ), [ &enumValue ]( const auto & variant ) { return variant.name == enumValue.variant; } );
        if ( it == enumType.variants.end( ) )
        {
            throw SchemaError( fmt::format( "Unknown enum variant '{}'", enumValue.variant ) );
        }

        auto index = static_cast< uint32_t >( std::distance( enumType.variants.begin( ), it ) );
        if ( _options.enumTagWidth == EnumTagWidth::U8 )
        {
            writer.write( static_cast< uint8_t >( index ) );
        }
        else
        {
            writer.write( index );
        }
        encode_fields( it->fields, enumValue.fields, writer, depth );
    }

    void encode_fields( const std::vector< IdlField > & fields, const StructValue & value, ByteWriter & writer, size_t depth ) const
    {
        for ( const auto & field : fields )
        {
            encode( *field.type, value.at( field.name ), writer, depth + 1 );
        }
    }

    // default

    Value default_node( Primitive primitive, size_t ) const
    {
        switch ( primitive )
        {
            case Primitive::Bool: return make_value( false );
            case Primitive::U8:
            case Primitive::U16:
            case Primitive::U32:
            case Primitive::U64: return make_value( uint64_t( 0 ) );
            case Primitive::I8:
            case Primitive::I16:
            case Primitive::I32:
            case Primitive::I64: return make_value( int64_t( 0 ) );
            case Primitive::U128: return make_value( Uint128( 0 ) );
            case Primitive::I128: return make_value( Int128( 0 ) );
            case Primitive::F32:
            case Primitive::F64: return make_value( 0.0 );
            case Primitive::String: return make_value( std::string( ) );
            case Primitive::Bytes: return make_value( Bytes( ) );
            case Primitive::Pubkey: return make_value( Core::PublicKey( ) );
        }
        throw SchemaError( fmt::format( "Unhandled primitive {}", static_cast< int >( primitive ) ) );
    }

    Value default_node( const VecType &, size_t ) const
    {
        return make_value( ValueList( ) );
    }

    Value default_node( const OptionType &, size_t ) const
    {
        return Value{ };
    }

    Value default_node( const ArrayType & array, size_t depth ) const
    {
        ValueList elements;
        for ( size_t i = 0; i < array.length; ++i )
        {
            elements.push_back( default_value( *array.element, depth + 1 ) );
        }
        return make_value( std::move( elements ) );
    }

    Value default_node( const DefinedType & defined, size_t depth ) const
    {
        return default_value( *_registry.type( defined.name ).type, depth + 1 );
    }

    Value default_node( const StructType & structType, size_t depth ) const
    {
        return make_value( default_fields( structType.fields, depth ) );
    }

    Value default_node( const EnumType & enumType, size_t depth ) const
    {
        if ( enumType.variants.empty( ) )
        {
            throw SchemaError( "Enum without variants" );
        }
        const auto & variant = enumType.variants.front( );
        return make_value( EnumValue{ .variant = variant.name, .fields = default_fields( variant.fields, depth ) } );
    }

    StructValue default_fields( const std::vector< IdlField > & fields, size_t depth ) const
    {
        StructValue result;
        for ( const auto & field : fields )
        {
            result.fields.push_back( { .name = field.name, .value = default_value( *field.type, depth + 1 ) } );
        }
        return result;
    }

    const LayoutRegistry & _registry;
    const CoderOptions & _options;
};

} // namespace

AccountsCoder::AccountsCoder( std::shared_ptr< const LayoutRegistry > registry, CoderOptions options )
    : _registry( std::move( registry ) )
    , _options( options )
{ }

Value AccountsCoder::decode( std::string_view accountName, std::span< const std::byte > data ) const
{
    const auto & account = _registry->account( accountName );
    if ( data.size( ) < account.discriminator.size( ) )
    {
        throw DecodeError( fmt::format( "Account '{}' data holds {} bytes, shorter than the discriminator", accountName, data.size( ) ) );
    }
    if ( !std::equal( account.discriminator.begin( ), account.discriminator.end( ), data.begin( ) ) )
    {
        throw DecodeError( fmt::format( "Discriminator mismatch for account '{}'", accountName ) );
    }

    ByteReader reader( data.subspan( account.discriminator.size( ) ) );
    return Codec( *_registry, _options ).decode( *_registry->type( account.name ).type, reader, 0 );
}

std::pair< std::string, Value > AccountsCoder::decode_any( std::span< const std::byte > data ) const
{
    const auto * account = _registry->find_account( data );
    if ( account == nullptr )
    {
        throw DecodeError( fmt::format( "No account of program '{}' matches the discriminator", _registry->program_name( ) ) );
    }
    return { account->name, decode( account->name, data ) };
}

Value AccountsCoder::decode_type( std::string_view typeName, std::span< const std::byte > data ) const
{
    ByteReader reader( data );
    return Codec( *_registry, _options ).decode( *_registry->type( typeName ).type, reader, 0 );
}

std::vector< std::byte > AccountsCoder::encode( std::string_view accountName, const Value & value ) const
{
    const auto & account = _registry->account( accountName );

    ByteWriter writer;
    writer.append( account.discriminator );
    Codec( *_registry, _options ).encode( *_registry->type( account.name ).type, value, writer, 0 );
    return writer.release( );
}

std::vector< std::byte > AccountsCoder::encode_type( std::string_view typeName, const Value & value ) const
{
    ByteWriter writer;
    Codec( *_registry, _options ).encode( *_registry->type( typeName ).type, value, writer, 0 );
    return writer.release( );
}

Value AccountsCoder::default_value( std::string_view typeName ) const
{
    return Codec( *_registry, _options ).default_value( *_registry->type( typeName ).type, 0 );
}

} // namespace Anchor
} // namespace Perpfeed
