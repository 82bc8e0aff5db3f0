#include "perpfeed/Anchor/AnchorValue.hpp"

#include "perpfeed/Util/StringEncode.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <boost/json.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace Perpfeed
{
namespace Anchor
{

namespace
{

constexpr std::string_view storageNames[ ] =
{
    "none",
    "bool",
    "u64",
    "i64",
    "u128",
    "i128",
    "f64",
    "string",
    "bytes",
    "pubkey",
    "list",
    "struct",
    "enum"
};
static_assert( std::size( storageNames ) == std::variant_size_v< Value::Storage > );

template< class T >
const T & checked_get( const Value & value, std::string_view expected )
{
    if ( const auto * result = std::get_if< T >( &value.storage ) )
    {
        return *result;
    }
    throw SchemaError( fmt::format( "Expected {} value, got {}", expected, value.type_name( ) ) );
}

} // namespace

const Value & StructValue::at( std::string_view name ) const &
{
    if ( const auto * value = find( name ) )
    {
        return *value;
    }
    throw SchemaError( fmt::format( "Missing field '{}'", name ) );
}

Value & StructValue::at( std::string_view name ) &
{
    auto it = std::find_if( fields.begin( ), fields.end( ), [ name ]( const auto & field ) { return field.name == name; } );
    if ( it == fields.end( ) )
    {
        throw SchemaError( fmt::format( "Missing field '{}'", name ) );
    }
    return it->value;
}

const Value * StructValue::find( std::string_view name ) const &
{
    auto it = std::find_if( fields.begin( ), fields.end( ), [ name ]( const auto & field ) { return field.name == name; } );
    return it == fields.end( ) ? nullptr : &it->value;
}

bool StructValue::operator==( const StructValue & other ) const
{
    return fields == other.fields;
}

bool EnumValue::operator==( const EnumValue & other ) const
{
    return variant == other.variant && fields == other.fields;
}

template< class T >
const T & Value::as( ) const &
{
    return checked_get< T >( *this, "requested" );
}

template const Uint128 & Value::as< Uint128 >( ) const &;
template const Int128 & Value::as< Int128 >( ) const &;
template const Bytes & Value::as< Bytes >( ) const &;

bool Value::as_bool( ) const
{
    return checked_get< bool >( *this, "bool" );
}

uint64_t Value::as_u64( ) const
{
    return checked_get< uint64_t >( *this, "unsigned integer" );
}

int64_t Value::as_i64( ) const
{
    return checked_get< int64_t >( *this, "signed integer" );
}

double Value::as_f64( ) const
{
    return checked_get< double >( *this, "floating point" );
}

BigInt Value::as_integer( ) const
{
    return std::visit( [ this ]( const auto & v ) -> BigInt
    {
        using T = std::decay_t< decltype( v ) >;
        if constexpr ( std::is_same_v< T, uint64_t > || std::is_same_v< T, int64_t > )
        {
            return BigInt( v );
        }
        else if constexpr ( std::is_same_v< T, Uint128 > || std::is_same_v< T, Int128 > )
        {
            return BigInt( v );
        }
        else
        {
            throw SchemaError( fmt::format( "Expected integer value, got {}", type_name( ) ) );
        }
    }, storage );
}

const std::string & Value::as_string( ) const &
{
    return checked_get< std::string >( *this, "string" );
}

const Core::PublicKey & Value::as_public_key( ) const &
{
    return checked_get< Core::PublicKey >( *this, "pubkey" );
}

const ValueList & Value::as_list( ) const &
{
    return checked_get< ValueList >( *this, "list" );
}

const StructValue & Value::as_struct( ) const &
{
    return checked_get< StructValue >( *this, "struct" );
}

StructValue & Value::as_struct( ) &
{
    if ( auto * result = std::get_if< StructValue >( &storage ) )
    {
        return *result;
    }
    throw SchemaError( fmt::format( "Expected struct value, got {}", type_name( ) ) );
}

const EnumValue & Value::as_enum( ) const &
{
    return checked_get< EnumValue >( *this, "enum" );
}

const Value & Value::operator[ ]( std::string_view field ) const &
{
    return as_struct( ).at( field );
}

Value & Value::operator[ ]( std::string_view field ) &
{
    return as_struct( ).at( field );
}

bool Value::operator==( const Value & other ) const
{
    return storage == other.storage;
}

std::string_view Value::type_name( ) const
{
    return storageNames[ storage.index( ) ];
}

void tag_invoke( const boost::json::value_from_tag &, boost::json::value & json, const Value & value )
{
    std::visit( [ &json ]( const auto & v )
    {
        using T = std::decay_t< decltype( v ) >;
        if constexpr ( std::is_same_v< T, std::monostate > )
        {
            json = nullptr;
        }
        else if constexpr ( std::is_same_v< T, bool > || std::is_same_v< T, uint64_t > || std::is_same_v< T, int64_t > || std::is_same_v< T, double > )
        {
            json = v;
        }
        else if constexpr ( std::is_same_v< T, Uint128 > || std::is_same_v< T, Int128 > )
        {
            json = v.str( );
        }
        else if constexpr ( std::is_same_v< T, std::string > )
        {
            json = v;
        }
        else if constexpr ( std::is_same_v< T, Bytes > )
        {
            json = enc_base64( v );
        }
        else if constexpr ( std::is_same_v< T, Core::PublicKey > )
        {
            json = v.enc_base58_text( );
        }
        else if constexpr ( std::is_same_v< T, ValueList > )
        {
            auto & array = json.emplace_array( );
            for ( const auto & element : v )
            {
                array.push_back( boost::json::value_from( element ) );
            }
        }
        else if constexpr ( std::is_same_v< T, StructValue > )
        {
            auto & object = json.emplace_object( );
            for ( const auto & field : v.fields )
            {
                object[ field.name ] = boost::json::value_from( field.value );
            }
        }
        else if constexpr ( std::is_same_v< T, EnumValue > )
        {
            auto & object = json.emplace_object( );
            if ( v.fields.fields.empty( ) )
            {
                object[ v.variant ] = nullptr;
            }
            else
            {
                auto & fields = object[ v.variant ].emplace_object( );
                for ( const auto & field : v.fields.fields )
                {
                    fields[ field.name ] = boost::json::value_from( field.value );
                }
            }
        }
    }, value.storage );
}

} // namespace Anchor
} // namespace Perpfeed
