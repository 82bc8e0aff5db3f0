#include "perpfeed/Pyth/PythTypes.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <boost/endian/conversion.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <cmath>
#include <cstring>

namespace Perpfeed
{
namespace Pyth
{

namespace
{

template< class Block >
Block read_block( std::span< const std::byte > data )
{
    Block block;
    std::memcpy( &block, data.data( ) + Block::offset( ), sizeof( Block ) );
    return block;
}

template< class Component >
std::optional< double > scale_component( Component component, int32_t exponent )
{
    if ( component == 0 )
    {
        return std::nullopt;
    }
    return static_cast< double >( component ) * std::pow( 10.0, exponent );
}

} // namespace

PythPriceAccount parse_price_account( std::span< const std::byte > data )
{
    if ( data.size( ) < PythPriceAccount::min_size( ) )
    {
        throw OracleFormatError( fmt::format( "Pyth price account data is too small: {} bytes, need {}", data.size( ), PythPriceAccount::min_size( ) ) );
    }

    auto header = read_block< PythAccountHeader >( data );
    auto magic = boost::endian::little_to_native( header.magic );
    if ( magic != pyth_magic( ) )
    {
        throw OracleFormatError( fmt::format( "Invalid Pyth account magic: {:x}", magic ) );
    }

    auto accountType = boost::endian::little_to_native( header.accountType );
    if ( accountType != pyth_price_account_type( ) )
    {
        throw OracleFormatError( fmt::format( "Unexpected Pyth account type: {}", accountType ) );
    }

    auto exponent = boost::endian::little_to_native( header.exponent );
    auto aggregate = read_block< PythPriceInfo >( data );
    auto rawPrice = boost::endian::little_to_native( aggregate.price );
    auto rawConfidence = boost::endian::little_to_native( aggregate.confidence );
    auto rawStatus = boost::endian::little_to_native( aggregate.status );

    return PythPriceAccount
    {
        .price = scale_component( rawPrice, exponent ),
        .confidence = scale_component( rawConfidence, exponent ),
        .status = magic_enum::enum_cast< PriceStatus >( rawStatus ).value_or( PriceStatus::Unknown ),
        .publishSlot = boost::endian::little_to_native( aggregate.publishSlot ),
        .exponent = exponent
    };
}

void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const PythPriceAccount & priceAccount )
{
    auto optionalNumber = [ ]( const std::optional< double > & number ) -> boost::json::value
    {
        return number ? boost::json::value( *number ) : boost::json::value( nullptr );
    };

    jsonValue = boost::json::object
    {
        { "price", optionalNumber( priceAccount.price ) },
        { "confidence", optionalNumber( priceAccount.confidence ) },
        { "status", magic_enum::enum_name( priceAccount.status ) },
        { "publishSlot", priceAccount.publishSlot },
        { "exponent", priceAccount.exponent }
    };
}

} // namespace Pyth
} // namespace Perpfeed
