#pragma once

#include <simdjson.h>

#include <type_traits>

namespace Perpfeed
{

// Customization point for deserializing json values.
// See: boost::json::value_to
template< class T >
struct json_to_tag
{ };

template< class T >
T json_to( simdjson::ondemand::value value )
{
    static_assert( !std::is_reference_v< T > );

    return tag_invoke( json_to_tag< typename std::remove_cv_t< T > >( ), std::move( value ) );
}

} // namespace Perpfeed
