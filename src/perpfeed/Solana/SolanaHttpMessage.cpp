#include "perpfeed/Solana/SolanaHttpMessage.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/string.hpp>
#include <boost/json/value.hpp>

#include <magic_enum/magic_enum.hpp>

#include <algorithm>

namespace Perpfeed
{
namespace Solana
{

// getSlot
void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetSlotRequest & request )
{
    jsonValue = boost::json::array
    {
        { { "commitment", magic_enum::enum_name( request.commitment ) } }
    };
}

GetSlotResponse tag_invoke( json_to_tag< GetSlotResponse >, simdjson::ondemand::value jsonValue )
{
    return GetSlotResponse
    {
        .slot = jsonValue.get_uint64( ).value( )
    };
}

// getAccountInfo
void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetAccountInfoRequest & request )
{
    jsonValue = boost::json::array
    {
        request.accountPublicKey.enc_base58_text( ), // base-58 encoded account.
        {
            { "encoding", "base64" },
            { "commitment", magic_enum::enum_name( request.commitment ) }
        }
    };
}

GetAccountInfoResponse tag_invoke( json_to_tag< GetAccountInfoResponse >, simdjson::ondemand::value jsonValue )
{
    GetAccountInfoResponse response;
    response.contextSlot = jsonValue[ "context" ][ "slot" ].get_uint64( ).value( );
    response.accountInfo = json_to< std::optional< AccountInfo > >( jsonValue[ "value" ].value( ) );
    return response;
}

// getMultipleAccounts
void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetMultipleAccountsRequest & request )
{
    boost::json::array publicKeyArray( request.accountPublicKeys.size( ) );
    std::transform
    (
        request.accountPublicKeys.begin( ),
        request.accountPublicKeys.end( ),
        publicKeyArray.begin( ),
        [ ] ( const Core::PublicKey & publicKey ) -> boost::json::string
        {
            return { publicKey.enc_base58_text( ) }; // base-58 encoded account.
        }
    );

    jsonValue = boost::json::array
    {
        std::move( publicKeyArray ),
        {
            { "encoding", "base64" },
            { "commitment", magic_enum::enum_name( request.commitment ) }
        }
    };
}

GetMultipleAccountsResponse tag_invoke( json_to_tag< GetMultipleAccountsResponse >, simdjson::ondemand::value jsonValue )
{
    GetMultipleAccountsResponse response;
    response.contextSlot = jsonValue[ "context" ][ "slot" ].get_uint64( ).value( );
    for ( simdjson::ondemand::value account : jsonValue[ "value" ].get_array( ) )
    {
        response.accountInfos.push_back( json_to< std::optional< AccountInfo > >( account ) );
    }
    return response;
}

} // namespace Solana
} // namespace Perpfeed
