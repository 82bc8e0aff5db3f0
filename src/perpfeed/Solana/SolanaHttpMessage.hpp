#pragma once

#include "perpfeed/Core/PublicKey.hpp"
#include "perpfeed/Solana/SolanaTypes.hpp"
#include "perpfeed/Util/JsonUtils.hpp"

#include <boost/json/value_from.hpp>

#include <simdjson.h>

#include <optional>
#include <vector>

namespace Perpfeed
{
namespace Solana
{

// getSlot
struct GetSlotRequest
{
    static constexpr std::string_view method_name( ) { return "getSlot"; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetSlotRequest & request );

    Solana::Commitment commitment = Commitment::confirmed;
};

struct GetSlotResponse
{
    uint64_t slot;

    friend GetSlotResponse tag_invoke( json_to_tag< GetSlotResponse >, simdjson::ondemand::value jsonValue );
};

// getAccountInfo
struct GetAccountInfoRequest
{
    static constexpr std::string_view method_name( ) { return "getAccountInfo"; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetAccountInfoRequest & request );

    Core::PublicKey accountPublicKey; // Pubkey of account to query, as base-58 encoded string.
    Solana::Commitment commitment = Commitment::confirmed;
};

struct GetAccountInfoResponse
{
    friend GetAccountInfoResponse tag_invoke( json_to_tag< GetAccountInfoResponse >, simdjson::ondemand::value jsonValue );

    uint64_t contextSlot;
    std::optional< AccountInfo > accountInfo; // Empty when the account does not exist.
};

// getMultipleAccounts
struct GetMultipleAccountsRequest
{
    static constexpr std::string_view method_name( ) { return "getMultipleAccounts"; }

    friend void tag_invoke( boost::json::value_from_tag, boost::json::value & jsonValue, const GetMultipleAccountsRequest & request );

    std::vector< Core::PublicKey > accountPublicKeys;
    Solana::Commitment commitment = Commitment::confirmed;
};

struct GetMultipleAccountsResponse
{
    friend GetMultipleAccountsResponse tag_invoke( json_to_tag< GetMultipleAccountsResponse >, simdjson::ondemand::value jsonValue );

    uint64_t contextSlot;
    std::vector< std::optional< AccountInfo > > accountInfos; // Same order as the requested keys.
};

} // namespace Solana
} // namespace Perpfeed
