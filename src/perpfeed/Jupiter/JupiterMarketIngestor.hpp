#pragma once

#include "perpfeed/Anchor/AccountsCoder.hpp"
#include "perpfeed/Jupiter/FallbackMarketSource.hpp"
#include "perpfeed/Jupiter/JupiterTypes.hpp"
#include "perpfeed/Jupiter/MarketAssembly.hpp"
#include "perpfeed/Jupiter/MarketTypes.hpp"
#include "perpfeed/Solana/SolanaHttpMessage.hpp"
#include "perpfeed/Util/Logger.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <memory>
#include <tuple>

namespace Perpfeed
{
namespace Jupiter
{

struct IngestorConfig
{
    Core::PublicKey poolAddress;
    Solana::Commitment commitment = Solana::Commitment::confirmed;
};

// Drives one ingestion cycle: pool, custodies, oracles and slot, then assembly.
// RpcClientType provides send_request< Request, Response >( request, use_awaitable ).
template< class RpcClientType >
class JupiterMarketIngestor
{
public:
    JupiterMarketIngestor
    (
        RpcClientType & rpcClient,
        std::shared_ptr< const Anchor::AccountsCoder > coder,
        IngestorConfig config,
        FallbackMarketSource & fallbackSource
    )
        : _rpcClient( &rpcClient )
        , _coder( std::move( coder ) )
        , _config( std::move( config ) )
        , _fallbackSource( &fallbackSource )
    { }

    constexpr std::string name( ) const & { return "JupiterMarketIngestor"; }

    // Applies the fallback policy for the given mode.
    // ConfigurationError always propagates, as does any error in FetchMode::live.
    boost::asio::awaitable< MarketSnapshot > do_fetch_markets( FetchMode mode )
    {
        if ( mode == FetchMode::mock )
        {
            co_return mock_snapshot( );
        }

        std::string failure;
        try
        {
            co_return co_await do_fetch_live_markets( );
        }
        catch ( const ConfigurationError & )
        {
            throw;
        }
        catch ( const std::exception & error )
        {
            if ( mode == FetchMode::live )
            {
                throw;
            }
            failure = error.what( );
        }

        PERPFEED_LOG_WARNING( _logger ) << fmt::format( "[{}] Falling back to mock data: {}", name( ), failure );
        co_return mock_snapshot( );
    }

    boost::asio::awaitable< MarketSnapshot > do_fetch_live_markets( )
    {
        using namespace boost::asio::experimental::awaitable_operators;

        PERPFEED_LOG_DEBUG( _logger ) << fmt::format( "[{}] Fetching pool {}", name( ), _config.poolAddress );

        auto poolResponse = co_await _rpcClient->template send_request< Solana::GetAccountInfoRequest, Solana::GetAccountInfoResponse >
        (
            { .accountPublicKey = _config.poolAddress, .commitment = _config.commitment },
            boost::asio::use_awaitable
        );
        auto pool = decode_pool( *_coder, _config.poolAddress, poolResponse.accountInfo );

        auto custodyResponse = co_await _rpcClient->template send_request< Solana::GetMultipleAccountsRequest, Solana::GetMultipleAccountsResponse >
        (
            { .accountPublicKeys = pool.custodies, .commitment = _config.commitment },
            boost::asio::use_awaitable
        );
        auto custodies = decode_custodies( *_coder, pool.custodies, custodyResponse.accountInfos );

        auto oracleAddresses = collect_oracle_addresses( custodies );

        // The oracle batch and the slot read are independent.
        Solana::GetMultipleAccountsResponse oracleResponse{ };
        Solana::GetSlotResponse slotResponse{ };
        if ( oracleAddresses.empty( ) )
        {
            slotResponse = co_await get_slot( );
        }
        else
        {
            std::tie( oracleResponse, slotResponse ) = co_await
            (
                _rpcClient->template send_request< Solana::GetMultipleAccountsRequest, Solana::GetMultipleAccountsResponse >
                (
                    { .accountPublicKeys = oracleAddresses, .commitment = _config.commitment },
                    boost::asio::use_awaitable
                )
                && get_slot( )
            );
        }

        auto oraclePrices = parse_oracle_prices( oracleAddresses, oracleResponse.accountInfos );
        auto markets = assemble_markets( pool, custodies, oraclePrices, slotResponse.slot );

        PERPFEED_LOG_INFO( _logger )
            << fmt::format( "[{}] Assembled {} markets from {} custodies, slot: {}", name( ), markets.size( ), custodies.size( ), slotResponse.slot );

        co_return MarketSnapshot
        {
            .markets = std::move( markets ),
            .lastUpdated = format_iso8601( std::chrono::system_clock::now( ) ),
            .source = MarketSource::live
        };
    }

    const IngestorConfig & config( ) const & { return _config; }

private:
    boost::asio::awaitable< Solana::GetSlotResponse > get_slot( )
    {
        return _rpcClient->template send_request< Solana::GetSlotRequest, Solana::GetSlotResponse >
        (
            { .commitment = _config.commitment },
            boost::asio::use_awaitable
        );
    }

    MarketSnapshot mock_snapshot( ) const
    {
        auto dataset = _fallbackSource->load( venue_id( ) );
        return
        {
            .markets = std::move( dataset.markets ),
            .lastUpdated = std::move( dataset.generatedAt ),
            .source = MarketSource::mock
        };
    }

    RpcClientType * _rpcClient;
    std::shared_ptr< const Anchor::AccountsCoder > _coder;
    IngestorConfig _config;
    FallbackMarketSource * _fallbackSource;

    mutable PerpfeedLogger _logger;
};

} // namespace Jupiter
} // namespace Perpfeed
