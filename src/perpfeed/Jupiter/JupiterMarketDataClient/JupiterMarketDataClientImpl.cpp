#include "perpfeed/Jupiter/JupiterMarketDataClient/JupiterMarketDataClientImpl.hpp"

#include <fmt/format.h>

namespace asio = boost::asio;

namespace Perpfeed
{
namespace Jupiter
{

namespace
{

Solana::SolanaHttpClientConfig make_solana_config( const JupiterConnectorConfig & config )
{
    return Solana::SolanaHttpClientConfig
    {
        .endpoint = Solana::SolanaEndpointConfig::from_url( config.solanaRpcUrl ),
        .proxyLookup = Io::make_proxy_lookup( config.proxyUrl ),
        .transportOptions = { .timeout = config.requestTimeout, .verifyPeer = config.verifyPeer },
        .requestTimeout = config.requestTimeout
    };
}

} // namespace

JupiterMarketDataClientImpl::JupiterMarketDataClientImpl( asio::io_context & ioContext, const JupiterConnectorConfig & config )
    : _strand( ioContext.get_executor( ) )
    , _solanaHttpClient( ioContext, make_solana_config( config ) )
    , _mockMarketFeed( config.mockFeedPath )
    , _ingestor
    (
        _solanaHttpClient,
        make_jupiter_coder( config.idlPath ),
        { .poolAddress = config.poolAddress, .commitment = config.commitment },
        _mockMarketFeed
    )
{
    PERPFEED_LOG_INFO( _logger )
        << fmt::format( "[{}] Pool: {}, rpc: {}, mock feed: {}", name( ), config.poolAddress, config.solanaRpcUrl, config.mockFeedPath.string( ) );
}

} // namespace Jupiter
} // namespace Perpfeed
