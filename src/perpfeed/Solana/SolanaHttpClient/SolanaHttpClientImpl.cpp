#include "perpfeed/Solana/SolanaHttpClient/SolanaHttpClientImpl.hpp"

#include <boost/asio/use_future.hpp>

namespace asio = boost::asio;

namespace Perpfeed
{
namespace Solana
{

SolanaHttpClientImpl::SolanaHttpClientImpl( asio::io_context & ioContext, const SolanaHttpClientConfig & config )
    : _strand( ioContext.get_executor( ) )
    , _transportFactory( config.proxyLookup, config.transportOptions )
    , _rpcSocket
    (
        &_strand,
        config.requestTimeout,
        &_transportFactory,
        config.endpoint.host,
        config.endpoint.service,
        config.endpoint.target
    )
{
    PERPFEED_LOG_DEBUG( _logger )
        << fmt::format( "[{}] Endpoint: {}:{}{}", name( ), config.endpoint.host, config.endpoint.service, config.endpoint.target );
}

void SolanaHttpClientImpl::shutdown( )
{
    asio::co_spawn( _strand, _rpcSocket.do_close( ), asio::use_future ).get( );
}

} // namespace Solana
} // namespace Perpfeed
