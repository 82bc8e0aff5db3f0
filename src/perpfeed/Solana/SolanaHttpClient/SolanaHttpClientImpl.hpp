#pragma once

#include "perpfeed/Solana/SolanaTypes.hpp"

#include "perpfeed/Io/JsonHttpSocket/JsonHttpSocket.hpp"
#include "perpfeed/Io/ProxyTunnel/Transport.hpp"
#include "perpfeed/Io/RpcSocket/RpcSocket.hpp"
#include "perpfeed/Util/Logger.hpp"
#include "perpfeed/Util/Utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>

namespace Perpfeed
{
namespace Solana
{

struct SolanaHttpClientConfig
{
    SolanaEndpointConfig endpoint;
    Io::ProxyLookupFn proxyLookup;
    Io::TransportOptions transportOptions;
    std::chrono::milliseconds requestTimeout = std::chrono::seconds( 10 );
};

class SolanaHttpClientImpl
{
public:
    SolanaHttpClientImpl( boost::asio::io_context & ioContext, const SolanaHttpClientConfig & config );

    template< class RequestType, class ResponseType, class CompletionHandlerType >
    void send_request( RequestType request, CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn
        (
            _strand,
            _rpcSocket.do_send_request< RequestType, ResponseType >( std::move( request ) ),
            std::forward< CompletionHandlerType >( completionHandler )
        );
    }

    // Blocking call to shutdown HTTP connection.
    void shutdown( );

    constexpr std::string name( ) const & { return "SolanaHttpClient"; }

private:
    // Asynchronous operations on a tcp socket must be performed within the same strand.
    boost::asio::strand< boost::asio::io_context::executor_type > _strand;

    Io::TransportFactory _transportFactory;
    Io::RpcSocket< Io::JsonHttpSocket > _rpcSocket;

    PerpfeedLogger _logger;
};

} // namespace Solana
} // namespace Perpfeed
