#pragma once

#include "perpfeed/Io/ProxyTunnel/ProxyConfig.hpp"
#include "perpfeed/Io/ProxyTunnel/TunnelStream.hpp"

#include "perpfeed/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace Perpfeed
{
namespace Io
{

using TlsStream = boost::beast::ssl_stream< TunnelStream >;

struct TransportOptions
{
    // Applies to resolve, connect, CONNECT exchange and TLS handshake.
    std::chrono::milliseconds timeout = std::chrono::seconds( 10 );

    // Verify the server certificate chain and host name.
    bool verifyPeer = true;
};

// Opens TLS sessions to a remote host.
class Transport
{
public:
    virtual ~Transport( ) = default;

    // Completes after the TLS handshake with host:service.
    // Every failure closes the socket and throws TransportError.
    virtual boost::asio::awaitable< std::unique_ptr< TlsStream > > do_connect( std::string host, std::string service ) = 0;

    virtual std::string name( ) const = 0;
};

// Direct tcp connection to the remote host.
class DirectTransport : public Transport
{
public:
    DirectTransport( std::shared_ptr< boost::asio::ssl::context > sslContext, TransportOptions options );

    boost::asio::awaitable< std::unique_ptr< TlsStream > > do_connect( std::string host, std::string service ) override;

    std::string name( ) const override { return "DirectTransport"; }

private:
    std::shared_ptr< boost::asio::ssl::context > _sslContext;
    TransportOptions _options;
};

// Tunnels through a forward proxy with an HTTP CONNECT handshake, then layers TLS over the tunnel.
class ProxyTunnelTransport : public Transport
{
public:
    ProxyTunnelTransport( std::shared_ptr< boost::asio::ssl::context > sslContext, ProxyConfig proxyConfig, TransportOptions options );

    boost::asio::awaitable< std::unique_ptr< TlsStream > > do_connect( std::string host, std::string service ) override;

    // CONNECT handshake only. Bytes received after the proxy response are kept in the returned stream.
    boost::asio::awaitable< TunnelStream > do_open_tunnel( std::string host, std::string service );

    const ProxyConfig & proxy_config( ) const & { return _proxyConfig; }

    std::string name( ) const override { return "ProxyTunnelTransport"; }

private:
    std::shared_ptr< boost::asio::ssl::context > _sslContext;
    ProxyConfig _proxyConfig;
    TransportOptions _options;

    mutable PerpfeedLogger _logger;
};

// Chooses the transport for the currently configured proxy.
// The proxy transport is cached and rebuilt only when the proxy url changes.
class TransportFactory
{
public:
    explicit TransportFactory( ProxyLookupFn proxyLookup, TransportOptions options = { } );

    // Throws ConfigurationError on a malformed proxy url.
    std::shared_ptr< Transport > get_transport( );

    const TransportOptions & options( ) const & { return _options; }

    constexpr std::string name( ) const & { return "TransportFactory"; }

private:
    ProxyLookupFn _proxyLookup;
    TransportOptions _options;

    std::shared_ptr< boost::asio::ssl::context > _sslContext;
    std::shared_ptr< Transport > _directTransport;

    std::optional< std::string > _lastProxyUrl;
    std::shared_ptr< Transport > _lastTransport;

    mutable PerpfeedLogger _logger;
};

} // namespace Io
} // namespace Perpfeed
