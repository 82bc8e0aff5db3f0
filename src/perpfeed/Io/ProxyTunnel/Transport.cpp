#include "perpfeed/Io/ProxyTunnel/Transport.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>

#include <fmt/format.h>

#include <openssl/ssl.h>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace Perpfeed
{
namespace Io
{

namespace
{

[[noreturn]] void fail( beast::tcp_stream & stream, std::string message )
{
    stream.close( );
    throw TransportError( std::move( message ) );
}

asio::awaitable< beast::tcp_stream > do_tcp_connect( std::string host, std::string service, std::chrono::milliseconds timeout )
{
    auto executor = co_await asio::this_coro::executor;

    beast::error_code errorCode;
    asio::ip::tcp::resolver resolver( executor );
    const auto resolveResults = co_await resolver.async_resolve
    (
        host,
        service,
        asio::redirect_error( asio::use_awaitable, errorCode )
    );
    if ( errorCode )
    {
        throw TransportError( fmt::format( "Resolve {}:{} failed: {}", host, service, errorCode.message( ) ) );
    }

    beast::tcp_stream stream( executor );
    stream.expires_after( timeout );
    co_await stream.async_connect( resolveResults, asio::redirect_error( asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        fail( stream, fmt::format( "Connect {}:{} failed: {}", host, service, errorCode.message( ) ) );
    }

    co_return stream;
}

asio::awaitable< std::unique_ptr< TlsStream > > do_tls_handshake
(
    asio::ssl::context & sslContext,
    TunnelStream tunnel,
    std::string host,
    TransportOptions options
)
{
    auto stream = std::make_unique< TlsStream >( std::move( tunnel ), sslContext );

    // Server name indication, the tunnel endpoint is the target host not the proxy.
    if ( !SSL_set_tlsext_host_name( stream->native_handle( ), host.c_str( ) ) )
    {
        fail( beast::get_lowest_layer( *stream ), fmt::format( "Unable to set TLS server name '{}'", host ) );
    }
    if ( options.verifyPeer )
    {
        stream->set_verify_callback( asio::ssl::host_name_verification( host ) );
    }

    beast::error_code errorCode;
    co_await stream->async_handshake( asio::ssl::stream_base::client, asio::redirect_error( asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        fail( beast::get_lowest_layer( *stream ), fmt::format( "TLS handshake with {} failed: {}", host, errorCode.message( ) ) );
    }

    beast::get_lowest_layer( *stream ).socket( ).set_option( asio::socket_base::keep_alive( true ) );
    beast::get_lowest_layer( *stream ).expires_never( );

    co_return stream;
}

} // namespace

DirectTransport::DirectTransport( std::shared_ptr< asio::ssl::context > sslContext, TransportOptions options )
    : _sslContext( std::move( sslContext ) )
    , _options( options )
{ }

asio::awaitable< std::unique_ptr< TlsStream > > DirectTransport::do_connect( std::string host, std::string service )
{
    auto stream = co_await do_tcp_connect( host, service, _options.timeout );
    co_return co_await do_tls_handshake( *_sslContext, TunnelStream( std::move( stream ) ), std::move( host ), _options );
}

ProxyTunnelTransport::ProxyTunnelTransport
(
    std::shared_ptr< asio::ssl::context > sslContext,
    ProxyConfig proxyConfig,
    TransportOptions options
)
    : _sslContext( std::move( sslContext ) )
    , _proxyConfig( std::move( proxyConfig ) )
    , _options( options )
{ }

asio::awaitable< std::unique_ptr< TlsStream > > ProxyTunnelTransport::do_connect( std::string host, std::string service )
{
    auto tunnel = co_await do_open_tunnel( host, service );
    co_return co_await do_tls_handshake( *_sslContext, std::move( tunnel ), std::move( host ), _options );
}

asio::awaitable< TunnelStream > ProxyTunnelTransport::do_open_tunnel( std::string host, std::string service )
{
    PERPFEED_LOG_DEBUG( _logger )
        << fmt::format( "[{}] Opening tunnel to {}:{} via {}:{}", name( ), host, service, _proxyConfig.host, _proxyConfig.service );

    auto stream = co_await do_tcp_connect( _proxyConfig.host, _proxyConfig.service, _options.timeout );

    beast::error_code errorCode;
    const auto connectRequest = build_connect_request( host, service, _proxyConfig );
    co_await asio::async_write( stream, asio::buffer( connectRequest ), asio::redirect_error( asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        fail( stream, fmt::format( "Proxy CONNECT write failed: {}", errorCode.message( ) ) );
    }

    // Read the response header only, anything after it belongs to the tunnel.
    beast::flat_buffer readBuffer;
    beast::http::response_parser< beast::http::empty_body > parser;
    parser.skip( true );
    co_await beast::http::async_read_header( stream, readBuffer, parser, asio::redirect_error( asio::use_awaitable, errorCode ) );
    if ( errorCode )
    {
        fail( stream, fmt::format( "Proxy CONNECT response read failed: {}", errorCode.message( ) ) );
    }

    const auto status = parser.get( ).result_int( );
    if ( status != 200 )
    {
        PERPFEED_LOG_ERROR( _logger )
            << fmt::format( "[{}] Proxy {}:{} rejected CONNECT {}:{} with status {}", name( ), _proxyConfig.host, _proxyConfig.service, host, service, status );
        fail( stream, fmt::format( "Proxy CONNECT response {}", status ) );
    }

    co_return TunnelStream( std::move( stream ), std::move( readBuffer ) );
}

TransportFactory::TransportFactory( ProxyLookupFn proxyLookup, TransportOptions options )
    : _proxyLookup( std::move( proxyLookup ) )
    , _options( options )
    , _sslContext( std::make_shared< asio::ssl::context >( asio::ssl::context::method::tls_client ) )
{
    if ( _options.verifyPeer )
    {
        _sslContext->set_default_verify_paths( );
        _sslContext->set_verify_mode( asio::ssl::verify_peer );
    }
    else
    {
        _sslContext->set_verify_mode( asio::ssl::verify_none );
    }

    _directTransport = std::make_shared< DirectTransport >( _sslContext, _options );
}

std::shared_ptr< Transport > TransportFactory::get_transport( )
{
    auto proxyUrl = _proxyLookup( );
    if ( !proxyUrl )
    {
        _lastProxyUrl.reset( );
        _lastTransport.reset( );
        return _directTransport;
    }

    if ( _lastTransport && _lastProxyUrl == proxyUrl )
    {
        return _lastTransport;
    }

    auto proxyConfig = ProxyConfig::parse( *proxyUrl );
    PERPFEED_LOG_INFO( _logger )
        << fmt::format( "[{}] Using forward proxy {}:{}", name( ), proxyConfig.host, proxyConfig.service );

    _lastTransport = std::make_shared< ProxyTunnelTransport >( _sslContext, std::move( proxyConfig ), _options );
    _lastProxyUrl = std::move( proxyUrl );
    return _lastTransport;
}

} // namespace Io
} // namespace Perpfeed
