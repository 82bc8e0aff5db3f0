#include "perpfeed/Io/JsonHttpSocket/JsonHttpSocket.hpp"

#include "perpfeed/Util/Utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <boost/json/serialize.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace Perpfeed
{
namespace Io
{

JsonHttpSocket::JsonHttpSocket
(
    asio::strand< boost::asio::io_context::executor_type > * strand,
    TransportFactory * transportFactory,
    std::string_view host,
    std::string_view service,
    std::string_view target,
    OnJsonMessageFn onJsonMessageFn,
    OnErrorFn onErrorFn
)
    : _host( host )
    , _service( service )
    , _target( target )
    , _onJsonMessageFn( std::move( onJsonMessageFn ) )
    , _onErrorFn( std::move( onErrorFn ) )
    , _strand( strand )
    , _transportFactory( transportFactory )
{ }

asio::awaitable< void > JsonHttpSocket::do_send_message( boost::json::value jsonRequest )
{
    beast::http::request< beast::http::string_body > httpRequest;
    httpRequest.method( beast::http::verb::post );
    httpRequest.target( _target );
    httpRequest.set( beast::http::field::host, _host );
    httpRequest.set( beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING );
    httpRequest.set( beast::http::field::content_type, "application/json" );
    httpRequest.keep_alive( true );

    httpRequest.body( ) = boost::json::serialize( jsonRequest );
    httpRequest.prepare_payload( ); // Set Content-Length and Transfer-Encoding field values.

    // Queue HTTP request for writer coro.
    _writeBuffer.push_back( std::move( httpRequest ) );

    // If first pending request, start writer coro.
    if ( !_isWriting )
    {
        _isWriting = true;
        asio::co_spawn( *get_strand( ), do_write( ), asio::detached );
    }
    co_return;
}

asio::awaitable< void > JsonHttpSocket::do_close( )
{
    if ( _tlsStream )
    {
        PERPFEED_LOG_DEBUG( get_logger( ) )
            << fmt::format( "[{}][{}:{}{}] Gracefully closing connection", name( ), _host, _service, _target );

        beast::get_lowest_layer( *_tlsStream ).close( );
        _tlsStream.reset( );
    }

    co_return;
}

asio::awaitable< void > JsonHttpSocket::do_connect( )
{
    auto transport = _transportFactory->get_transport( );

    PERPFEED_LOG_INFO( get_logger( ) )
        << fmt::format( "[{}][{}:{}{}] Opening connection with {}", name( ), _host, _service, _target, transport->name( ) );

    _tlsStream = co_await transport->do_connect( _host, _service );

    PERPFEED_LOG_INFO( get_logger( ) )
        << fmt::format( "[{}][{}:{}{}] Successfully opened connection", name( ), _host, _service, _target );

    asio::co_spawn( *get_strand( ), do_read( _tlsStream ), asio::detached );
}

void JsonHttpSocket::fail_connection( std::exception_ptr error )
{
    if ( _tlsStream )
    {
        beast::get_lowest_layer( *_tlsStream ).close( );
        _tlsStream.reset( );
    }

    // The writer coro owns the queue while it runs, it drops the failed requests when it resumes.
    if ( _isWriting )
    {
        _failedWriteCount = _writeBuffer.size( );
    }
    else
    {
        _writeBuffer.clear( );
    }

    _onErrorFn( error );
}

void JsonHttpSocket::drop_failed_writes( )
{
    auto failedWrites = std::min( _failedWriteCount, _writeBuffer.size( ) );
    _writeBuffer.erase( _writeBuffer.begin( ), _writeBuffer.begin( ) + failedWrites );
    _failedWriteCount = 0;
}

asio::awaitable< void > JsonHttpSocket::do_write( )
{
    while ( true )
    {
        drop_failed_writes( );
        if ( _writeBuffer.empty( ) )
        {
            break;
        }

        if ( !_tlsStream )
        {
            std::exception_ptr connectError;
            try
            {
                co_await do_connect( );
            }
            catch ( const std::exception & ex )
            {
                PERPFEED_LOG_ERROR( get_logger( ) )
                    << fmt::format( "[{}][{}:{}{}] Connect error: {}", name( ), _host, _service, _target, ex.what( ) );
                connectError = std::current_exception( );
            }

            if ( connectError )
            {
                fail_connection( connectError );
                continue;
            }
        }

        // Keep the stream alive across the suspension, a failed read may drop the member.
        auto tlsStream = _tlsStream;

        beast::error_code errorCode;
        auto bytesWritten = co_await beast::http::async_write
        (
            *tlsStream,
            _writeBuffer.front( ),
            asio::redirect_error( asio::use_awaitable, errorCode )
        );

        if ( _failedWriteCount > 0 )
        {
            // The connection failed while writing, the request in flight is among the dropped ones.
            PERPFEED_LOG_DEBUG( get_logger( ) )
                << fmt::format( "[{}][{}:{}{}] Dropping {} requests of failed connection", name( ), _host, _service, _target, _failedWriteCount );
            continue;
        }

        if ( errorCode )
        {
            PERPFEED_LOG_ERROR( get_logger( ) )
                << fmt::format
                (
                    "[{}][{}:{}{}] Write error: {}, bytes written: {}",
                    name( ),
                    _host,
                    _service,
                    _target,
                    errorCode.message( ),
                    bytesWritten
                );
            if ( tlsStream == _tlsStream )
            {
                fail_connection( std::make_exception_ptr( TransportError( fmt::format( "Write to {} failed: {}", _host, errorCode.message( ) ) ) ) );
            }
            // Requests queued after the failure reconnect on the next iteration.
            continue;
        }

        PERPFEED_LOG_TRACE( get_logger( ) )
            << fmt::format( "[{}][{}:{}{}] Successfully wrote: {}", name( ), _host, _service, _target, _writeBuffer.front( ).body( ) );
        _writeBuffer.pop_front( );
    }

    _isWriting = false;
}

asio::awaitable< void > JsonHttpSocket::do_read( std::shared_ptr< TlsStream > tlsStream )
{
    beast::flat_buffer readBuffer; // Read buffer must be persisted between calls.

    // Read until the connection is closed or replaced.
    while ( true )
    {
        beast::error_code errorCode;

        // Message object should not have previous contents.
        beast::http::response< beast::http::string_body > httpResponse;
        size_t bytesRead = co_await beast::http::async_read( *tlsStream, readBuffer, httpResponse, asio::redirect_error( asio::use_awaitable, errorCode ) );

        if ( tlsStream != _tlsStream )
        {
            // Connection was closed by client.
            PERPFEED_LOG_DEBUG( get_logger( ) )
                << fmt::format( "[{}][{}:{}{}] Reader stopped for closed connection", name( ), _host, _service, _target );
            co_return;
        }

        if ( errorCode )
        {
            PERPFEED_LOG_ERROR( get_logger( ) )
                << fmt::format
                (
                    "[{}][{}:{}{}] Connection closed with error: {}, bytes read: {}",
                    name( ),
                    _host,
                    _service,
                    _target,
                    errorCode.message( ),
                    bytesRead
                );
            fail_connection( std::make_exception_ptr( TransportError( fmt::format( "Connection to {} closed: {}", _host, errorCode.message( ) ) ) ) );
            co_return;
        }

        if ( httpResponse.result( ) != beast::http::status::ok )
        {
            PERPFEED_LOG_ERROR( get_logger( ) )
                << fmt::format( "[{}][{}:{}{}] Invalid response result code: {}", name( ), _host, _service, _target, httpResponse.result_int( ) );
            fail_connection( std::make_exception_ptr( TransportError( fmt::format( "HTTP status {} from {}", httpResponse.result_int( ), _host ) ) ) );
            co_return;
        }

        // Valid response, pass json body up to layer above.
        try
        {
            simdjson::padded_string paddedBody( httpResponse.body( ) );
            simdjson::ondemand::document doc = _parser.iterate( paddedBody );

            PERPFEED_LOG_TRACE( get_logger( ) ) << "Read: " << httpResponse.body( );

            _onJsonMessageFn( std::move( doc ) );
        }
        catch ( const std::exception & ex )
        {
            PERPFEED_LOG_ERROR( get_logger( ) )
                << fmt::format( "[{}][{}:{}{}] Error handling json response: {}", name( ), _host, _service, _target, ex.what( ) );
        }

        if ( !httpResponse.keep_alive( ) )
        {
            PERPFEED_LOG_INFO( get_logger( ) )
                << fmt::format( "[{}][{}:{}{}] Server closed keep-alive connection", name( ), _host, _service, _target );
            fail_connection( std::make_exception_ptr( TransportError( fmt::format( "Connection to {} closed by server", _host ) ) ) );
            co_return;
        }
    }
}

} // namespace Io
} // namespace Perpfeed
