#include "perpfeed/Io/JsonHttpSocket/JsonHttpSocket.hpp"
#include "perpfeed/Io/ProxyTunnel/Transport.hpp"

#include "Io/TestTls.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/json/object.hpp>

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <vector>

using namespace Perpfeed;
using namespace Perpfeed::Io;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;

namespace
{

using ServerStream = asio::ssl::stream< tcp::socket >;

struct EchoServerState
{
    std::vector< std::string > firstConnectionRequests;
    std::vector< std::string > secondConnectionRequests;
};

// Answers requests by echoing the body. The first connection answers once with Connection: close.
asio::awaitable< void > run_echo_connection
(
    tcp::acceptor & acceptor,
    asio::ssl::context & sslContext,
    bool closeAfterFirst,
    std::vector< std::string > & requests
)
{
    ServerStream stream( co_await acceptor.async_accept( asio::use_awaitable ), sslContext );
    co_await stream.async_handshake( asio::ssl::stream_base::server, asio::use_awaitable );

    beast::flat_buffer buffer;
    for ( ;; )
    {
        beast::error_code errorCode;
        http::request< http::string_body > request;
        co_await http::async_read( stream, buffer, request, asio::redirect_error( asio::use_awaitable, errorCode ) );
        if ( errorCode )
        {
            co_return;
        }
        requests.push_back( request.body( ) );

        http::response< http::string_body > response( http::status::ok, request.version( ) );
        response.set( http::field::content_type, "application/json" );
        response.keep_alive( !closeAfterFirst );
        response.body( ) = request.body( );
        response.prepare_payload( );
        co_await http::async_write( stream, response, asio::use_awaitable );

        if ( closeAfterFirst )
        {
            // Drain whatever else the client pipelined until it drops the connection.
            std::array< char, 256 > scratch;
            while ( !errorCode )
            {
                co_await stream.async_read_some( asio::buffer( scratch ), asio::redirect_error( asio::use_awaitable, errorCode ) );
            }
            co_return;
        }
    }
}

asio::awaitable< void > run_echo_server( tcp::acceptor & acceptor, asio::ssl::context & sslContext, EchoServerState & state )
{
    co_await run_echo_connection( acceptor, sslContext, true, state.firstConnectionRequests );
    co_await run_echo_connection( acceptor, sslContext, false, state.secondConnectionRequests );
}

} // namespace

TEST( JsonHttpSocketTest, ServerCloseDropsPipelinedRequestsAndReconnects )
{
    asio::io_context ioContext;
    asio::strand< asio::io_context::executor_type > strand( ioContext.get_executor( ) );

    tcp::acceptor acceptor( ioContext, tcp::endpoint( asio::ip::make_address( "127.0.0.1" ), 0 ) );
    auto serverContext = Perpfeed::Test::make_server_ssl_context( );

    EchoServerState server;
    std::exception_ptr serverError;
    asio::co_spawn
    (
        ioContext,
        run_echo_server( acceptor, *serverContext, server ),
        [ &serverError ]( std::exception_ptr exception ) { serverError = exception; }
    );

    TransportFactory transportFactory( [ ]( ) { return std::optional< std::string >( ); }, { .timeout = std::chrono::seconds( 5 ), .verifyPeer = false } );

    std::vector< uint64_t > receivedIds;
    size_t errorCount = 0;
    std::optional< JsonHttpSocket > jsonSocket;
    jsonSocket.emplace
    (
        &strand,
        &transportFactory,
        "127.0.0.1",
        std::to_string( acceptor.local_endpoint( ).port( ) ),
        "/",
        [ & ]( simdjson::ondemand::document document )
        {
            receivedIds.push_back( document[ "id" ].get_uint64( ).value( ) );
            if ( receivedIds.back( ) == 3 )
            {
                asio::co_spawn( strand, jsonSocket->do_close( ), asio::detached );
            }
        },
        [ & ]( std::exception_ptr )
        {
            // Requests sent after the failure open a new connection.
            ++errorCount;
            asio::co_spawn( strand, jsonSocket->do_send_message( boost::json::object{ { "id", 3 } } ), asio::detached );
        }
    );

    asio::co_spawn
    (
        strand,
        [ & ]( ) -> asio::awaitable< void >
        {
            co_await jsonSocket->do_send_message( boost::json::object{ { "id", 1 } } );
            co_await jsonSocket->do_send_message( boost::json::object{ { "id", 2 } } );
        },
        asio::detached
    );

    ioContext.run_for( std::chrono::seconds( 20 ) );

    EXPECT_FALSE( serverError );
    EXPECT_EQ( errorCount, 1u );
    EXPECT_EQ( receivedIds, ( std::vector< uint64_t >{ 1, 3 } ) );
    ASSERT_FALSE( server.firstConnectionRequests.empty( ) );
    EXPECT_EQ( server.firstConnectionRequests.front( ), R"({"id":1})" );
    EXPECT_EQ( server.secondConnectionRequests, ( std::vector< std::string >{ R"({"id":3})" } ) );
    EXPECT_FALSE( jsonSocket->is_connected( ) );
}
