#pragma once

#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <utility>

namespace Perpfeed
{
namespace Io
{

// Tcp stream that serves already received bytes before reading from the socket.
// Bytes a proxy sends after its CONNECT response belong to the tunneled session.
class TunnelStream
{
public:
    using executor_type = boost::beast::tcp_stream::executor_type;
    using next_layer_type = boost::beast::tcp_stream;
    using lowest_layer_type = boost::beast::tcp_stream::socket_type;

    explicit TunnelStream( boost::beast::tcp_stream stream )
        : _stream( std::move( stream ) )
    { }

    TunnelStream( boost::beast::tcp_stream stream, boost::beast::flat_buffer prefix )
        : _stream( std::move( stream ) )
        , _prefix( std::move( prefix ) )
    { }

    executor_type get_executor( ) noexcept { return _stream.get_executor( ); }

    next_layer_type & next_layer( ) noexcept { return _stream; }
    const next_layer_type & next_layer( ) const noexcept { return _stream; }

    lowest_layer_type & lowest_layer( ) noexcept { return _stream.socket( ); }
    const lowest_layer_type & lowest_layer( ) const noexcept { return _stream.socket( ); }

    size_t pending_prefix_size( ) const { return _prefix.size( ); }

    template< class MutableBufferSequence, class ReadHandler >
    auto async_read_some( const MutableBufferSequence & buffers, ReadHandler && handler )
    {
        return boost::asio::async_initiate< ReadHandler, void( boost::beast::error_code, std::size_t ) >
        (
            [ this ]< class Handler >( Handler && self, const MutableBufferSequence & buffers )
            {
                if ( _prefix.size( ) > 0 )
                {
                    auto bytesCopied = boost::asio::buffer_copy( buffers, _prefix.data( ) );
                    _prefix.consume( bytesCopied );
                    boost::asio::post
                    (
                        _stream.get_executor( ),
                        boost::beast::bind_front_handler( std::forward< Handler >( self ), boost::beast::error_code( ), bytesCopied )
                    );
                    return;
                }
                _stream.async_read_some( buffers, std::forward< Handler >( self ) );
            },
            handler,
            buffers
        );
    }

    template< class ConstBufferSequence, class WriteHandler >
    auto async_write_some( const ConstBufferSequence & buffers, WriteHandler && handler )
    {
        return _stream.async_write_some( buffers, std::forward< WriteHandler >( handler ) );
    }

private:
    boost::beast::tcp_stream _stream;
    boost::beast::flat_buffer _prefix;
};

} // namespace Io
} // namespace Perpfeed
