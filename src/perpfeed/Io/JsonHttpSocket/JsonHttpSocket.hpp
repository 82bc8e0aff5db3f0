#pragma once

#include "perpfeed/Io/ProxyTunnel/Transport.hpp"

#include "perpfeed/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <boost/json/value.hpp>

#include <simdjson.h>

#include <deque>
#include <exception>
#include <functional>
#include <memory>

namespace Perpfeed
{
namespace Io
{

// Keep-alive JSON over HTTPS socket, connected on first use through the configured transport.
class JsonHttpSocket
{
public:
    using OnJsonMessageFn = std::function< void( simdjson::ondemand::document ) >;

    // Called when the connection fails or closes, every request in flight is lost.
    using OnErrorFn = std::function< void( std::exception_ptr ) >;

    JsonHttpSocket
    (
        boost::asio::strand< boost::asio::io_context::executor_type > * strand,
        TransportFactory * transportFactory,
        std::string_view host,
        std::string_view service,
        std::string_view target,
        OnJsonMessageFn onJsonMessageFn,
        OnErrorFn onErrorFn
    );

    boost::asio::awaitable< void > do_send_message( boost::json::value jsonRequest );
    boost::asio::awaitable< void > do_close( );

    bool is_connected( ) const { return _tlsStream != nullptr; }

    constexpr std::string name( ) const & { return "JsonHttpSocket"; }

protected:
    PerpfeedLogger & get_logger( ) { return _logger; }
    boost::asio::strand< boost::asio::io_context::executor_type > * get_strand( ) { return _strand; }

private:
    boost::asio::awaitable< void > do_connect( );
    boost::asio::awaitable< void > do_write( );
    boost::asio::awaitable< void > do_read( std::shared_ptr< TlsStream > tlsStream );

    void fail_connection( std::exception_ptr error );
    void drop_failed_writes( );

    std::string _host;
    std::string _service;
    std::string _target;

    OnJsonMessageFn _onJsonMessageFn;
    OnErrorFn _onErrorFn;

    // Asynchronous operations on the socket must be performed within the same strand.
    boost::asio::strand< boost::asio::io_context::executor_type > * _strand;

    TransportFactory * _transportFactory;

    // Single writer coro, it also opens the connection.
    bool _isWriting = false;

    // Shared with the reader coro, which outlives a replaced connection.
    std::shared_ptr< TlsStream > _tlsStream;

    std::deque< boost::beast::http::request< boost::beast::http::string_body > > _writeBuffer;

    // Leading requests of _writeBuffer that belong to a failed connection.
    size_t _failedWriteCount = 0;

    simdjson::ondemand::parser _parser;

    mutable PerpfeedLogger _logger;
};

} // namespace Io
} // namespace Perpfeed
