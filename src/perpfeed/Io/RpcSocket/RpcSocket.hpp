#pragma once

#include "perpfeed/Util/Utils.hpp"
#include "perpfeed/Util/JsonUtils.hpp"
#include "perpfeed/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/high_resolution_timer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <boost/json/object.hpp>
#include <boost/json/value_from.hpp>

#include <fmt/format.h>

#include <simdjson.h>

#include <chrono>
#include <memory>
#include <optional>
#include <unordered_map>

namespace Perpfeed
{
namespace Io
{

template< class RequestType >
static boost::json::object build_rpc_request( uint64_t id, const RequestType & request )
{
    return boost::json::object
    {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", RequestType::method_name( ) },
        { "params", boost::json::value_from( request ) }
    };
}

// JSON-RPC 2.0 request / response matching over a message socket.
template< class NextLayer >
class RpcSocket : public NextLayer
{
public:
    template< class... NextLayerArgs >
    RpcSocket
    (
        boost::asio::strand< boost::asio::io_context::executor_type > * strand,
        std::chrono::milliseconds requestTimeout,
        NextLayerArgs &&... nextLayerArgs
    )
        : NextLayer
        (
            strand,
            std::forward< NextLayerArgs >( nextLayerArgs )...,
            std::bind( &RpcSocket::on_message, this, std::placeholders::_1 ),
            std::bind( &RpcSocket::on_error, this, std::placeholders::_1 )
        )
        , _requestTimeout( requestTimeout )
    { }

    // Throws TransportError on timeout, connection failure or a JSON-RPC error response.
    template< class RequestType, class ResponseType >
    boost::asio::awaitable< ResponseType > do_send_request( RequestType request )
    {
        const auto id = _nextRequestId++;

        // Register before sending, the response may arrive on the next strand turn.
        auto * pendingRequest = _pendingRequests.emplace
        (
            id,
            std::make_unique< PendingRequest< ResponseType > >( NextLayer::get_strand( ), _requestTimeout )
        ).first->second.get( );

        co_await NextLayer::do_send_message( build_rpc_request( id, request ) );

        PERPFEED_LOG_TRACE( NextLayer::get_logger( ) )
            << fmt::format( "[{}] Sent {}, id: {}", name( ), RequestType::method_name( ), id );

        boost::system::error_code errorCode;
        if ( !pendingRequest->completed )
        {
            // Wait for response to succeed or timeout.
            co_await pendingRequest->expiryTimer.async_wait( boost::asio::redirect_error( boost::asio::use_awaitable, errorCode ) );
        }

        // Complete request.
        if ( pendingRequest->completed )
        {
            if ( pendingRequest->error )
            {
                PERPFEED_LOG_ERROR( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Completed {} with error, id: {}", name( ), RequestType::method_name( ), id );
                // Rethrow error.
                auto ex = std::move( pendingRequest->error );
                _pendingRequests.erase( id );
                std::rethrow_exception( ex );
            }

            auto response = std::move( static_cast< PendingRequest< ResponseType > * >( pendingRequest )->response );
            _pendingRequests.erase( id );
            co_return std::move( *response );
        }
        else if ( errorCode && errorCode != boost::asio::error::operation_aborted )
        {
            // Expiry timer error.
            PERPFEED_LOG_ERROR( NextLayer::get_logger( ) )
                << fmt::format( "[{}] Request timer error: {}, id: {}", name( ), errorCode.message( ), id );
            _pendingRequests.erase( id );
            throw TransportError( errorCode.message( ) );
        }
        else
        {
            // Timed-out.
            _pendingRequests.erase( id );
            PERPFEED_LOG_ERROR( NextLayer::get_logger( ) )
                << fmt::format( "[{}] {} timed out after {}ms, id: {}", name( ), RequestType::method_name( ), _requestTimeout.count( ), id );

            throw TransportError( fmt::format( "{} timed out", RequestType::method_name( ) ) );
        }
    }

    size_t pending_request_count( ) const { return _pendingRequests.size( ); }

    constexpr std::string name( ) const & { return "RpcSocket"; }

private:
    void on_message( simdjson::ondemand::document responseDocument )
    {
        try
        {
            simdjson::ondemand::object responseObject( responseDocument );
            auto id = responseObject[ "id" ];
            if ( id.error( ) )
            {
                PERPFEED_LOG_ERROR( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Received message without request id", name( ) );
                return;
            }

            auto findPendingRequest = _pendingRequests.find( id.get_uint64( ) );
            if ( findPendingRequest == _pendingRequests.end( ) )
            {
                PERPFEED_LOG_ERROR( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Invalid response id: {}", name( ), id.get_uint64( ).value( ) );
                return;
            }

            auto & pendingRequest = *findPendingRequest->second;
            auto error = responseObject[ "error" ];
            if ( !error.error( ) )
            {
                auto errorJson = std::string( simdjson::to_json_string( error ).value( ) );
                PERPFEED_LOG_ERROR( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Received error response: {}", name( ), errorJson );
                pendingRequest.error = std::make_exception_ptr( TransportError( fmt::format( "RPC error: {}", errorJson ) ) );
            }
            else
            {
                pendingRequest.set_result( responseObject[ "result" ].value( ) );
                PERPFEED_LOG_TRACE( NextLayer::get_logger( ) )
                    << fmt::format( "[{}] Successfully read RPC response", name( ) );
            }

            // Notify writer of request that response is complete.
            pendingRequest.completed = true;
            pendingRequest.expiryTimer.cancel( );
        }
        catch ( const std::exception & ex )
        {
            PERPFEED_LOG_ERROR( NextLayer::get_logger( ) )
                << fmt::format( "[{}] Error deserializing RPC message: {}", name( ), ex.what( ) );
        }
    }

    // Connection lost, fail every request in flight.
    void on_error( std::exception_ptr error )
    {
        for ( auto & [ id, pendingRequest ] : _pendingRequests )
        {
            if ( pendingRequest->completed )
            {
                continue;
            }
            pendingRequest->error = error;
            pendingRequest->completed = true;
            pendingRequest->expiryTimer.cancel( );
        }
    }

    struct PendingRequestBase
    {
        PendingRequestBase( boost::asio::strand< boost::asio::io_context::executor_type > * strand, std::chrono::milliseconds timeout )
            : expiryTimer( *strand, timeout )
        { }

        virtual ~PendingRequestBase( ) = default;

        virtual void set_result( simdjson::ondemand::value jsonValue ) = 0;

        boost::asio::high_resolution_timer expiryTimer;
        std::exception_ptr error;
        bool completed = false;
    };

    template< class ResponseType >
    struct PendingRequest : PendingRequestBase
    {
        PendingRequest( boost::asio::strand< boost::asio::io_context::executor_type > * strand, std::chrono::milliseconds timeout )
            : PendingRequestBase( strand, timeout )
        { }

        void set_result( simdjson::ondemand::value jsonValue ) override
        {
            try
            {
                response = json_to< ResponseType >( jsonValue );
            }
            catch ( const std::exception & ex )
            {
                this->error = std::make_exception_ptr( TransportError( fmt::format( "Malformed RPC response: {}", ex.what( ) ) ) );
            }
        }

        std::optional< ResponseType > response;
    };

    std::chrono::milliseconds _requestTimeout;

    uint64_t _nextRequestId = 0;
    std::unordered_map< uint64_t, std::unique_ptr< PendingRequestBase > > _pendingRequests;
};

} // namespace Io
} // namespace Perpfeed
