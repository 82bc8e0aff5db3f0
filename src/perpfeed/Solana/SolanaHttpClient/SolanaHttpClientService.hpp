#pragma once

#include "perpfeed/Solana/SolanaHttpClient/SolanaHttpClientImpl.hpp"

#include "perpfeed/Util/Logger.hpp"

#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>

#include <thread>

namespace Perpfeed
{
namespace Solana
{

class SolanaHttpClientService : public boost::asio::execution_context::service
{
public:
    // Constructor creates a thread to run a private io_context.
    SolanaHttpClientService( boost::asio::execution_context & executionContext, const SolanaHttpClientConfig & config )
        : boost::asio::execution_context::service( executionContext )
        , _ioContext( )
        , _work( boost::asio::require( _ioContext.get_executor( ),
                 boost::asio::execution::outstanding_work.tracked ) )
        , _workThread( [ this ]( ){ return this->_ioContext.run( ); } )
        , _impl( _ioContext, config )
    { }

    ~SolanaHttpClientService( )
    {
        // Indicate that we have finished with the private io_context.
        _work = boost::asio::any_io_executor( );

        // Close the connection so the reader coro exits, then stop and join before members are destroyed.
        _impl.shutdown( );
        _ioContext.stop( );
        _workThread.join( );
    }

    SolanaHttpClientImpl & impl( ) { return _impl; }

    static inline boost::asio::execution_context::id id;

private:
    // Destroy all user-defined handler objects owned by the service.
    void shutdown( ) noexcept override
    {
        PERPFEED_LOG_INFO( _logger ) << "Shutting down SolanaHttpClientService";
    }

    // Private io_context used for performing operations on this thread.
    boost::asio::io_context _ioContext;
    // A work-tracking executor giving work for the private io_context to perform.
    boost::asio::any_io_executor _work;
    std::jthread _workThread;

    SolanaHttpClientImpl _impl;

    PerpfeedLogger _logger;
};

} // namespace Solana
} // namespace Perpfeed
