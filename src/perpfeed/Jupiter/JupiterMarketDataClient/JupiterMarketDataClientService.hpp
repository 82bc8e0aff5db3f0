#pragma once

#include "perpfeed/Jupiter/JupiterMarketDataClient/JupiterMarketDataClientImpl.hpp"

#include "perpfeed/Util/Logger.hpp"

#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>

#include <thread>

namespace Perpfeed
{
namespace Jupiter
{

class JupiterMarketDataClientService : public boost::asio::execution_context::service
{
public:
    JupiterMarketDataClientService( boost::asio::execution_context & executionContext, const JupiterConnectorConfig & config )
        : boost::asio::execution_context::service( executionContext )
        , _ioContext( )
        , _work( boost::asio::require( _ioContext.get_executor( ),
                 boost::asio::execution::outstanding_work.tracked ) )
        , _workThread( [ this ]( ){ return this->_ioContext.run( ); } )
        , _impl( _ioContext, config )
    { }

    ~JupiterMarketDataClientService( )
    {
        _work = boost::asio::any_io_executor( );
        _ioContext.stop( );
        _workThread.join( );
    }

    JupiterMarketDataClientImpl & impl( ) { return _impl; }

    static inline boost::asio::execution_context::id id;

private:
    void shutdown( ) noexcept override
    {
        PERPFEED_LOG_INFO( _logger ) << "Shutting down JupiterMarketDataClientService";
    }

    boost::asio::io_context _ioContext;
    boost::asio::any_io_executor _work;
    std::jthread _workThread;

    JupiterMarketDataClientImpl _impl;

    PerpfeedLogger _logger;
};

} // namespace Jupiter
} // namespace Perpfeed
