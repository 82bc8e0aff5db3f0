#pragma once

#include "perpfeed/Jupiter/JupiterConnectorConfig.hpp"
#include "perpfeed/Jupiter/JupiterMarketIngestor.hpp"
#include "perpfeed/Jupiter/MockMarketFeed.hpp"
#include "perpfeed/Solana/SolanaHttpClient/SolanaHttpClient.hpp"

#include "perpfeed/Util/Logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <memory>

namespace Perpfeed
{
namespace Jupiter
{

class JupiterMarketDataClientImpl
{
public:
    JupiterMarketDataClientImpl( boost::asio::io_context & ioContext, const JupiterConnectorConfig & config );

    template< class CompletionHandlerType >
    void get_markets( FetchMode mode, CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn( _strand, _ingestor.do_fetch_markets( mode ), std::forward< CompletionHandlerType >( completionHandler ) );
    }

    constexpr std::string name( ) const & { return "JupiterMarketDataClient"; }

private:
    boost::asio::strand< boost::asio::io_context::executor_type > _strand;

    Solana::SolanaHttpClient _solanaHttpClient;
    MockMarketFeed _mockMarketFeed;
    JupiterMarketIngestor< Solana::SolanaHttpClient > _ingestor;

    PerpfeedLogger _logger;
};

} // namespace Jupiter
} // namespace Perpfeed
