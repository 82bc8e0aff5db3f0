#pragma once

#include "perpfeed/Jupiter/JupiterMarketDataClient/JupiterMarketDataClientImpl.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <memory>

namespace Perpfeed
{
namespace Jupiter
{

template< class Service >
class JupiterMarketDataClientServiceProvider
{
public:
    JupiterMarketDataClientServiceProvider( boost::asio::io_context & ioContext, const JupiterConnectorConfig & config )
        : _service( &boost::asio::make_service< Service >( ioContext, config ) )
    { }

    template< boost::asio::completion_token_for< void( std::exception_ptr, MarketSnapshot ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto get_markets( FetchMode mode, CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, MarketSnapshot ) >
        (
            [ this, mode ]< class Handler >( Handler && self )
            {
                _service->impl( ).get_markets
                (
                    mode,
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, MarketSnapshot snapshot )
                    {
                        ( *self )( ex, std::move( snapshot ) );
                    }
                );
            },
            token
        );
    }

private:
    Service * _service;
};

} // namespace Jupiter
} // namespace Perpfeed
