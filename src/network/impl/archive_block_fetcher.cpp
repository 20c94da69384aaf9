#include "network/impl/archive_block_fetcher.hpp"

#include <fstream>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/filesystem.hpp>

#include "network/block_material_codec.hpp"
#include "network/fetcher_error.hpp"

namespace blockwatch::network
{
    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = beast::http;
    namespace ssl   = asio::ssl;
    using tcp       = asio::ip::tcp;

    namespace
    {
        constexpr auto kUserAgent = "blockwatcher";

        /// Outcome of one request/response exchange driven by an io_context
        struct ExchangeState
        {
            bool                              completed = false;
            bool                              timed_out = false;
            beast::error_code                 ec;
            FetcherError                      failure = FetcherError::CONNECTION_FAILED;
            beast::flat_buffer                buffer;
            http::response<http::string_body> response;
        };

        /**
         * Chain resolve -> connect -> handshake -> write -> read on the stream.
         * Everything referenced by the handlers lives in the caller's frame,
         * which drains the io_context before returning.
         */
        template <typename Stream, typename Handshake>
        void startExchange( tcp::resolver                         &resolver,
                            Stream                                &stream,
                            const Url                             &url,
                            const http::request<http::empty_body> &request,
                            ExchangeState                         &state,
                            Handshake                              handshake )
        {
            auto fail = [&state]( beast::error_code ec, FetcherError kind )
            {
                state.ec      = ec;
                state.failure = kind;
            };

            resolver.async_resolve(
                url.host,
                url.port,
                [&stream, &request, &state, handshake, fail]( beast::error_code ec, tcp::resolver::results_type results )
                {
                    if ( ec )
                    {
                        return fail( ec, FetcherError::CONNECTION_FAILED );
                    }
                    beast::get_lowest_layer( stream ).async_connect(
                        results,
                        [&stream, &request, &state, handshake, fail]( beast::error_code ec, const tcp::endpoint & )
                        {
                            if ( ec )
                            {
                                return fail( ec, FetcherError::CONNECTION_FAILED );
                            }
                            handshake(
                                [&stream, &request, &state, fail]( beast::error_code ec )
                                {
                                    if ( ec )
                                    {
                                        return fail( ec, FetcherError::CONNECTION_FAILED );
                                    }
                                    http::async_write(
                                        stream,
                                        request,
                                        [&stream, &state, fail]( beast::error_code ec, std::size_t )
                                        {
                                            if ( ec )
                                            {
                                                return fail( ec, FetcherError::CONNECTION_FAILED );
                                            }
                                            http::async_read( stream,
                                                              state.buffer,
                                                              state.response,
                                                              [&state, fail]( beast::error_code ec, std::size_t )
                                                              {
                                                                  if ( ec )
                                                                  {
                                                                      return fail( ec, FetcherError::READ_FAILED );
                                                                  }
                                                                  state.completed = true;
                                                              } );
                                        } );
                                } );
                        } );
                } );
        }

        /// Run the exchange for at most the timeout, then cancel and drain what is left
        void runBounded( asio::io_context          &ioc,
                         tcp::resolver             &resolver,
                         beast::tcp_stream         &socket,
                         std::chrono::milliseconds  timeout,
                         ExchangeState             &state )
        {
            ioc.run_for( timeout );
            if ( !ioc.stopped() )
            {
                state.timed_out = true;
                resolver.cancel();
                socket.close();
                ioc.run();
            }
        }
    } // namespace

    ArchiveBlockFetcher::ArchiveBlockFetcher( std::set<primitives::SourceUrl> source_urls,
                                              std::chrono::milliseconds       request_timeout ) :
        source_urls_( std::move( source_urls ) ),
        request_timeout_( request_timeout ),
        logger_( base::createLogger( "ArchiveBlockFetcher" ) )
    {
    }

    outcome::result<primitives::BlockMaterial> ArchiveBlockFetcher::fetchBlock( const std::string &url ) const
    {
        OUTCOME_TRY( document, fetchDocument( url ) );
        auto material = decodeBlockMaterial( document );
        if ( !material )
        {
            logger_->debug( "Malformed block document at {}", url );
        }
        return material;
    }

    outcome::result<std::string> ArchiveBlockFetcher::fetchDocument( const std::string &url ) const
    {
        OUTCOME_TRY( parsed, parseUrl( url ) );
        if ( parsed.scheme == "file" )
        {
            return readFile( parsed );
        }
        if ( parsed.scheme == "http" || parsed.scheme == "https" )
        {
            return httpGet( parsed );
        }
        return FetcherError::UNSUPPORTED_SCHEME;
    }

    outcome::result<std::string> ArchiveBlockFetcher::httpGet( const Url &url ) const
    {
        asio::io_context ioc;
        tcp::resolver    resolver( ioc );
        ExchangeState    state;

        http::request<http::empty_body> request{ http::verb::get, url.target, 11 };
        request.set( http::field::host, url.host );
        request.set( http::field::user_agent, kUserAgent );

        if ( url.scheme == "https" )
        {
            ssl::context ctx( ssl::context::tlsv12_client );
            ctx.set_default_verify_paths();
            ctx.set_verify_mode( ssl::verify_peer );

            beast::ssl_stream<beast::tcp_stream> stream( ioc, ctx );
            // SNI, most archives sit behind a CDN serving many hosts
            if ( !SSL_set_tlsext_host_name( stream.native_handle(), url.host.c_str() ) )
            {
                logger_->debug( "Could not set SNI host name {}", url.host );
                return FetcherError::CONNECTION_FAILED;
            }
            stream.set_verify_callback( ssl::host_name_verification( url.host ) );
            beast::get_lowest_layer( stream ).expires_after( request_timeout_ );

            startExchange( resolver,
                           stream,
                           url,
                           request,
                           state,
                           [&stream]( auto next ) { stream.async_handshake( ssl::stream_base::client, std::move( next ) ); } );
            runBounded( ioc, resolver, beast::get_lowest_layer( stream ), request_timeout_, state );
        }
        else
        {
            beast::tcp_stream stream( ioc );
            stream.expires_after( request_timeout_ );

            startExchange( resolver,
                           stream,
                           url,
                           request,
                           state,
                           []( auto next ) { next( beast::error_code{} ); } );
            runBounded( ioc, resolver, stream, request_timeout_, state );
        }

        if ( !state.completed )
        {
            if ( state.timed_out )
            {
                logger_->debug( "Request to {}{} timed out", url.host, url.target );
                return FetcherError::CONNECTION_FAILED;
            }
            logger_->debug( "Request to {}{} failed: {}", url.host, url.target, state.ec.message() );
            return state.failure;
        }

        auto status = state.response.result();
        if ( status == http::status::not_found )
        {
            return FetcherError::NOT_FOUND;
        }
        if ( status != http::status::ok )
        {
            logger_->debug( "Request to {}{} answered with status {}",
                            url.host,
                            url.target,
                            state.response.result_int() );
            return FetcherError::HTTP_ERROR;
        }
        return std::move( state.response.body() );
    }

    outcome::result<std::string> ArchiveBlockFetcher::readFile( const Url &url ) const
    {
        boost::system::error_code ec;
        if ( !boost::filesystem::is_regular_file( url.target, ec ) )
        {
            return FetcherError::NOT_FOUND;
        }

        std::ifstream file( url.target, std::ios::in | std::ios::binary );
        if ( !file )
        {
            return FetcherError::READ_FAILED;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        if ( file.bad() )
        {
            return FetcherError::READ_FAILED;
        }
        return contents.str();
    }
} // namespace blockwatch::network
