#include "remote/beast_http_session.hpp"

#include <limits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "remote/remote_error.hpp"

namespace http = boost::beast::http;
namespace ssl  = boost::asio::ssl;
using tcp      = boost::asio::ip::tcp;

namespace calcflow::remote
{
    namespace
    {
        constexpr const char *kUserAgent = "calcflow/" BOOST_BEAST_VERSION_STRING;

        RemoteError FromTransport( const boost::system::error_code &ec )
        {
            if ( ec == boost::beast::error::timeout )
            {
                return RemoteError::TIMEOUT;
            }
            return RemoteError::CONNECTION_FAILED;
        }

        /// the server closed an idle kept alive connection
        bool IsStaleConnection( const boost::system::error_code &ec )
        {
            return ec == http::error::end_of_stream || ec == boost::asio::error::eof ||
                   ec == boost::asio::error::connection_reset || ec == boost::asio::error::broken_pipe;
        }

        /// sending these twice has the effect of sending them once
        bool IsIdempotent( const std::string &method )
        {
            return method == "GET" || method == "HEAD" || method == "PUT" || method == "DELETE" ||
                   method == "OPTIONS";
        }
    }

    outcome::result<std::shared_ptr<HttpTransport>> BeastHttpSession::Create( const Url &url )
    {
        if ( url.host.empty() || ( url.scheme != "http" && url.scheme != "https" ) )
        {
            return RemoteError::INVALID_URL;
        }
        return std::make_shared<BeastHttpSession>( url );
    }

    BeastHttpSession::BeastHttpSession( Url url ) :
        m_url( std::move( url ) ),
        m_ssl_ctx( ssl::context::tlsv12_client ),
        m_logger( base::createLogger( "HttpSession" ) )
    {
        m_ssl_ctx.set_default_verify_paths();
        m_ssl_ctx.set_verify_mode( ssl::verify_peer );
    }

    BeastHttpSession::~BeastHttpSession()
    {
        Close();
    }

    size_t BeastHttpSession::ConnectionCount() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_connections;
    }

    bool BeastHttpSession::IsConnected() const
    {
        return m_plain != nullptr || m_tls != nullptr;
    }

    template <typename Initiation>
    boost::system::error_code BeastHttpSession::Await( Initiation &&initiate )
    {
        boost::system::error_code result = boost::asio::error::would_block;
        initiate( [&result]( boost::system::error_code ec, auto &&... ) { result = ec; } );
        m_ioc.restart();
        m_ioc.run();
        return result;
    }

    boost::system::error_code BeastHttpSession::Connect( std::chrono::milliseconds timeout )
    {
        boost::system::error_code ec;
        tcp::resolver             resolver( m_ioc );
        auto const                endpoints = resolver.resolve( m_url.host, m_url.port, ec );
        if ( ec )
        {
            return ec;
        }

        if ( m_url.isTls() )
        {
            auto stream = std::make_unique<TlsStream>( m_ioc, m_ssl_ctx );
            // Set SNI Hostname (many hosts need this to handshake successfully)
            if ( !SSL_set_tlsext_host_name( stream->native_handle(), m_url.host.c_str() ) )
            {
                return { static_cast<int>( ::ERR_get_error() ), boost::asio::error::get_ssl_category() };
            }
            stream->set_verify_callback( ssl::host_name_verification( m_url.host ) );

            auto &lowest = boost::beast::get_lowest_layer( *stream );
            lowest.expires_after( timeout );
            ec = Await( [&]( auto handler ) { lowest.async_connect( endpoints, std::move( handler ) ); } );
            if ( ec )
            {
                return ec;
            }
            lowest.expires_after( timeout );
            ec = Await( [&]( auto handler ) { stream->async_handshake( ssl::stream_base::client, std::move( handler ) ); } );
            if ( ec )
            {
                return ec;
            }
            m_tls = std::move( stream );
        }
        else
        {
            auto stream = std::make_unique<TcpStream>( m_ioc );
            stream->expires_after( timeout );
            ec = Await( [&]( auto handler ) { stream->async_connect( endpoints, std::move( handler ) ); } );
            if ( ec )
            {
                return ec;
            }
            m_plain = std::move( stream );
        }
        ++m_connections;
        m_logger->debug( "Connected to {} (connection #{})", m_url.origin(), m_connections );
        return ec;
    }

    void BeastHttpSession::Close()
    {
        boost::system::error_code ec;
        if ( m_tls )
        {
            boost::beast::get_lowest_layer( *m_tls ).socket().shutdown( tcp::socket::shutdown_both, ec );
        }
        if ( m_plain )
        {
            m_plain->socket().shutdown( tcp::socket::shutdown_both, ec );
        }
        m_tls.reset();
        m_plain.reset();
        m_buffer.consume( m_buffer.size() );
    }

    template <typename Stream>
    boost::system::error_code BeastHttpSession::Exchange( Stream                   &stream,
                                                          const HttpRequest        &request,
                                                          std::chrono::milliseconds timeout,
                                                          HttpResponse             &response,
                                                          bool                     &keep_alive,
                                                          bool                     &written )
    {
        http::request<http::string_body> req{ http::string_to_verb( request.method ), request.target, 11 };
        req.set( http::field::host, m_url.host );
        req.set( http::field::user_agent, kUserAgent );
        for ( const auto &[name, value] : request.headers )
        {
            req.set( name, value );
        }
        req.body() = request.body;
        if ( request.chunked )
        {
            req.chunked( true );
        }
        else
        {
            req.prepare_payload();
        }
        req.keep_alive( true );

        auto &lowest = boost::beast::get_lowest_layer( stream );
        lowest.expires_after( timeout );
        auto ec = Await( [&]( auto handler ) { http::async_write( stream, req, std::move( handler ) ); } );
        if ( ec )
        {
            return ec;
        }
        written = true;

        http::response_parser<http::string_body> parser;
        parser.body_limit( std::numeric_limits<std::uint64_t>::max() );
        lowest.expires_after( timeout );
        ec = Await( [&]( auto handler ) { http::async_read( stream, m_buffer, parser, std::move( handler ) ); } );
        if ( ec )
        {
            return ec;
        }
        lowest.expires_never();

        auto      &res          = parser.get();
        const auto content_type = res[http::field::content_type];
        response.status         = res.result_int();
        response.content_type.assign( content_type.data(), content_type.size() );
        response.body = std::move( res.body() );
        keep_alive    = res.keep_alive();
        return ec;
    }

    outcome::result<HttpResponse> BeastHttpSession::Send( const HttpRequest &request, std::chrono::milliseconds timeout )
    {
        std::lock_guard<std::mutex> lock( m_mutex );

        for ( int attempt = 0;; ++attempt )
        {
            const bool reused = IsConnected();
            if ( !reused )
            {
                auto ec = Connect( timeout );
                if ( ec )
                {
                    m_logger->warn( "Cannot connect to {}: {}", m_url.origin(), ec.message() );
                    Close();
                    return FromTransport( ec );
                }
            }

            HttpResponse response;
            bool         keep_alive = false;
            bool         written    = false;
            auto         ec         = m_tls ? Exchange( *m_tls, request, timeout, response, keep_alive, written )
                                            : Exchange( *m_plain, request, timeout, response, keep_alive, written );
            if ( !ec )
            {
                if ( !keep_alive )
                {
                    Close();
                }
                m_logger->trace( "{} {} -> {}", request.method, request.target, response.status );
                return response;
            }

            Close();
            // a written request may have been processed, only idempotent ones are sent again
            if ( reused && attempt == 0 && IsStaleConnection( ec ) && ( !written || IsIdempotent( request.method ) ) )
            {
                m_logger->debug( "Connection to {} was dropped, reconnecting", m_url.origin() );
                continue;
            }
            m_logger->warn( "{} {} failed: {}", request.method, request.target, ec.message() );
            return FromTransport( ec );
        }
    }
}
