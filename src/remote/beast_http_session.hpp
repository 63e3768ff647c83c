#ifndef CALCFLOW_REMOTE_BEAST_HTTP_SESSION_HPP
#define CALCFLOW_REMOTE_BEAST_HTTP_SESSION_HPP

#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include "base/logger.hpp"
#include "remote/http_transport.hpp"

namespace calcflow::remote
{
    /**
     * @brief HTTP/1.1 client keeping one keep-alive connection to an origin.
     * Requests are serialized, the connection is opened on first use and
     * reopened when the server drops it. A request the server may already
     * have read is only resent when its method is idempotent. Each call runs the session's own
     * io_context until the exchange completes or its deadline expires.
     */
    class BeastHttpSession : public HttpTransport
    {
    public:
        /// TransportFactory producing sessions
        static outcome::result<std::shared_ptr<HttpTransport>> Create( const Url &url );

        explicit BeastHttpSession( Url url );
        ~BeastHttpSession() override;

        outcome::result<HttpResponse> Send( const HttpRequest &request, std::chrono::milliseconds timeout ) override;

        /// number of connections opened so far
        size_t ConnectionCount() const;

    private:
        using TcpStream = boost::beast::tcp_stream;
        using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

        bool                      IsConnected() const;
        boost::system::error_code Connect( std::chrono::milliseconds timeout );
        void                      Close();

        template <typename Stream>
        boost::system::error_code Exchange( Stream                   &stream,
                                            const HttpRequest        &request,
                                            std::chrono::milliseconds timeout,
                                            HttpResponse             &response,
                                            bool                     &keep_alive,
                                            bool                     &written );

        /// starts an async operation and runs the io_context until it completes
        template <typename Initiation>
        boost::system::error_code Await( Initiation &&initiate );

        Url                        m_url;
        mutable std::mutex         m_mutex;
        boost::asio::io_context    m_ioc;
        boost::asio::ssl::context  m_ssl_ctx;
        std::unique_ptr<TcpStream> m_plain;
        std::unique_ptr<TlsStream> m_tls;
        boost::beast::flat_buffer  m_buffer;
        size_t                     m_connections = 0;
        base::Logger               m_logger;
    };
}

#endif
