#ifndef CALCFLOW_REMOTE_CLIENT_CREDENTIALS_AUTH_HPP
#define CALCFLOW_REMOTE_CLIENT_CREDENTIALS_AUTH_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "base/logger.hpp"
#include "remote/http_transport.hpp"

namespace calcflow::remote
{
    /**
     * @brief OAuth2 client credentials grant: exchanges a client id and secret
     * for a short lived bearer token, cached until shortly before it expires
     */
    class ClientCredentialsAuth
    {
    public:
        using Clock = std::chrono::steady_clock;

        /// tokens are renewed this long before the expiry announced by the server
        static constexpr std::chrono::seconds kExpiryMargin{ 30 };

        ClientCredentialsAuth( std::shared_ptr<HttpTransport> transport,
                               Url                            token_url,
                               std::string                    client_id,
                               std::string                    client_secret,
                               std::chrono::milliseconds      timeout );

        /**
         * @brief Current token, requested from the token endpoint if none is cached
         * @return RemoteError::AUTH_FAILED if the credentials are rejected
         */
        outcome::result<std::string> Token();

        /// forgets the cached token if it is still @param token
        void Invalidate( const std::string &token );

        /// number of token requests sent
        size_t RequestCount() const;

    private:
        outcome::result<void> Refresh();

        std::shared_ptr<HttpTransport> m_transport;
        Url                            m_token_url;
        std::string                    m_client_id;
        std::string                    m_client_secret;
        std::chrono::milliseconds      m_timeout;

        mutable std::mutex m_mutex;
        std::string        m_token;
        Clock::time_point  m_expires_at;
        size_t             m_requests = 0;
        base::Logger       m_logger;
    };
}

#endif
