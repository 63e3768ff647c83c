#include "remote/client_credentials_auth.hpp"

#include <nlohmann/json.hpp>

#include "remote/remote_error.hpp"

namespace calcflow::remote
{
    ClientCredentialsAuth::ClientCredentialsAuth( std::shared_ptr<HttpTransport> transport,
                                                  Url                            token_url,
                                                  std::string                    client_id,
                                                  std::string                    client_secret,
                                                  std::chrono::milliseconds      timeout ) :
        m_transport( std::move( transport ) ),
        m_token_url( std::move( token_url ) ),
        m_client_id( std::move( client_id ) ),
        m_client_secret( std::move( client_secret ) ),
        m_timeout( timeout ),
        m_logger( base::createLogger( "ClientCredentialsAuth" ) )
    {
    }

    outcome::result<std::string> ClientCredentialsAuth::Token()
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        if ( m_token.empty() || Clock::now() >= m_expires_at )
        {
            auto refreshed = Refresh();
            if ( !refreshed )
            {
                return outcome::failure( refreshed.error() );
            }
        }
        return m_token;
    }

    void ClientCredentialsAuth::Invalidate( const std::string &token )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        if ( m_token == token )
        {
            m_token.clear();
        }
    }

    size_t ClientCredentialsAuth::RequestCount() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_requests;
    }

    outcome::result<void> ClientCredentialsAuth::Refresh()
    {
        HttpRequest request;
        request.method                  = "POST";
        request.target                  = m_token_url.target( "" );
        request.headers["Content-Type"] = "application/x-www-form-urlencoded";
        request.headers["Accept"]       = "application/json";
        request.body                    = formEncode( { { "grant_type", "client_credentials" },
                                                        { "client_id", m_client_id },
                                                        { "client_secret", m_client_secret } } );

        ++m_requests;
        auto response = m_transport->Send( request, m_timeout );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }
        if ( !response.value().ok() )
        {
            m_logger->error( "Token request to {} rejected with status {}",
                             m_token_url.origin(),
                             response.value().status );
            auto error = errorForStatus( response.value().status );
            // a refused grant is a credentials problem, not an expired token
            if ( error == RemoteError::AUTH_EXPIRED || error == RemoteError::CLIENT_ERROR )
            {
                return RemoteError::AUTH_FAILED;
            }
            return error;
        }

        try
        {
            auto body     = nlohmann::json::parse( response.value().body );
            auto token    = body.at( "access_token" ).get<std::string>();
            auto lifetime = std::chrono::seconds( body.value( "expires_in", int64_t{ 300 } ) );
            if ( token.empty() )
            {
                return RemoteError::MALFORMED_RESPONSE;
            }
            m_token      = std::move( token );
            m_expires_at = Clock::now() + ( lifetime > kExpiryMargin ? lifetime - kExpiryMargin : lifetime / 2 );
        }
        catch ( const nlohmann::json::exception &e )
        {
            m_logger->error( "Malformed token response: {}", e.what() );
            return RemoteError::MALFORMED_RESPONSE;
        }
        m_logger->debug( "Obtained access token for {}", m_client_id );
        return outcome::success();
    }
}
