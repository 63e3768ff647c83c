#include "remote/gateway_registry.hpp"

#include "remote/beast_http_session.hpp"
#include "remote/client_credentials_auth.hpp"

namespace calcflow::remote
{
    GatewayRegistry::GatewayRegistry( GatewayOptions options, TransportFactory transport_factory ) :
        m_options( options ),
        m_transport_factory( std::move( transport_factory ) ),
        m_logger( base::createLogger( "GatewayRegistry" ) )
    {
    }

    GatewayRegistry::GatewayRegistry( GatewayOptions options ) :
        GatewayRegistry( options, &BeastHttpSession::Create )
    {
    }

    outcome::result<std::shared_ptr<RemoteGateway>> GatewayRegistry::Get( const primitives::Client &client )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        auto                        it = m_gateways.find( client.pk );
        if ( it != m_gateways.end() )
        {
            return it->second;
        }
        auto gateway = Create( client );
        if ( !gateway )
        {
            return outcome::failure( gateway.error() );
        }
        m_gateways.emplace( client.pk, gateway.value() );
        return gateway;
    }

    void GatewayRegistry::Register( int64_t client_pk, std::shared_ptr<RemoteGateway> gateway )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_gateways[client_pk] = std::move( gateway );
    }

    size_t GatewayRegistry::Size() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_gateways.size();
    }

    outcome::result<std::shared_ptr<RemoteGateway>> GatewayRegistry::Create( const primitives::Client &client )
    {
        auto api_url = parseUrl( client.client_url );
        if ( !api_url )
        {
            m_logger->error( "Client {} has an invalid url: {}", client.label, client.client_url );
            return outcome::failure( api_url.error() );
        }
        auto token_url = parseUrl( client.token_uri );
        if ( !token_url )
        {
            m_logger->error( "Client {} has an invalid token uri: {}", client.label, client.token_uri );
            return outcome::failure( token_url.error() );
        }

        auto api = m_transport_factory( api_url.value() );
        if ( !api )
        {
            return outcome::failure( api.error() );
        }
        // tokens come through the api session when both live on the same origin
        std::shared_ptr<HttpTransport> token_transport = api.value();
        if ( token_url.value().origin() != api_url.value().origin() )
        {
            auto separate = m_transport_factory( token_url.value() );
            if ( !separate )
            {
                return outcome::failure( separate.error() );
            }
            token_transport = separate.value();
        }

        auto auth = std::make_shared<ClientCredentialsAuth>( token_transport,
                                                             token_url.value(),
                                                             client.client_id,
                                                             client.client_secret,
                                                             m_options.request_timeout );
        m_logger->info( "Opened session for client {} ({})", client.label, api_url.value().origin() );
        return std::make_shared<FirecrestGateway>( client, api_url.value(), api.value(), auth, m_options );
    }
}
