#ifndef CALCFLOW_REMOTE_GATEWAY_REGISTRY_HPP
#define CALCFLOW_REMOTE_GATEWAY_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>

#include "base/logger.hpp"
#include "primitives/client.hpp"
#include "remote/firecrest_gateway.hpp"
#include "remote/http_transport.hpp"
#include "remote/remote_gateway.hpp"

namespace calcflow::remote
{
    /**
     * @brief Owns one gateway, and so one session, per client. Every calcjob
     * of a client talks to the remote API through the same gateway.
     */
    class GatewayRegistry
    {
    public:
        GatewayRegistry( GatewayOptions options, TransportFactory transport_factory );

        /// registry of gateways over BeastHttpSession
        explicit GatewayRegistry( GatewayOptions options );

        /**
         * @brief Gateway of @param client, created on first use
         * @return RemoteError::INVALID_URL if the client urls cannot be parsed
         */
        outcome::result<std::shared_ptr<RemoteGateway>> Get( const primitives::Client &client );

        /// installs the gateway to use for a client, replacing any other
        void Register( int64_t client_pk, std::shared_ptr<RemoteGateway> gateway );

        size_t Size() const;

    private:
        outcome::result<std::shared_ptr<RemoteGateway>> Create( const primitives::Client &client );

        GatewayOptions                                    m_options;
        TransportFactory                                  m_transport_factory;
        mutable std::mutex                                m_mutex;
        std::map<int64_t, std::shared_ptr<RemoteGateway>> m_gateways;
        base::Logger                                      m_logger;
    };
}

#endif
