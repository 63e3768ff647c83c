#ifndef CALCFLOW_REMOTE_FIRECREST_GATEWAY_HPP
#define CALCFLOW_REMOTE_FIRECREST_GATEWAY_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

#include "base/logger.hpp"
#include "primitives/client.hpp"
#include "remote/client_credentials_auth.hpp"
#include "remote/http_transport.hpp"
#include "remote/remote_gateway.hpp"

namespace calcflow::remote
{
    struct GatewayOptions
    {
        std::chrono::milliseconds request_timeout{ 30000 };
        std::chrono::milliseconds status_cache_ttl{ 500 };  ///< age up to which a status snapshot is reused
        size_t                    max_list_calls = 1000;    ///< bound of a recursive listing
    };

    /**
     * @brief Gateway to a FirecREST style HTTP API.
     * Job statuses are fetched in batches: a status request covers every job
     * of the client still being polled, and its answer is shared by the
     * pollers for status_cache_ttl.
     */
    class FirecrestGateway : public RemoteGateway
    {
    public:
        using Clock = std::chrono::steady_clock;

        /// @param base_url parsed url of the client
        FirecrestGateway( primitives::Client                     client,
                          Url                                    base_url,
                          std::shared_ptr<HttpTransport>         api,
                          std::shared_ptr<ClientCredentialsAuth> auth,
                          GatewayOptions                         options );

        outcome::result<void>        MakeDirectory( const std::string &remote_path ) override;
        outcome::result<void>        Upload( std::string_view bytes, const std::string &remote_path ) override;
        outcome::result<std::string> Submit( const std::string &script_path ) override;
        outcome::result<primitives::RemoteStatus>   Poll( const std::string &job_id ) override;
        void                                        Forget( const std::string &job_id ) override;
        outcome::result<std::vector<RemoteEntry>>   List( const std::string              &remote_dir,
                                                          const std::vector<std::string> &globs ) override;
        outcome::result<std::string> Download( const std::string &remote_path ) override;

        /// API requests sent, token requests excluded
        size_t RequestCount() const;

        const primitives::Client &GetClient() const
        {
            return m_client;
        }

    private:
        /// snapshot entry, nullopt for a job the scheduler did not report
        using StatusSnapshot = std::map<std::string, std::optional<primitives::RemoteStatus>>;

        /// sends an authorized request, refreshing the token once on 401
        outcome::result<HttpResponse> Call( HttpRequest request );

        std::string FilesystemTarget( const std::string &operation, const QueryParams &query ) const;
        std::string ComputeTarget( const QueryParams &query ) const;

        outcome::result<void>                     UploadInline( std::string_view bytes, const std::string &remote_path );
        outcome::result<void>                     UploadStream( std::string_view bytes, const std::string &remote_path );
        outcome::result<std::vector<RemoteEntry>> ListDirectory( const std::string &remote_dir );
        outcome::result<StatusSnapshot>           FetchStatuses( const std::vector<std::string> &job_ids );

        /// answers a poll from the snapshot, unwatching finished jobs
        outcome::result<primitives::RemoteStatus> Lookup( const std::string &job_id );

        primitives::Client                     m_client;
        std::shared_ptr<HttpTransport>         m_api;
        std::shared_ptr<ClientCredentialsAuth> m_auth;
        GatewayOptions                         m_options;
        Url                                    m_base;

        std::mutex              m_status_mutex;
        std::condition_variable m_status_cv;
        std::set<std::string>   m_watched;
        StatusSnapshot          m_snapshot;
        Clock::time_point       m_snapshot_time;
        bool                    m_refreshing = false;

        std::atomic<size_t> m_requests{ 0 };
        base::Logger        m_logger;
    };

    /**
     * @brief Maps a scheduler job state (Slurm names) to a remote status
     */
    primitives::RemoteStatus MapJobState( const std::string &state );
}

#endif
