#ifndef CALCFLOW_FAKE_REMOTE_CLUSTER_HPP
#define CALCFLOW_FAKE_REMOTE_CLUSTER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "primitives/client.hpp"
#include "remote/http_transport.hpp"

namespace calcflow::remote
{
    /**
     * @brief In-process stand-in for a FirecREST style API and its OAuth token
     * endpoint, on one origin. Keeps a remote filesystem in memory and runs
     * submitted scripts, understanding only lines of the form
     * `echo '<text>' > <file>`, `echo '<text>' >> <file>`, `mkdir -p <dir>`
     * and `exit <code>`.
     * Every request is recorded, failures can be injected per route.
     */
    class FakeRemoteCluster : public HttpTransport
    {
    public:
        struct RecordedRequest
        {
            std::string                        method;
            std::string                        path; ///< without the query
            std::map<std::string, std::string> query;
            std::string                        body;
        };

        struct Job
        {
            std::string id;
            std::string script_path;
            std::string working_directory;
            std::string state;             ///< Slurm state name
            size_t      polls_left = 0;    ///< status requests before it runs
            bool        forced     = false; ///< state set by the test, never advanced
        };

        /**
         * @param api_path base path of the API, as in the client url
         * @param token_path path of the token endpoint
         */
        explicit FakeRemoteCluster( std::string api_path = "/api", std::string token_path = "/auth/token" );

        outcome::result<HttpResponse> Send( const HttpRequest &request, std::chrono::milliseconds timeout ) override;

        /// credentials accepted by the token endpoint
        void SetCredentials( std::string client_id, std::string client_secret );

        /// status requests a job stays PENDING/RUNNING for before it runs
        void SetJobDuration( size_t polls );

        /// forces the state reported for a job, e.g. "FAILED"
        void SetJobState( const std::string &job_id, const std::string &state );

        /// drops a job, as the scheduler does once it ages out
        void ForgetJob( const std::string &job_id );

        /// makes every issued token invalid, as if it had expired
        void RevokeTokens();

        /**
         * @brief Answers the next @param times requests whose method matches and
         * whose path contains @param path_part with @param status
         */
        void InjectStatus( const std::string &method, const std::string &path_part, unsigned status, size_t times = 1 );

        /// the next @param times matching requests fail with RemoteError::TIMEOUT
        void InjectTimeout( const std::string &method, const std::string &path_part, size_t times = 1 );

        /// places a file in the remote filesystem
        void PutFile( const std::string &path, const std::string &content );

        std::optional<std::string> FileContent( const std::string &path ) const;
        bool                       HasDirectory( const std::string &path ) const;

        std::vector<RecordedRequest> Requests() const;

        /// recorded requests matching @param method and containing @param path_part
        size_t CountRequests( const std::string &method, const std::string &path_part ) const;

        size_t TokenRequests() const;

        std::vector<Job> Jobs() const;

    private:
        struct Fault
        {
            std::string method;
            std::string path_part;
            unsigned    status; ///< 0 for a timeout
            size_t      times;
        };

        HttpResponse Route( const RecordedRequest &request, const HttpRequest &raw );
        HttpResponse IssueToken( const RecordedRequest &request );
        HttpResponse MakeDirectory( const RecordedRequest &request );
        HttpResponse UploadInline( const RecordedRequest &request, const HttpRequest &raw );
        HttpResponse UploadStream( const RecordedRequest &request );
        HttpResponse ListDirectory( const RecordedRequest &request );
        HttpResponse Download( const RecordedRequest &request );
        HttpResponse SubmitJob( const RecordedRequest &request );
        HttpResponse JobStatuses( const RecordedRequest &request );

        void AddDirectories( const std::string &path );
        void RunScript( Job &job );

        std::string m_api_path;
        std::string m_token_path;
        std::string m_client_id     = "client";
        std::string m_client_secret = "secret";
        size_t      m_job_duration  = 1;

        mutable std::mutex                 m_mutex;
        std::vector<RecordedRequest>       m_requests;
        std::vector<Fault>                 m_faults;
        std::set<std::string>              m_tokens;
        size_t                             m_token_requests = 0;
        std::set<std::string>              m_directories;
        std::map<std::string, std::string> m_files;
        std::map<std::string, Job>         m_jobs;
        size_t                             m_next_job_id = 1000;
    };

    /// a client pointing at a FakeRemoteCluster with default arguments
    primitives::Client MakeFakeClient( const std::string &label = "fake", const std::string &work_dir = "/scratch" );
}

#endif
