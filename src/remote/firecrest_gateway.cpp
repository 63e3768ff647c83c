#include "remote/firecrest_gateway.hpp"

#include <algorithm>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <nlohmann/json.hpp>

#include "crypto/sha/sha256.hpp"
#include "remote/glob_match.hpp"
#include "remote/remote_error.hpp"

using nlohmann::json;

namespace calcflow::remote
{
    using primitives::RemoteStatus;

    namespace
    {
        /// splits a POSIX path into its folder and file name
        std::pair<std::string, std::string> SplitName( const std::string &path )
        {
            auto slash = path.rfind( '/' );
            if ( slash == std::string::npos )
            {
                return { ".", path };
            }
            return { slash == 0 ? "/" : path.substr( 0, slash ), path.substr( slash + 1 ) };
        }

        std::string JoinRelative( const std::string &base, const std::string &name )
        {
            return base.empty() ? name : base + "/" + name;
        }

        /// sizes are numbers or numeric strings depending on the API version
        uint64_t ParseSize( const json &value )
        {
            if ( value.is_number_unsigned() || value.is_number_integer() )
            {
                return value.get<uint64_t>();
            }
            if ( value.is_string() )
            {
                try
                {
                    return std::stoull( value.get<std::string>() );
                }
                catch ( const std::exception & )
                {
                    return 0;
                }
            }
            return 0;
        }

        std::string JobIdText( const json &value )
        {
            return value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    RemoteStatus MapJobState( const std::string &state )
    {
        using boost::algorithm::istarts_with;
        if ( istarts_with( state, "COMPLETED" ) )
        {
            return RemoteStatus::kCompleted;
        }
        if ( istarts_with( state, "CANCELLED" ) )
        {
            return RemoteStatus::kCancelled;
        }
        for ( const char *failed :
              { "FAILED", "TIMEOUT", "NODE_FAIL", "OUT_OF_MEMORY", "BOOT_FAIL", "DEADLINE", "PREEMPTED" } )
        {
            if ( istarts_with( state, failed ) )
            {
                return RemoteStatus::kFailed;
            }
        }
        // PENDING, RUNNING, CONFIGURING, COMPLETING, SUSPENDED, REQUEUED...
        return RemoteStatus::kRunning;
    }

    FirecrestGateway::FirecrestGateway( primitives::Client                     client,
                                        Url                                    base_url,
                                        std::shared_ptr<HttpTransport>         api,
                                        std::shared_ptr<ClientCredentialsAuth> auth,
                                        GatewayOptions                         options ) :
        m_client( std::move( client ) ),
        m_api( std::move( api ) ),
        m_auth( std::move( auth ) ),
        m_options( options ),
        m_base( std::move( base_url ) ),
        m_logger( base::createLogger( "FirecrestGateway" ) )
    {
    }

    size_t FirecrestGateway::RequestCount() const
    {
        return m_requests.load();
    }

    std::string FirecrestGateway::FilesystemTarget( const std::string &operation, const QueryParams &query ) const
    {
        return m_base.target( "/filesystem/" + urlEncode( m_client.machine_name ) + "/ops/" + operation, query );
    }

    std::string FirecrestGateway::ComputeTarget( const QueryParams &query ) const
    {
        return m_base.target( "/compute/" + urlEncode( m_client.machine_name ) + "/jobs", query );
    }

    outcome::result<HttpResponse> FirecrestGateway::Call( HttpRequest request )
    {
        for ( int attempt = 0;; ++attempt )
        {
            auto token = m_auth->Token();
            if ( !token )
            {
                return outcome::failure( token.error() );
            }
            request.headers["Authorization"] = "Bearer " + token.value();
            request.headers["Accept"]        = "application/json";

            ++m_requests;
            auto response = m_api->Send( request, m_options.request_timeout );
            if ( !response )
            {
                return outcome::failure( response.error() );
            }
            if ( response.value().ok() )
            {
                return response;
            }

            auto error = errorForStatus( response.value().status );
            if ( error == RemoteError::AUTH_EXPIRED && attempt == 0 )
            {
                m_logger->debug( "Access token of client {} expired, refreshing", m_client.label );
                m_auth->Invalidate( token.value() );
                continue;
            }
            m_logger->warn( "{} {} -> {} {}",
                            request.method,
                            request.target,
                            response.value().status,
                            response.value().body.substr( 0, 200 ) );
            return error;
        }
    }

    outcome::result<void> FirecrestGateway::MakeDirectory( const std::string &remote_path )
    {
        HttpRequest request;
        request.method                  = "POST";
        request.target                  = FilesystemTarget( "mkdir", {} );
        request.headers["Content-Type"] = "application/json";
        request.body                    = json{ { "path", remote_path }, { "parent", true } }.dump();

        auto response = Call( std::move( request ) );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }
        return outcome::success();
    }

    outcome::result<void> FirecrestGateway::Upload( std::string_view bytes, const std::string &remote_path )
    {
        if ( bytes.size() <= m_client.smallFileThreshold() )
        {
            return UploadInline( bytes, remote_path );
        }
        return UploadStream( bytes, remote_path );
    }

    outcome::result<void> FirecrestGateway::UploadInline( std::string_view bytes, const std::string &remote_path )
    {
        auto [folder, name] = SplitName( remote_path );
        // a boundary derived from the content cannot occur in it
        const std::string boundary = "calcflow-" + crypto::sha256Hex( bytes ).substr( 0, 32 );

        std::string body;
        body.reserve( bytes.size() + 256 );
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"file\"; filename=\"" + name + "\"\r\n";
        body += "Content-Type: application/octet-stream\r\n\r\n";
        body.append( bytes.data(), bytes.size() );
        body += "\r\n--" + boundary + "--\r\n";

        HttpRequest request;
        request.method                  = "POST";
        request.target                  = FilesystemTarget( "upload", { { "path", folder }, { "fileName", name } } );
        request.headers["Content-Type"] = "multipart/form-data; boundary=" + boundary;
        request.body                    = std::move( body );

        auto response = Call( std::move( request ) );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }
        return outcome::success();
    }

    outcome::result<void> FirecrestGateway::UploadStream( std::string_view bytes, const std::string &remote_path )
    {
        m_logger->debug( "Streaming {} bytes to {}", bytes.size(), remote_path );
        HttpRequest request;
        request.method                  = "PUT";
        request.target                  = FilesystemTarget( "upload/stream", { { "path", remote_path } } );
        request.headers["Content-Type"] = "application/octet-stream";
        request.body.assign( bytes.data(), bytes.size() );
        request.chunked = true;

        auto response = Call( std::move( request ) );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }
        return outcome::success();
    }

    outcome::result<std::string> FirecrestGateway::Submit( const std::string &script_path )
    {
        HttpRequest request;
        request.method                  = "POST";
        request.target                  = ComputeTarget( {} );
        request.headers["Content-Type"] = "application/json";
        request.body =
            json{ { "script_path", script_path }, { "working_directory", SplitName( script_path ).first } }.dump();

        auto response = Call( std::move( request ) );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }
        try
        {
            auto body = json::parse( response.value().body );
            auto id   = body.contains( "jobId" ) ? body.at( "jobId" ) : body.at( "jobid" );
            auto text = JobIdText( id );
            if ( text.empty() || text == "null" )
            {
                return RemoteError::MALFORMED_RESPONSE;
            }
            return text;
        }
        catch ( const json::exception &e )
        {
            m_logger->error( "Malformed submission response: {}", e.what() );
            return RemoteError::MALFORMED_RESPONSE;
        }
    }

    outcome::result<FirecrestGateway::StatusSnapshot> FirecrestGateway::FetchStatuses(
        const std::vector<std::string> &job_ids )
    {
        HttpRequest request;
        request.method = "GET";
        request.target = ComputeTarget( { { "jobids", boost::algorithm::join( job_ids, "," ) } } );

        auto response = Call( std::move( request ) );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }

        StatusSnapshot snapshot;
        for ( const auto &id : job_ids )
        {
            snapshot[id] = std::nullopt;
        }
        try
        {
            auto body = json::parse( response.value().body );
            for ( const auto &job : body.at( "jobs" ) )
            {
                auto        id = JobIdText( job.at( "jobId" ) );
                std::string state;
                if ( job.contains( "state" ) )
                {
                    state = job.at( "state" ).get<std::string>();
                }
                else
                {
                    state = job.at( "status" ).at( "state" ).get<std::string>();
                }
                snapshot[id] = MapJobState( state );
            }
        }
        catch ( const json::exception &e )
        {
            m_logger->error( "Malformed job status response: {}", e.what() );
            return RemoteError::MALFORMED_RESPONSE;
        }
        m_logger->debug( "Fetched status of {} jobs on {}", job_ids.size(), m_client.label );
        return snapshot;
    }

    outcome::result<RemoteStatus> FirecrestGateway::Lookup( const std::string &job_id )
    {
        auto it = m_snapshot.find( job_id );
        if ( it == m_snapshot.end() )
        {
            return RemoteError::JOB_UNKNOWN;
        }
        auto status = it->second;
        if ( !status || primitives::isTerminal( *status ) )
        {
            m_watched.erase( job_id );
        }
        if ( !status )
        {
            return RemoteError::JOB_UNKNOWN;
        }
        return *status;
    }

    outcome::result<RemoteStatus> FirecrestGateway::Poll( const std::string &job_id )
    {
        std::unique_lock<std::mutex> lock( m_status_mutex );
        m_watched.insert( job_id );

        for ( ;; )
        {
            const bool fresh = Clock::now() - m_snapshot_time < m_options.status_cache_ttl;
            if ( fresh && m_snapshot.count( job_id ) != 0 )
            {
                return Lookup( job_id );
            }
            if ( !m_refreshing )
            {
                break;
            }
            m_status_cv.wait( lock, [this] { return !m_refreshing; } );
        }

        m_refreshing = true;
        std::vector<std::string> job_ids( m_watched.begin(), m_watched.end() );
        lock.unlock();
        auto snapshot = FetchStatuses( job_ids );
        lock.lock();
        m_refreshing = false;
        m_status_cv.notify_all();

        if ( !snapshot )
        {
            return outcome::failure( snapshot.error() );
        }
        m_snapshot      = std::move( snapshot.value() );
        m_snapshot_time = Clock::now();
        return Lookup( job_id );
    }

    void FirecrestGateway::Forget( const std::string &job_id )
    {
        std::lock_guard<std::mutex> lock( m_status_mutex );
        m_watched.erase( job_id );
        m_snapshot.erase( job_id );
    }

    outcome::result<std::vector<RemoteEntry>> FirecrestGateway::ListDirectory( const std::string &remote_dir )
    {
        HttpRequest request;
        request.method = "GET";
        request.target = FilesystemTarget( "ls", { { "path", remote_dir }, { "showHidden", "true" } } );

        auto response = Call( std::move( request ) );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }

        std::vector<RemoteEntry> entries;
        try
        {
            auto body = json::parse( response.value().body );
            for ( const auto &item : body.at( "output" ) )
            {
                RemoteEntry entry;
                entry.path         = item.at( "name" ).get<std::string>();
                entry.is_directory = item.value( "type", std::string( "-" ) ) == "d";
                entry.size         = item.contains( "size" ) ? ParseSize( item.at( "size" ) ) : 0;
                if ( entry.path == "." || entry.path == ".." )
                {
                    continue;
                }
                entries.push_back( std::move( entry ) );
            }
        }
        catch ( const json::exception &e )
        {
            m_logger->error( "Malformed listing of {}: {}", remote_dir, e.what() );
            return RemoteError::MALFORMED_RESPONSE;
        }
        return entries;
    }

    outcome::result<std::vector<RemoteEntry>> FirecrestGateway::List( const std::string              &remote_dir,
                                                                      const std::vector<std::string> &globs )
    {
        std::vector<RemoteEntry> matches;
        std::vector<std::string> pending{ "" };
        size_t                   calls = 0;

        // depth first, pruning folders no pattern can reach
        while ( !pending.empty() )
        {
            auto relative = std::move( pending.back() );
            pending.pop_back();
            if ( ++calls > m_options.max_list_calls )
            {
                m_logger->error( "Listing of {} needs more than {} calls", remote_dir, m_options.max_list_calls );
                return RemoteError::LISTING_TOO_LARGE;
            }

            auto entries = ListDirectory( relative.empty() ? remote_dir : remote_dir + "/" + relative );
            if ( !entries )
            {
                return outcome::failure( entries.error() );
            }
            for ( auto &entry : entries.value() )
            {
                entry.path = JoinRelative( relative, entry.path );
                if ( entry.is_directory )
                {
                    bool descend = std::any_of( globs.begin(),
                                                globs.end(),
                                                [&entry]( const std::string &glob )
                                                { return GlobMayMatchBelow( glob, entry.path ); } );
                    if ( descend )
                    {
                        pending.push_back( entry.path );
                    }
                }
                if ( GlobMatchAny( globs, entry.path ) )
                {
                    matches.push_back( std::move( entry ) );
                }
            }
        }

        std::sort( matches.begin(),
                   matches.end(),
                   []( const RemoteEntry &lhs, const RemoteEntry &rhs ) { return lhs.path < rhs.path; } );
        return matches;
    }

    outcome::result<std::string> FirecrestGateway::Download( const std::string &remote_path )
    {
        HttpRequest request;
        request.method = "GET";
        request.target = FilesystemTarget( "download", { { "path", remote_path } } );

        auto response = Call( std::move( request ) );
        if ( !response )
        {
            return outcome::failure( response.error() );
        }
        return std::move( response.value().body );
    }
}
