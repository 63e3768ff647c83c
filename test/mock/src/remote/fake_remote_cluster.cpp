#include "mock/src/remote/fake_remote_cluster.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <nlohmann/json.hpp>

#include "remote/remote_error.hpp"

using nlohmann::json;

namespace calcflow::remote
{
    namespace
    {
        std::string UrlDecode( const std::string &value )
        {
            std::string out;
            for ( size_t i = 0; i < value.size(); ++i )
            {
                if ( value[i] == '%' && i + 2 < value.size() && std::isxdigit( static_cast<unsigned char>( value[i + 1] ) )
                 && std::isxdigit( static_cast<unsigned char>( value[i + 2] ) ) )
                {
                    out += static_cast<char>( std::stoi( value.substr( i + 1, 2 ), nullptr, 16 ) );
                    i += 2;
                }
                else if ( value[i] == '+' )
                {
                    out += ' ';
                }
                else
                {
                    out += value[i];
                }
            }
            return out;
        }

        std::map<std::string, std::string> ParseQuery( const std::string &query )
        {
            std::map<std::string, std::string> fields;
            std::vector<std::string>           pairs;
            boost::algorithm::split( pairs, query, []( char c ) { return c == '&'; } );
            for ( const auto &pair : pairs )
            {
                if ( pair.empty() )
                {
                    continue;
                }
                auto eq = pair.find( '=' );
                if ( eq == std::string::npos )
                {
                    fields[UrlDecode( pair )] = "";
                }
                else
                {
                    fields[UrlDecode( pair.substr( 0, eq ) )] = UrlDecode( pair.substr( eq + 1 ) );
                }
            }
            return fields;
        }

        std::string Normalize( std::string path )
        {
            while ( path.size() > 1 && path.back() == '/' )
            {
                path.pop_back();
            }
            return path;
        }

        std::string ParentOf( const std::string &path )
        {
            auto slash = path.rfind( '/' );
            if ( slash == std::string::npos || slash == 0 )
            {
                return "/";
            }
            return path.substr( 0, slash );
        }

        std::string NameOf( const std::string &path )
        {
            auto slash = path.rfind( '/' );
            return slash == std::string::npos ? path : path.substr( slash + 1 );
        }

        HttpResponse Respond( unsigned status, const json &body )
        {
            HttpResponse response;
            response.status       = status;
            response.content_type = "application/json";
            response.body         = body.dump();
            return response;
        }

        HttpResponse Error( unsigned status, const std::string &message )
        {
            return Respond( status, json{ { "message", message } } );
        }
    }

    FakeRemoteCluster::FakeRemoteCluster( std::string api_path, std::string token_path ) :
        m_api_path( std::move( api_path ) ), m_token_path( std::move( token_path ) )
    {
        m_directories.insert( "/" );
    }

    outcome::result<HttpResponse> FakeRemoteCluster::Send( const HttpRequest &request, std::chrono::milliseconds )
    {
        std::lock_guard<std::mutex> lock( m_mutex );

        RecordedRequest recorded;
        recorded.method = request.method;
        recorded.body   = request.body;
        auto question   = request.target.find( '?' );
        recorded.path   = request.target.substr( 0, question );
        if ( question != std::string::npos )
        {
            recorded.query = ParseQuery( request.target.substr( question + 1 ) );
        }
        m_requests.push_back( recorded );

        for ( auto it = m_faults.begin(); it != m_faults.end(); ++it )
        {
            if ( it->method == recorded.method && recorded.path.find( it->path_part ) != std::string::npos )
            {
                auto status = it->status;
                if ( --it->times == 0 )
                {
                    m_faults.erase( it );
                }
                if ( status == 0 )
                {
                    return RemoteError::TIMEOUT;
                }
                return Error( status, "injected failure" );
            }
        }
        return Route( recorded, request );
    }

    HttpResponse FakeRemoteCluster::Route( const RecordedRequest &request, const HttpRequest &raw )
    {
        if ( request.path == m_token_path )
        {
            return IssueToken( request );
        }
        if ( !boost::algorithm::starts_with( request.path, m_api_path + "/" ) )
        {
            return Error( 404, "no such route" );
        }

        auto authorization = raw.headers.find( "Authorization" );
        if ( authorization == raw.headers.end()
             || !boost::algorithm::starts_with( authorization->second, "Bearer " )
             || m_tokens.count( authorization->second.substr( 7 ) ) == 0 )
        {
            return Error( 401, "invalid or expired token" );
        }

        std::vector<std::string> segments;
        auto                     route = request.path.substr( m_api_path.size() + 1 );
        boost::algorithm::split( segments, route, []( char c ) { return c == '/'; } );

        if ( segments.size() >= 4 && segments[0] == "filesystem" && segments[2] == "ops" )
        {
            auto operation = route.substr( route.find( "/ops/" ) + 5 );
            if ( operation == "mkdir" && request.method == "POST" )
            {
                return MakeDirectory( request );
            }
            if ( operation == "upload" && request.method == "POST" )
            {
                return UploadInline( request, raw );
            }
            if ( operation == "upload/stream" && request.method == "PUT" )
            {
                return UploadStream( request );
            }
            if ( operation == "ls" && request.method == "GET" )
            {
                return ListDirectory( request );
            }
            if ( operation == "download" && request.method == "GET" )
            {
                return Download( request );
            }
        }
        if ( segments.size() == 3 && segments[0] == "compute" && segments[2] == "jobs" )
        {
            if ( request.method == "POST" )
            {
                return SubmitJob( request );
            }
            if ( request.method == "GET" )
            {
                return JobStatuses( request );
            }
        }
        return Error( 404, "no such route" );
    }

    HttpResponse FakeRemoteCluster::IssueToken( const RecordedRequest &request )
    {
        ++m_token_requests;
        auto form = ParseQuery( request.body );
        if ( form["grant_type"] != "client_credentials" || form["client_id"] != m_client_id
             || form["client_secret"] != m_client_secret )
        {
            return Error( 401, "invalid client" );
        }
        auto token = "token-" + std::to_string( m_token_requests );
        m_tokens.insert( token );
        return Respond( 200, json{ { "access_token", token }, { "token_type", "Bearer" }, { "expires_in", 3600 } } );
    }

    HttpResponse FakeRemoteCluster::MakeDirectory( const RecordedRequest &request )
    {
        try
        {
            auto body = json::parse( request.body );
            AddDirectories( Normalize( body.at( "path" ).get<std::string>() ) );
        }
        catch ( const json::exception &e )
        {
            return Error( 400, e.what() );
        }
        return Respond( 201, json::object() );
    }

    HttpResponse FakeRemoteCluster::UploadInline( const RecordedRequest &request, const HttpRequest &raw )
    {
        auto folder = request.query.find( "path" );
        auto name   = request.query.find( "fileName" );
        if ( folder == request.query.end() || name == request.query.end() )
        {
            return Error( 400, "path and fileName are required" );
        }
        if ( m_directories.count( Normalize( folder->second ) ) == 0 )
        {
            return Error( 400, "no such directory " + folder->second );
        }

        auto content_type = raw.headers.find( "Content-Type" );
        if ( content_type == raw.headers.end() )
        {
            return Error( 400, "multipart body expected" );
        }
        auto marker = content_type->second.find( "boundary=" );
        if ( marker == std::string::npos )
        {
            return Error( 400, "multipart boundary missing" );
        }
        auto boundary = content_type->second.substr( marker + 9 );
        auto start    = request.body.find( "\r\n\r\n" );
        auto end      = request.body.rfind( "\r\n--" + boundary + "--" );
        if ( start == std::string::npos || end == std::string::npos || end < start + 4 )
        {
            return Error( 400, "malformed multipart body" );
        }
        auto path     = Normalize( folder->second ) + "/" + name->second;
        m_files[path] = request.body.substr( start + 4, end - start - 4 );
        return Respond( 201, json::object() );
    }

    HttpResponse FakeRemoteCluster::UploadStream( const RecordedRequest &request )
    {
        auto target = request.query.find( "path" );
        if ( target == request.query.end() )
        {
            return Error( 400, "path is required" );
        }
        auto path = Normalize( target->second );
        if ( m_directories.count( ParentOf( path ) ) == 0 )
        {
            return Error( 400, "no such directory " + ParentOf( path ) );
        }
        m_files[path] = request.body;
        return Respond( 201, json::object() );
    }

    HttpResponse FakeRemoteCluster::ListDirectory( const RecordedRequest &request )
    {
        auto target = request.query.find( "path" );
        if ( target == request.query.end() )
        {
            return Error( 400, "path is required" );
        }
        auto folder = Normalize( target->second );
        if ( m_directories.count( folder ) == 0 )
        {
            return Error( 404, "no such directory " + folder );
        }

        auto output = json::array();
        for ( const auto &dir : m_directories )
        {
            if ( dir != "/" && ParentOf( dir ) == folder )
            {
                output.push_back( json{ { "name", NameOf( dir ) }, { "type", "d" }, { "size", "4096" } } );
            }
        }
        for ( const auto &[path, content] : m_files )
        {
            if ( ParentOf( path ) == folder )
            {
                output.push_back( json{ { "name", NameOf( path ) }, { "type", "-" }, { "size", content.size() } } );
            }
        }
        return Respond( 200, json{ { "output", output } } );
    }

    HttpResponse FakeRemoteCluster::Download( const RecordedRequest &request )
    {
        auto target = request.query.find( "path" );
        if ( target == request.query.end() )
        {
            return Error( 400, "path is required" );
        }
        auto file = m_files.find( Normalize( target->second ) );
        if ( file == m_files.end() )
        {
            return Error( 404, "no such file " + target->second );
        }
        HttpResponse response;
        response.status       = 200;
        response.content_type = "application/octet-stream";
        response.body         = file->second;
        return response;
    }

    HttpResponse FakeRemoteCluster::SubmitJob( const RecordedRequest &request )
    {
        Job job;
        try
        {
            auto body             = json::parse( request.body );
            job.script_path       = Normalize( body.at( "script_path" ).get<std::string>() );
            job.working_directory = Normalize( body.value( "working_directory", ParentOf( job.script_path ) ) );
        }
        catch ( const json::exception &e )
        {
            return Error( 400, e.what() );
        }
        if ( m_files.count( job.script_path ) == 0 )
        {
            return Error( 400, "no such script " + job.script_path );
        }
        auto number    = m_next_job_id++;
        job.id         = std::to_string( number );
        job.state      = "PENDING";
        job.polls_left = m_job_duration;
        m_jobs[job.id] = job;
        return Respond( 201, json{ { "jobId", number } } );
    }

    HttpResponse FakeRemoteCluster::JobStatuses( const RecordedRequest &request )
    {
        std::vector<std::string> ids;
        auto                     requested = request.query.find( "jobids" );
        if ( requested != request.query.end() )
        {
            boost::algorithm::split( ids, requested->second, []( char c ) { return c == ','; } );
        }

        auto jobs = json::array();
        for ( const auto &id : ids )
        {
            auto it = m_jobs.find( id );
            if ( it == m_jobs.end() )
            {
                continue;
            }
            auto &job = it->second;
            if ( !job.forced && ( job.state == "PENDING" || job.state == "RUNNING" ) )
            {
                if ( job.polls_left > 0 )
                {
                    --job.polls_left;
                    job.state = "RUNNING";
                }
                else
                {
                    RunScript( job );
                }
            }
            jobs.push_back( json{ { "jobId", job.id }, { "state", job.state } } );
        }
        return Respond( 200, json{ { "jobs", jobs } } );
    }

    void FakeRemoteCluster::AddDirectories( const std::string &path )
    {
        std::string current;
        std::vector<std::string> segments;
        boost::algorithm::split( segments, path, []( char c ) { return c == '/'; } );
        for ( const auto &segment : segments )
        {
            if ( segment.empty() )
            {
                continue;
            }
            current += "/" + segment;
            m_directories.insert( current );
        }
    }

    void FakeRemoteCluster::RunScript( Job &job )
    {
        static const std::regex kEcho( R"re(^echo\s+(?:'([^']*)'|"([^"]*)")\s*(>>?)\s*(\S+)$)re" );
        static const std::regex kMkdir( R"re(^mkdir\s+-p\s+(\S+)$)re" );
        static const std::regex kExit( R"re(^exit\s+(\d+)$)re" );

        auto script = m_files.find( job.script_path );
        if ( script == m_files.end() )
        {
            job.state = "FAILED";
            return;
        }
        auto resolve = [&job]( const std::string &path )
        { return path.front() == '/' ? Normalize( path ) : job.working_directory + "/" + Normalize( path ); };

        job.state = "COMPLETED";
        std::vector<std::string> lines;
        boost::algorithm::split( lines, script->second, []( char c ) { return c == '\n'; } );
        for ( auto line : lines )
        {
            boost::algorithm::trim( line );
            std::smatch match;
            if ( std::regex_match( line, match, kEcho ) )
            {
                auto text = match[1].matched ? match[1].str() : match[2].str();
                auto path = resolve( match[4].str() );
                AddDirectories( ParentOf( path ) );
                if ( match[3].str() == ">>" )
                {
                    m_files[path] += text + "\n";
                }
                else
                {
                    m_files[path] = text + "\n";
                }
            }
            else if ( std::regex_match( line, match, kMkdir ) )
            {
                AddDirectories( resolve( match[1].str() ) );
            }
            else if ( std::regex_match( line, match, kExit ) )
            {
                if ( match[1].str() != "0" )
                {
                    job.state = "FAILED";
                }
                return;
            }
        }
    }

    void FakeRemoteCluster::SetCredentials( std::string client_id, std::string client_secret )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_client_id     = std::move( client_id );
        m_client_secret = std::move( client_secret );
    }

    void FakeRemoteCluster::SetJobDuration( size_t polls )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_job_duration = polls;
    }

    void FakeRemoteCluster::SetJobState( const std::string &job_id, const std::string &state )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        auto &job  = m_jobs[job_id];
        job.id     = job_id;
        job.state  = state;
        job.forced = true;
    }

    void FakeRemoteCluster::ForgetJob( const std::string &job_id )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_jobs.erase( job_id );
    }

    void FakeRemoteCluster::RevokeTokens()
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_tokens.clear();
    }

    void FakeRemoteCluster::InjectStatus( const std::string &method,
                                          const std::string &path_part,
                                          unsigned           status,
                                          size_t             times )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_faults.push_back( { method, path_part, status, times } );
    }

    void FakeRemoteCluster::InjectTimeout( const std::string &method, const std::string &path_part, size_t times )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_faults.push_back( { method, path_part, 0, times } );
    }

    void FakeRemoteCluster::PutFile( const std::string &path, const std::string &content )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        auto                        normalized = Normalize( path );
        AddDirectories( ParentOf( normalized ) );
        m_files[normalized] = content;
    }

    std::optional<std::string> FakeRemoteCluster::FileContent( const std::string &path ) const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        auto                        it = m_files.find( Normalize( path ) );
        if ( it == m_files.end() )
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool FakeRemoteCluster::HasDirectory( const std::string &path ) const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_directories.count( Normalize( path ) ) > 0;
    }

    std::vector<FakeRemoteCluster::RecordedRequest> FakeRemoteCluster::Requests() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_requests;
    }

    size_t FakeRemoteCluster::CountRequests( const std::string &method, const std::string &path_part ) const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return std::count_if( m_requests.begin(),
                              m_requests.end(),
                              [&]( const RecordedRequest &request )
                              { return request.method == method && request.path.find( path_part ) != std::string::npos; } );
    }

    size_t FakeRemoteCluster::TokenRequests() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_token_requests;
    }

    std::vector<FakeRemoteCluster::Job> FakeRemoteCluster::Jobs() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        std::vector<Job>            jobs;
        for ( const auto &[id, job] : m_jobs )
        {
            jobs.push_back( job );
        }
        return jobs;
    }

    primitives::Client MakeFakeClient( const std::string &label, const std::string &work_dir )
    {
        primitives::Client client;
        client.label         = label;
        client.client_url    = "http://fake.cluster/api";
        client.client_id     = "client";
        client.client_secret = "secret";
        client.token_uri     = "http://fake.cluster/auth/token";
        client.machine_name  = "fake-machine";
        client.work_dir      = work_dir;
        return client;
    }
}
