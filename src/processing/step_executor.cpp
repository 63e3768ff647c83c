#include "processing/step_executor.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "processing/processing_error.hpp"
#include "processing/script_renderer.hpp"

namespace calcflow::processing
{
    namespace
    {
        constexpr const char *kScriptExtension = "sh";
        constexpr size_t      kMaxExtension    = 16;

        std::string ParentOf( const std::string &path )
        {
            auto slash = path.rfind( '/' );
            return slash == std::string::npos || slash == 0 ? std::string( "/" ) : path.substr( 0, slash );
        }
    }

    std::string ObjectExtension( const std::string &path )
    {
        auto name = path.substr( path.rfind( '/' ) + 1 );
        auto dot  = name.rfind( '.' );
        if ( dot == std::string::npos || dot == 0 || dot + 1 == name.size() )
        {
            return {};
        }
        auto extension = name.substr( dot + 1 );
        bool valid     = extension.size() <= kMaxExtension &&
                     std::all_of( extension.begin(),
                                  extension.end(),
                                  []( unsigned char c ) { return std::isalnum( c ) != 0 || c == '_' || c == '-'; } );
        return valid ? extension : std::string();
    }

    StepExecutor::StepExecutor( std::shared_ptr<storage::ContentStore>   objects,
                                std::shared_ptr<remote::GatewayRegistry> gateways,
                                std::shared_ptr<const OutputClassifier>  classifier,
                                ExecutorOptions                          options ) :
        m_objects( std::move( objects ) ),
        m_gateways( std::move( gateways ) ),
        m_classifier( std::move( classifier ) ),
        m_options( options )
    {
    }

    void StepExecutor::Report( const StepContext &context, const std::string &message ) const
    {
        m_logger->info( "PK-{}: {}", context.calcjob.pk, message );
    }

    outcome::result<std::string> StepExecutor::Render( StepContext &context ) const
    {
        std::string failed;
        auto        script =
            RenderScript( context.code.script, MakeTemplateValues( context.calcjob, context.code, context.client ), failed );
        if ( !script )
        {
            context.detail = failed;
        }
        return script;
    }

    outcome::result<std::shared_ptr<remote::RemoteGateway>> StepExecutor::Gateway( const StepContext &context )
    {
        return m_gateways->Get( context.client );
    }

    outcome::result<void> StepExecutor::Prepare( StepContext &context )
    {
        Report( context, "rendering job script" );
        auto script = Render( context );
        if ( !script )
        {
            return outcome::failure( script.error() );
        }
        auto key = m_objects->put( script.value(), kScriptExtension );
        if ( !key )
        {
            return outcome::failure( key.error() );
        }
        m_logger->debug( "PK-{}: job script stored as {}", context.calcjob.pk, key.value() );
        return outcome::success();
    }

    outcome::result<void> StepExecutor::Upload( StepContext &context )
    {
        const auto remote_folder = context.calcjob.remotePath( context.client );
        Report( context, fmt::format( "uploading files to {}", remote_folder ) );

        // rendering is deterministic, the script is the one stored by the prepare step
        auto script = Render( context );
        if ( !script )
        {
            return outcome::failure( script.error() );
        }
        auto gateway = Gateway( context );
        if ( !gateway )
        {
            return outcome::failure( gateway.error() );
        }
        auto &remote = *gateway.value();

        std::set<std::string> folders{ remote_folder };
        auto                  made = remote.MakeDirectory( remote_folder );
        if ( !made )
        {
            context.detail = remote_folder;
            return made;
        }

        const auto script_path = primitives::joinRemotePath( remote_folder, primitives::kJobScriptName );
        auto       uploaded    = remote.Upload( script.value(), script_path );
        if ( !uploaded )
        {
            context.detail = primitives::kJobScriptName;
            return uploaded;
        }

        // calcjob entries override code entries of the same path
        primitives::PathMap uploads = context.code.upload_paths;
        for ( const auto &[path, key] : context.calcjob.upload_paths )
        {
            uploads[path] = key;
        }

        for ( const auto &[path, key] : uploads )
        {
            const auto target = primitives::joinRemotePath( remote_folder, path );
            context.detail    = path;

            if ( !key )
            {
                if ( folders.insert( target ).second )
                {
                    auto res = remote.MakeDirectory( target );
                    if ( !res )
                    {
                        return res;
                    }
                }
                continue;
            }

            const auto parent = ParentOf( target );
            if ( folders.insert( parent ).second )
            {
                auto res = remote.MakeDirectory( parent );
                if ( !res )
                {
                    return res;
                }
            }

            auto bytes = m_objects->get( *key );
            if ( !bytes )
            {
                m_logger->error( "PK-{}: object {} of {} unavailable: {}",
                                 context.calcjob.pk,
                                 *key,
                                 path,
                                 bytes.error().message() );
                return outcome::failure( bytes.error() );
            }
            auto res = remote.Upload( bytes.value(), target );
            if ( !res )
            {
                return res;
            }
        }
        context.detail.clear();
        m_logger->debug( "PK-{}: uploaded {} paths", context.calcjob.pk, uploads.size() + 1 );
        return outcome::success();
    }

    outcome::result<void> StepExecutor::Submit( StepContext &context )
    {
        Report( context, "submitting on remote" );
        auto gateway = Gateway( context );
        if ( !gateway )
        {
            return outcome::failure( gateway.error() );
        }
        const auto script_path =
            primitives::joinRemotePath( context.calcjob.remotePath( context.client ), primitives::kJobScriptName );
        auto job_id = gateway.value()->Submit( script_path );
        if ( !job_id )
        {
            context.detail = script_path;
            return outcome::failure( job_id.error() );
        }
        context.processing.job_id = job_id.value();
        Report( context, fmt::format( "submitted as job {}", job_id.value() ) );
        return outcome::success();
    }

    outcome::result<void> StepExecutor::Poll( StepContext &context, const StopSource &stop )
    {
        if ( !context.processing.job_id )
        {
            context.message = "no remote job id recorded";
            return ProcessingError::POLL_ERROR;
        }
        const auto &job_id = *context.processing.job_id;
        Report( context, fmt::format( "polling job {} until finished", job_id ) );

        auto gateway = Gateway( context );
        if ( !gateway )
        {
            return outcome::failure( gateway.error() );
        }

        Backoff backoff( m_options.poll_initial_interval, m_options.poll_backoff_factor, m_options.poll_max_interval );
        for ( ;; )
        {
            auto status = gateway.value()->Poll( job_id );
            if ( !status )
            {
                gateway.value()->Forget( job_id );
                context.detail = job_id;
                return outcome::failure( status.error() );
            }
            if ( primitives::isTerminal( status.value() ) )
            {
                context.processing.remote_state = status.value();
                Report( context, fmt::format( "job {} ended: {}", job_id, primitives::toString( status.value() ) ) );
                return outcome::success();
            }

            if ( context.heartbeat )
            {
                context.heartbeat();
            }
            auto delay = backoff.Next();
            m_logger->debug( "PK-{}: job {} still running, next poll in {} ms", context.calcjob.pk, job_id, delay.count() );
            if ( !stop.WaitFor( delay ) )
            {
                gateway.value()->Forget( job_id );
                return ProcessingError::STOPPED;
            }
        }
    }

    outcome::result<void> StepExecutor::Download( StepContext &context )
    {
        const auto remote_folder = context.calcjob.remotePath( context.client );
        Report( context, fmt::format( "copying from remote folder {}", remote_folder ) );

        auto gateway = Gateway( context );
        if ( !gateway )
        {
            return outcome::failure( gateway.error() );
        }
        auto &remote = *gateway.value();

        primitives::PathMap retrieved;
        if ( !context.calcjob.download_globs.empty() )
        {
            auto entries = remote.List( remote_folder, context.calcjob.download_globs );
            if ( !entries )
            {
                context.detail = remote_folder;
                return outcome::failure( entries.error() );
            }
            for ( const auto &entry : entries.value() )
            {
                if ( entry.is_directory )
                {
                    retrieved[entry.path] = std::nullopt;
                    continue;
                }
                auto bytes = remote.Download( primitives::joinRemotePath( remote_folder, entry.path ) );
                if ( !bytes )
                {
                    context.detail = entry.path;
                    return outcome::failure( bytes.error() );
                }
                auto key = m_objects->put( bytes.value(), ObjectExtension( entry.path ) );
                if ( !key )
                {
                    context.detail = entry.path;
                    return outcome::failure( key.error() );
                }
                retrieved[entry.path] = key.value();
            }
        }

        // replaced as a whole, a repeated download never merges with a partial one
        context.processing.retrieved_paths = std::move( retrieved );
        Report( context, fmt::format( "retrieved {} paths", context.processing.retrieved_paths.size() ) );
        return outcome::success();
    }

    outcome::result<void> StepExecutor::Parse( StepContext &context )
    {
        Report( context, "parsing output files" );
        auto verdict = m_classifier->Classify( context.calcjob, context.processing, *m_objects );
        if ( !verdict.success )
        {
            context.message = verdict.message;
            context.detail  = verdict.detail;
            return ProcessingError::PARSE_ERROR;
        }
        return outcome::success();
    }
}
