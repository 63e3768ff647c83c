#include "processing/output_classifier.hpp"

#include "remote/glob_match.hpp"

namespace calcflow::processing
{
    Verdict DefaultOutputClassifier::Classify( const primitives::CalcJob    &calcjob,
                                               const primitives::Processing &processing,
                                               const storage::ContentStore  &objects ) const
    {
        if ( !processing.remote_state )
        {
            return Verdict::Failure( "remote job status unknown" );
        }
        if ( *processing.remote_state != primitives::RemoteStatus::kCompleted )
        {
            return Verdict::Failure( "remote job did not complete", primitives::toString( *processing.remote_state ) );
        }

        for ( const auto &glob : calcjob.download_globs )
        {
            bool matched = false;
            for ( const auto &[path, key] : processing.retrieved_paths )
            {
                if ( remote::GlobMatch( glob, path ) )
                {
                    matched = true;
                    break;
                }
            }
            if ( !matched )
            {
                return Verdict::Failure( "expected output missing", glob );
            }
        }

        for ( const auto &[path, key] : processing.retrieved_paths )
        {
            if ( key && !objects.exists( *key ) )
            {
                return Verdict::Failure( "retrieved object missing", path );
            }
        }
        return Verdict::Success();
    }
}
