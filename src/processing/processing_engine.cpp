#include "processing/processing_engine.hpp"

#include "processing/processing_error.hpp"
#include "remote/remote_error.hpp"
#include "storage/database_error.hpp"

namespace calcflow::processing
{
    using primitives::Step;
    using storage::DatabaseError;

    bool IsTransientFailure( const std::error_code &error )
    {
        return remote::isTransient( error ) || error == DatabaseError::BUSY;
    }

    std::string FailureKind( Step step, const std::error_code &error )
    {
        if ( error.category() == ProcessingError_category() )
        {
            return KindName( static_cast<ProcessingError>( error.value() ) );
        }
        if ( error == DatabaseError::NOT_FOUND )
        {
            return KindName( ProcessingError::NOT_FOUND );
        }
        if ( error == DatabaseError::CONCURRENCY_VIOLATION )
        {
            return KindName( ProcessingError::CONCURRENCY_VIOLATION );
        }
        switch ( step )
        {
            case Step::kUploading:
            case Step::kPolling:
                return KindName( ProcessingError::TRANSFER_ERROR );
            case Step::kSubmitting:
                return KindName( ProcessingError::SUBMISSION_ERROR );
            case Step::kSubmitted:
                return KindName( ProcessingError::POLL_ERROR );
            default:
                // local steps report the failing component itself
                return error.category().name();
        }
    }

    ProcessingEngine::ProcessingEngine( std::shared_ptr<storage::MetadataStore> metadata,
                                        std::shared_ptr<StepExecutor>           executor ) :
        m_metadata( std::move( metadata ) ), m_executor( std::move( executor ) )
    {
        auto executor_ptr = m_executor.get();
        m_transitions     = {
            { Step::kCreated,
              { [executor_ptr]( StepContext &context, const StopSource & ) { return executor_ptr->Prepare( context ); },
                    Step::kUploading } },
            { Step::kUploading,
              { [executor_ptr]( StepContext &context, const StopSource & ) { return executor_ptr->Upload( context ); },
                    Step::kSubmitting } },
            { Step::kSubmitting,
              { [executor_ptr]( StepContext &context, const StopSource & ) { return executor_ptr->Submit( context ); },
                    Step::kSubmitted } },
            { Step::kSubmitted,
              { [executor_ptr]( StepContext &context, const StopSource &stop )
                { return executor_ptr->Poll( context, stop ); },
                    Step::kPolling } },
            { Step::kPolling,
              { [executor_ptr]( StepContext &context, const StopSource & )
                { return executor_ptr->Download( context ); },
                    Step::kDownloading } },
            { Step::kDownloading,
              { []( StepContext &, const StopSource & ) -> outcome::result<void> { return outcome::success(); },
                    Step::kParsing } },
            { Step::kParsing,
              { [executor_ptr]( StepContext &context, const StopSource & ) { return executor_ptr->Parse( context ); },
                    Step::kFinished } },
        };
    }

    void ProcessingEngine::SetTransitionSink( TransitionSink sink )
    {
        std::lock_guard<std::mutex> lock( m_sink_mutex );
        m_transition_sink = std::move( sink );
    }

    outcome::result<StepContext> ProcessingEngine::Load( int64_t calcjob_pk ) const
    {
        StepContext context;
        auto        calcjob = m_metadata->getCalcJob( calcjob_pk );
        if ( !calcjob )
        {
            return outcome::failure( calcjob.error() );
        }
        context.calcjob = std::move( calcjob.value() );

        auto code = m_metadata->getCode( context.calcjob.code_pk );
        if ( !code )
        {
            return outcome::failure( code.error() );
        }
        context.code = std::move( code.value() );

        auto client = m_metadata->getClient( context.code.client_pk );
        if ( !client )
        {
            return outcome::failure( client.error() );
        }
        context.client = std::move( client.value() );

        auto processing = m_metadata->getProcessing( calcjob_pk );
        if ( !processing )
        {
            return outcome::failure( processing.error() );
        }
        context.processing = std::move( processing.value() );
        return context;
    }

    StepReport ProcessingEngine::RunStep( StepContext       &context,
                                          const std::string &owner,
                                          const StopSource  &stop,
                                          bool               may_retry )
    {
        const auto step = context.processing.step;
        auto       it   = m_transitions.find( step );
        if ( it == m_transitions.end() )
        {
            m_logger->error( "PK-{}: no transition from step {}", context.calcjob.pk, primitives::toString( step ) );
            return { StepOutcome::kExcepted, ProcessingError::INVALID_STEP };
        }

        context.message.clear();
        context.detail.clear();
        // actions only touch the working copy, which is discarded on failure
        auto working = context;
        auto result  = it->second.action( working, stop );
        if ( !result )
        {
            const auto &error = result.error();
            context.message   = working.message;
            context.detail    = working.detail;
            if ( error == ProcessingError::STOPPED )
            {
                m_logger->info( "PK-{}: stopped in step {}", context.calcjob.pk, primitives::toString( step ) );
                return { StepOutcome::kStopped, error };
            }
            if ( may_retry && IsTransientFailure( error ) )
            {
                m_logger->warn( "PK-{}: step {} failed, may be retried: {}",
                                context.calcjob.pk,
                                primitives::toString( step ),
                                error.message() );
                return { StepOutcome::kRetry, error };
            }
            return Except( context, owner, error );
        }

        auto updated = working.processing;
        updated.step = it->second.next;
        return Persist( context, updated, owner );
    }

    StepReport ProcessingEngine::Persist( StepContext                  &context,
                                          const primitives::Processing &updated,
                                          const std::string            &owner )
    {
        const auto from    = context.processing.step;
        auto       written = m_metadata->updateProcessing( updated, owner );
        if ( !written )
        {
            const auto &error = written.error();
            if ( error == DatabaseError::CONCURRENCY_VIOLATION )
            {
                m_logger->warn( "PK-{}: claim lost, leaving the calcjob", context.calcjob.pk );
                return { StepOutcome::kLostClaim, error };
            }
            m_logger->error( "PK-{}: cannot record step {}: {}",
                             context.calcjob.pk,
                             primitives::toString( updated.step ),
                             error.message() );
            return { IsTransientFailure( error ) ? StepOutcome::kRetry : StepOutcome::kLostClaim, error };
        }

        context.processing = updated;
        m_logger->debug( "PK-{}: {} -> {}",
                         context.calcjob.pk,
                         primitives::toString( from ),
                         primitives::toString( updated.step ) );

        TransitionSink sink;
        {
            std::lock_guard<std::mutex> lock( m_sink_mutex );
            sink = m_transition_sink;
        }
        if ( sink )
        {
            sink( context.calcjob.pk, from, updated.step );
        }
        return { updated.step == Step::kExcepted ? StepOutcome::kExcepted : StepOutcome::kAdvanced, {} };
    }

    std::string ProcessingEngine::DescribeFailure( const StepContext &context, const std::error_code &error ) const
    {
        const auto message = context.message.empty() ? error.message() : context.message;
        return FormatException( FailureKind( context.processing.step, error ), message, context.detail );
    }

    StepReport ProcessingEngine::Except( StepContext &context, const std::string &owner, const std::error_code &error )
    {
        auto updated        = context.processing;
        updated.step        = Step::kExcepted;
        updated.failed_step = context.processing.step;
        updated.exception   = DescribeFailure( context, error );
        m_logger->error( "PK-{}: excepted in step {}: {}",
                         context.calcjob.pk,
                         primitives::toString( context.processing.step ),
                         *updated.exception );

        auto report = Persist( context, updated, owner );
        if ( report.outcome == StepOutcome::kExcepted )
        {
            report.error = error;
        }
        return report;
    }
}
