#include "processing/calcjob_runner.hpp"

#include <boost/asio/post.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "storage/database_error.hpp"

namespace calcflow::processing
{
    CalcJobRunner::CalcJobRunner( std::shared_ptr<storage::MetadataStore> metadata,
                                  std::shared_ptr<ProcessingEngine>       engine,
                                  RunnerOptions                           options ) :
        m_metadata( std::move( metadata ) ),
        m_engine( std::move( engine ) ),
        m_options( options ),
        m_owner( m_options.owner.empty() ? "runner-" + boost::uuids::to_string( boost::uuids::random_generator()() )
                                         : m_options.owner )
    {
        if ( m_options.concurrency == 0 )
        {
            m_options.concurrency = 1;
        }
    }

    RunSummary CalcJobRunner::RunUntilDone()
    {
        return Run( false );
    }

    RunSummary CalcJobRunner::Serve()
    {
        return Run( true );
    }

    void CalcJobRunner::Stop()
    {
        m_stop.RequestStop();
        {
            std::lock_guard<std::mutex> lock( m_mutex );
        }
        m_cv.notify_all();
    }

    RunSummary CalcJobRunner::Run( bool serve )
    {
        m_logger->info( "Runner {} started with {} slots", m_owner, m_options.concurrency );
        boost::asio::thread_pool pool( m_options.concurrency );

        while ( !m_stop.StopRequested() )
        {
            auto remaining = Select( pool );
            if ( !remaining )
            {
                m_logger->error( "Cannot select calcjobs: {}", remaining.error().message() );
            }
            else if ( !serve && !remaining.value() )
            {
                break;
            }

            std::unique_lock<std::mutex> lock( m_mutex );
            m_cv.wait_for( lock,
                           m_options.selection_interval,
                           [this] { return m_slot_freed || m_stop.StopRequested(); } );
            m_slot_freed = false;
        }

        pool.join();

        std::lock_guard<std::mutex> lock( m_mutex );
        m_logger->info( "Runner {} done: {} finished, {} excepted, {} interrupted",
                        m_owner,
                        m_summary.finished,
                        m_summary.excepted,
                        m_summary.interrupted );
        return m_summary;
    }

    outcome::result<bool> CalcJobRunner::Select( boost::asio::thread_pool &pool )
    {
        auto rows = m_metadata->queryCalcJobs( storage::CalcJobQuery::playing() );
        if ( !rows )
        {
            return outcome::failure( rows.error() );
        }

        bool remaining = false;
        for ( const auto &row : rows.value() )
        {
            const auto pk = row.calcjob.pk;
            {
                std::lock_guard<std::mutex> lock( m_mutex );
                if ( m_skipped.count( pk ) > 0 )
                {
                    continue;
                }
                remaining = true;
                if ( m_active.count( pk ) > 0 || m_active.size() >= m_options.concurrency )
                {
                    continue;
                }
            }
            if ( m_stop.StopRequested() )
            {
                break;
            }

            auto claimed = m_metadata->claimCalcJob( pk, m_owner, m_options.claim_lease );
            if ( !claimed )
            {
                if ( claimed.error() == storage::DatabaseError::CONCURRENCY_VIOLATION )
                {
                    m_logger->debug( "PK-{}: claimed by another runner", pk );
                }
                else
                {
                    m_logger->warn( "PK-{}: cannot claim: {}", pk, claimed.error().message() );
                }
                continue;
            }

            {
                std::lock_guard<std::mutex> lock( m_mutex );
                m_active.insert( pk );
            }
            m_logger->debug( "PK-{}: claimed", pk );
            boost::asio::post( pool, [this, pk] { Drive( pk ); } );
        }

        std::lock_guard<std::mutex> lock( m_mutex );
        return remaining || !m_active.empty();
    }

    void CalcJobRunner::Drive( int64_t calcjob_pk )
    {
        auto result = DriveCalcJob( calcjob_pk );
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            m_active.erase( calcjob_pk );
            switch ( result )
            {
                case DriveResult::kFinished:
                    ++m_summary.finished;
                    break;
                case DriveResult::kExcepted:
                    ++m_summary.excepted;
                    break;
                case DriveResult::kInterrupted:
                    ++m_summary.interrupted;
                    break;
                case DriveResult::kFailed:
                    ++m_summary.failed;
                    m_skipped.insert( calcjob_pk );
                    break;
            }
            m_slot_freed = true;
        }
        m_cv.notify_all();
    }

    CalcJobRunner::DriveResult CalcJobRunner::DriveCalcJob( int64_t calcjob_pk )
    {
        auto loaded = m_engine->Load( calcjob_pk );
        if ( !loaded )
        {
            m_logger->error( "PK-{}: cannot load: {}", calcjob_pk, loaded.error().message() );
            Release( calcjob_pk );
            return DriveResult::kFailed;
        }
        auto context      = std::move( loaded.value() );
        context.heartbeat = [this, calcjob_pk]
        {
            auto renewed = m_metadata->renewClaim( calcjob_pk, m_owner, m_options.claim_lease );
            if ( !renewed )
            {
                m_logger->warn( "PK-{}: cannot renew claim: {}", calcjob_pk, renewed.error().message() );
            }
        };

        Backoff backoff( m_options.retry_backoff_initial, 2.0, m_options.retry_backoff_max );
        size_t  attempts = 0;
        while ( !primitives::isTerminal( context.processing.step ) )
        {
            if ( m_stop.StopRequested() )
            {
                Release( calcjob_pk );
                return DriveResult::kInterrupted;
            }

            auto report = m_engine->RunStep( context, m_owner, m_stop, attempts < m_options.max_step_retries );
            switch ( report.outcome )
            {
                case StepOutcome::kAdvanced:
                    attempts = 0;
                    backoff.Reset();
                    context.heartbeat();
                    break;
                case StepOutcome::kRetry:
                {
                    ++attempts;
                    auto delay = backoff.Next();
                    m_logger->info( "PK-{}: retrying step {} in {} ms ({}/{})",
                                    calcjob_pk,
                                    primitives::toString( context.processing.step ),
                                    delay.count(),
                                    attempts,
                                    m_options.max_step_retries );
                    if ( !m_stop.WaitFor( delay ) )
                    {
                        Release( calcjob_pk );
                        return DriveResult::kInterrupted;
                    }
                    context.heartbeat();
                    break;
                }
                case StepOutcome::kExcepted:
                    return DriveResult::kExcepted;
                case StepOutcome::kStopped:
                    Release( calcjob_pk );
                    return DriveResult::kInterrupted;
                case StepOutcome::kLostClaim:
                    if ( report.error != storage::DatabaseError::CONCURRENCY_VIOLATION )
                    {
                        // the step cannot be recorded, leave the calcjob to a later run
                        Release( calcjob_pk );
                        return DriveResult::kFailed;
                    }
                    return DriveResult::kInterrupted;
            }
        }
        return context.processing.step == primitives::Step::kFinished ? DriveResult::kFinished
                                                                      : DriveResult::kExcepted;
    }

    void CalcJobRunner::Release( int64_t calcjob_pk )
    {
        auto released = m_metadata->releaseClaim( calcjob_pk, m_owner );
        if ( !released )
        {
            m_logger->warn( "PK-{}: cannot release claim: {}", calcjob_pk, released.error().message() );
        }
    }
}
