#ifndef CALCFLOW_PROCESSING_CALCJOB_RUNNER_HPP
#define CALCFLOW_PROCESSING_CALCJOB_RUNNER_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "base/logger.hpp"
#include "processing/backoff.hpp"
#include "processing/processing_engine.hpp"
#include "storage/metadata/metadata_store.hpp"

namespace calcflow::processing
{
    struct RunnerOptions
    {
        size_t                    concurrency      = 4;
        size_t                    max_step_retries = 3;
        std::chrono::milliseconds retry_backoff_initial{ 1000 };
        std::chrono::milliseconds retry_backoff_max{ 60000 };
        std::chrono::milliseconds selection_interval{ 2000 };
        std::chrono::milliseconds claim_lease{ 300000 };
        std::string               owner; ///< claim owner name, a fresh one when empty
    };

    /// what became of the calcjobs driven during a run
    struct RunSummary
    {
        size_t finished    = 0;
        size_t excepted    = 0;
        size_t interrupted = 0; ///< stopped, or taken over by another runner
        size_t failed      = 0; ///< could not be loaded
    };

    /**
     * @brief Drives playing calcjobs to a terminal step, at most
     * RunnerOptions::concurrency at a time. Every driven calcjob is claimed
     * first, so several runners may share one project.
     */
    class CalcJobRunner
    {
    public:
        CalcJobRunner( std::shared_ptr<storage::MetadataStore> metadata,
                       std::shared_ptr<ProcessingEngine>       engine,
                       RunnerOptions                           options );

        /// runs until no calcjob is playing anymore, or Stop() is called
        RunSummary RunUntilDone();

        /// runs until Stop() is called, picking up calcjobs as they are added
        RunSummary Serve();

        /**
         * @brief Asks the run to end. Steps in progress complete, waits are
         * cut short and the calcjobs keep their current step. Safe from any thread.
         */
        void Stop();

        bool StopRequested() const
        {
            return m_stop.StopRequested();
        }

        const std::string &Owner() const
        {
            return m_owner;
        }

    private:
        enum class DriveResult
        {
            kFinished,
            kExcepted,
            kInterrupted,
            kFailed,
        };

        RunSummary Run( bool serve );

        /**
         * @brief Claims playing calcjobs into the free slots
         * @return whether any calcjob is still playing or driven
         */
        outcome::result<bool> Select( boost::asio::thread_pool &pool );

        void        Drive( int64_t calcjob_pk );
        DriveResult DriveCalcJob( int64_t calcjob_pk );
        void        Release( int64_t calcjob_pk );

        std::shared_ptr<storage::MetadataStore> m_metadata;
        std::shared_ptr<ProcessingEngine>       m_engine;
        RunnerOptions                           m_options;
        std::string                             m_owner;
        StopSource                              m_stop;

        std::mutex              m_mutex;
        std::condition_variable m_cv;
        std::set<int64_t>       m_active;  ///< claimed and being driven
        std::set<int64_t>       m_skipped; ///< failed to load during this run
        bool                    m_slot_freed = false;
        RunSummary              m_summary;

        base::Logger m_logger = base::createLogger( "CalcJobRunner" );
    };
}

#endif
