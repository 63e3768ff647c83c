#ifndef CALCFLOW_PROCESSING_ENGINE_HPP
#define CALCFLOW_PROCESSING_ENGINE_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "base/logger.hpp"
#include "processing/backoff.hpp"
#include "processing/step_executor.hpp"
#include "storage/metadata/metadata_store.hpp"

namespace calcflow::processing
{
    /// what happened to a calcjob during one step
    enum class StepOutcome
    {
        kAdvanced,  ///< moved to the next step
        kRetry,     ///< transient failure, the step may be run again
        kExcepted,  ///< failure captured, the calcjob is terminal
        kStopped,   ///< interrupted by a stop request, step unchanged
        kLostClaim, ///< another driver owns the calcjob now
    };

    struct StepReport
    {
        StepOutcome     outcome;
        std::error_code error;
    };

    /**
     * @brief The calcjob state machine. Runs the action bound to the current
     * step, persists the transition it leads to and reports it.
     */
    class ProcessingEngine
    {
    public:
        using StepAction     = std::function<outcome::result<void>( StepContext &, const StopSource & )>;
        using TransitionSink = std::function<void( int64_t calcjob_pk, primitives::Step from, primitives::Step to )>;

        struct Transition
        {
            StepAction       action;
            primitives::Step next;
        };

        ProcessingEngine( std::shared_ptr<storage::MetadataStore> metadata, std::shared_ptr<StepExecutor> executor );

        /// loads the calcjob with its code, client and processing record
        outcome::result<StepContext> Load( int64_t calcjob_pk ) const;

        /**
         * @brief Executes the current step of @param context and persists the outcome
         * @param owner claim held on the calcjob
         * @param may_retry whether a transient failure may be left for a retry
         * instead of excepting the calcjob
         */
        StepReport RunStep( StepContext &context, const std::string &owner, const StopSource &stop, bool may_retry );

        /// observer of every persisted transition
        void SetTransitionSink( TransitionSink sink );

        /// the step table, created to finished
        const std::map<primitives::Step, Transition> &Transitions() const
        {
            return m_transitions;
        }

    private:
        /// records @param error as the exception of the calcjob
        StepReport Except( StepContext &context, const std::string &owner, const std::error_code &error );

        StepReport Persist( StepContext &context, const primitives::Processing &updated, const std::string &owner );

        std::string DescribeFailure( const StepContext &context, const std::error_code &error ) const;

        std::shared_ptr<storage::MetadataStore>    m_metadata;
        std::shared_ptr<StepExecutor>              m_executor;
        std::map<primitives::Step, Transition>     m_transitions;

        mutable std::mutex m_sink_mutex;
        TransitionSink     m_transition_sink;

        base::Logger m_logger = base::createLogger( "ProcessingEngine" );
    };

    /// @return whether a step failure is worth running the step again
    bool IsTransientFailure( const std::error_code &error );

    /// @return kind a failure of @param step is recorded as
    std::string FailureKind( primitives::Step step, const std::error_code &error );
}

#endif
