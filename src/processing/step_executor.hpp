#ifndef CALCFLOW_PROCESSING_STEP_EXECUTOR_HPP
#define CALCFLOW_PROCESSING_STEP_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/calcjob.hpp"
#include "primitives/client.hpp"
#include "primitives/code.hpp"
#include "primitives/processing.hpp"
#include "processing/backoff.hpp"
#include "processing/output_classifier.hpp"
#include "remote/gateway_registry.hpp"
#include "storage/content/content_store.hpp"

namespace calcflow::processing
{
    /**
     * @brief Everything a step needs, loaded once per driven calcjob.
     * Steps only mutate the working copy of the processing record, the engine
     * persists it.
     */
    struct StepContext
    {
        primitives::CalcJob    calcjob;
        primitives::Code       code;
        primitives::Client     client;
        primitives::Processing processing;
        std::function<void()>  heartbeat; ///< called between polls, keeps the claim alive
        std::string            message;   ///< overrides the error message of a failure
        std::string            detail;    ///< offending item of a failure
    };

    struct ExecutorOptions
    {
        std::chrono::milliseconds poll_initial_interval{ 1000 };
        double                    poll_backoff_factor = 2.0;
        std::chrono::milliseconds poll_max_interval{ 60000 };
    };

    /**
     * @brief The actions of the calcjob steps. Each action is safe to repeat:
     * a step interrupted by a crash is executed again from scratch.
     */
    class StepExecutor
    {
    public:
        StepExecutor( std::shared_ptr<storage::ContentStore>    objects,
                      std::shared_ptr<remote::GatewayRegistry>  gateways,
                      std::shared_ptr<const OutputClassifier>   classifier,
                      ExecutorOptions                           options );

        /// renders the job script and stores it, no network calls
        outcome::result<void> Prepare( StepContext &context );

        /// creates the remote folder and uploads the job script with the code and calcjob files
        outcome::result<void> Upload( StepContext &context );

        /// submits the job script, recording the remote job id
        outcome::result<void> Submit( StepContext &context );

        /// polls the remote job with a growing interval until it ends, recording its final status
        outcome::result<void> Poll( StepContext &context, const StopSource &stop );

        /// retrieves the outputs matching the download globs into the content store
        outcome::result<void> Download( StepContext &context );

        /// classifies the retrieved outputs, ProcessingError::PARSE_ERROR if the calcjob failed
        outcome::result<void> Parse( StepContext &context );

    private:
        outcome::result<std::string>                            Render( StepContext &context ) const;
        outcome::result<std::shared_ptr<remote::RemoteGateway>> Gateway( const StepContext &context );

        void Report( const StepContext &context, const std::string &message ) const;

        std::shared_ptr<storage::ContentStore>   m_objects;
        std::shared_ptr<remote::GatewayRegistry> m_gateways;
        std::shared_ptr<const OutputClassifier>  m_classifier;
        ExecutorOptions                          m_options;

        base::Logger m_logger = base::createLogger( "StepExecutor" );
    };

    /// @return extension of a file name usable in an object key, or empty
    std::string ObjectExtension( const std::string &path );
}

#endif
