#ifndef CALCFLOW_PROCESSING_OUTPUT_CLASSIFIER_HPP
#define CALCFLOW_PROCESSING_OUTPUT_CLASSIFIER_HPP

#include <string>

#include "primitives/calcjob.hpp"
#include "primitives/processing.hpp"
#include "storage/content/content_store.hpp"

namespace calcflow::processing
{
    /// outcome of the parse step
    struct Verdict
    {
        bool        success = true;
        std::string message;  ///< why the calcjob failed
        std::string detail;   ///< offending path or state

        static Verdict Success()
        {
            return {};
        }

        static Verdict Failure( std::string message, std::string detail = {} )
        {
            return { false, std::move( message ), std::move( detail ) };
        }
    };

    /**
     * @brief Decides from the retrieved outputs whether a calcjob succeeded.
     * Never talks to the network.
     */
    class OutputClassifier
    {
    public:
        virtual ~OutputClassifier() = default;

        virtual Verdict Classify( const primitives::CalcJob    &calcjob,
                                  const primitives::Processing &processing,
                                  const storage::ContentStore  &objects ) const = 0;
    };

    /**
     * @brief The remote job must have completed and every download glob must
     * have matched at least one retrieved path
     */
    class DefaultOutputClassifier : public OutputClassifier
    {
    public:
        Verdict Classify( const primitives::CalcJob    &calcjob,
                          const primitives::Processing &processing,
                          const storage::ContentStore  &objects ) const override;
    };
}

#endif
