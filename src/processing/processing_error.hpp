#ifndef CALCFLOW_PROCESSING_ERROR_HPP
#define CALCFLOW_PROCESSING_ERROR_HPP

#include <string>
#include <system_error>

#include "outcome/outcome.hpp"

namespace calcflow::processing
{
    /**
     * @brief Kinds of step failures recorded on excepted calcjobs
     */
    enum class ProcessingError
    {
        TRANSFER_ERROR = 1,    ///< upload or download failure
        SUBMISSION_ERROR,      ///< the remote API rejected the job
        POLL_ERROR,            ///< job status cannot be obtained
        PARSE_ERROR,           ///< retrieved outputs do not match expectations
        NOT_FOUND,             ///< content object or metadata row missing
        CONCURRENCY_VIOLATION, ///< the calcjob is driven by someone else
        TEMPLATE_ERROR,        ///< the job script cannot be rendered
        INVALID_STEP,          ///< no transition from the current step
        STOPPED,               ///< a wait was interrupted by a stop request
    };

    /// @return name of the kind as written in exception texts, e.g. "TransferError"
    const char *KindName( ProcessingError kind );

    /**
     * @brief Exception text of an excepted calcjob: "<Kind>: <message>[ (<detail>)]"
     */
    std::string FormatException( const std::string &kind, const std::string &message, const std::string &detail );
}

CALCFLOW_DECLARE_ERROR( calcflow::processing, ProcessingError );

#endif
