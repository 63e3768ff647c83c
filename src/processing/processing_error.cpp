#include "processing/processing_error.hpp"

CALCFLOW_DEFINE_ERROR_CATEGORY( calcflow::processing, ProcessingError, e )
{
    using E = calcflow::processing::ProcessingError;
    switch ( e )
    {
        case E::TRANSFER_ERROR:
            return "transfer failed";
        case E::SUBMISSION_ERROR:
            return "submission rejected";
        case E::POLL_ERROR:
            return "job status unavailable";
        case E::PARSE_ERROR:
            return "outputs do not match expectations";
        case E::NOT_FOUND:
            return "not found";
        case E::CONCURRENCY_VIOLATION:
            return "calcjob is claimed by another driver";
        case E::TEMPLATE_ERROR:
            return "job script cannot be rendered";
        case E::INVALID_STEP:
            return "no transition from this step";
        case E::STOPPED:
            return "stopped";
    }
    return "unknown processing error";
}

namespace calcflow::processing
{
    const char *KindName( ProcessingError kind )
    {
        switch ( kind )
        {
            case ProcessingError::TRANSFER_ERROR:
                return "TransferError";
            case ProcessingError::SUBMISSION_ERROR:
                return "SubmissionError";
            case ProcessingError::POLL_ERROR:
                return "PollError";
            case ProcessingError::PARSE_ERROR:
                return "ParseError";
            case ProcessingError::NOT_FOUND:
                return "NotFound";
            case ProcessingError::CONCURRENCY_VIOLATION:
                return "ConcurrencyViolation";
            case ProcessingError::TEMPLATE_ERROR:
                return "TemplateError";
            case ProcessingError::INVALID_STEP:
                return "InvalidStep";
            case ProcessingError::STOPPED:
                return "Stopped";
        }
        return "ProcessingError";
    }

    std::string FormatException( const std::string &kind, const std::string &message, const std::string &detail )
    {
        std::string text = kind + ": " + message;
        if ( !detail.empty() )
        {
            text += " (" + detail + ")";
        }
        return text;
    }
}
