#include "remote/remote_error.hpp"

CALCFLOW_DEFINE_ERROR_CATEGORY( calcflow::remote, RemoteError, e )
{
    using E = calcflow::remote::RemoteError;
    switch ( e )
    {
        case E::INVALID_URL:
            return "Invalid URL";
        case E::CONNECTION_FAILED:
            return "Connection failed";
        case E::TIMEOUT:
            return "Request timed out";
        case E::AUTH_EXPIRED:
            return "Access token expired";
        case E::AUTH_FAILED:
            return "Authentication failed";
        case E::CLIENT_ERROR:
            return "Request rejected by the remote API";
        case E::NOT_FOUND:
            return "Remote resource not found";
        case E::SERVER_ERROR:
            return "Remote server error";
        case E::MALFORMED_RESPONSE:
            return "Malformed response";
        case E::JOB_UNKNOWN:
            return "Job unknown to the remote scheduler";
        case E::LISTING_TOO_LARGE:
            return "Remote listing exceeds the allowed number of calls";
    }
    return "Unknown remote error";
}

namespace calcflow::remote
{
    RemoteError errorForStatus( unsigned status )
    {
        if ( status == 401 )
        {
            return RemoteError::AUTH_EXPIRED;
        }
        if ( status == 403 )
        {
            return RemoteError::AUTH_FAILED;
        }
        if ( status == 404 )
        {
            return RemoteError::NOT_FOUND;
        }
        if ( status == 408 || status == 429 )
        {
            return RemoteError::TIMEOUT;
        }
        if ( status >= 500 )
        {
            return RemoteError::SERVER_ERROR;
        }
        return RemoteError::CLIENT_ERROR;
    }

    bool isTransient( const std::error_code &ec )
    {
        return ec == RemoteError::TIMEOUT || ec == RemoteError::SERVER_ERROR || ec == RemoteError::CONNECTION_FAILED;
    }

    bool isAuthError( const std::error_code &ec )
    {
        return ec == RemoteError::AUTH_EXPIRED;
    }
}
