#ifndef CALCFLOW_REMOTE_ERROR_HPP
#define CALCFLOW_REMOTE_ERROR_HPP

#include <system_error>

#include "outcome/outcome.hpp"

namespace calcflow::remote
{
    /**
     * @brief Failures of the remote API and of the transport below it
     */
    enum class RemoteError
    {
        INVALID_URL = 1,
        CONNECTION_FAILED,
        TIMEOUT,
        AUTH_EXPIRED,       ///< 401 with a token that used to be valid
        AUTH_FAILED,        ///< the token endpoint rejected the credentials
        CLIENT_ERROR,       ///< 4xx other than 401 and 404
        NOT_FOUND,          ///< 404
        SERVER_ERROR,       ///< 5xx
        MALFORMED_RESPONSE,
        JOB_UNKNOWN,        ///< the scheduler does not know the job id
        LISTING_TOO_LARGE,  ///< a recursive listing needs more calls than allowed
    };

    /// @return error for a non 2xx HTTP status
    RemoteError errorForStatus( unsigned status );

    /// timeouts, 5xx and lost connections, worth retrying as they are
    bool isTransient( const std::error_code &ec );

    /// errors solved by refreshing the access token
    bool isAuthError( const std::error_code &ec );
}

CALCFLOW_DECLARE_ERROR( calcflow::remote, RemoteError );

#endif
