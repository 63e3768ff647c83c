#ifndef CALCFLOW_REMOTE_GATEWAY_HPP
#define CALCFLOW_REMOTE_GATEWAY_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/processing.hpp"

namespace calcflow::remote
{
    /// one path of a remote listing
    struct RemoteEntry
    {
        std::string path;                ///< relative to the listed folder
        bool        is_directory = false;
        uint64_t    size         = 0;

        bool operator==( const RemoteEntry &rhs ) const
        {
            return path == rhs.path && is_directory == rhs.is_directory && size == rhs.size;
        }
    };

    /**
     * @brief Operations of the remote API on behalf of one client.
     * Implementations reuse one session for every call and are safe for
     * concurrent use. Errors are RemoteError codes.
     */
    class RemoteGateway
    {
    public:
        virtual ~RemoteGateway() = default;

        /// creates a remote directory and its missing parents
        virtual outcome::result<void> MakeDirectory( const std::string &remote_path ) = 0;

        /// writes @param bytes to @param remote_path, replacing any previous file
        virtual outcome::result<void> Upload( std::string_view bytes, const std::string &remote_path ) = 0;

        /// submits the script at @param script_path, @return the remote job id
        virtual outcome::result<std::string> Submit( const std::string &script_path ) = 0;

        /// @return current status of a job, RemoteError::JOB_UNKNOWN if the scheduler has no record of it
        virtual outcome::result<primitives::RemoteStatus> Poll( const std::string &job_id ) = 0;

        /// stops including @param job_id in status requests, for a poller that gave up on it
        virtual void Forget( const std::string &job_id ) = 0;

        /**
         * @brief Lists @param remote_dir recursively
         * @return the files and directories whose relative path matches one of
         * @param globs, sorted by path
         */
        virtual outcome::result<std::vector<RemoteEntry>> List( const std::string              &remote_dir,
                                                                const std::vector<std::string> &globs ) = 0;

        /// @return content of the remote file
        virtual outcome::result<std::string> Download( const std::string &remote_path ) = 0;
    };
}

#endif
