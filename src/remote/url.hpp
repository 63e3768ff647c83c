#ifndef CALCFLOW_REMOTE_URL_HPP
#define CALCFLOW_REMOTE_URL_HPP

#include <string>
#include <utility>
#include <vector>

#include "outcome/outcome.hpp"

namespace calcflow::remote
{
    /// query parameters, kept in the order given
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief An absolute http(s) URL split into what a session needs
     */
    struct Url
    {
        std::string scheme;    ///< "http" or "https"
        std::string host;
        std::string port;      ///< defaults to the scheme port
        std::string base_path; ///< without trailing '/', may be empty

        bool isTls() const
        {
            return scheme == "https";
        }

        /// @return request target for @param path below the base path
        std::string target( const std::string &path, const QueryParams &query = {} ) const;

        /// @return scheme://host:port, the identity of a connection
        std::string origin() const;
    };

    /**
     * @brief Parses an absolute http or https URL
     * @return RemoteError::INVALID_URL otherwise
     */
    outcome::result<Url> parseUrl( const std::string &url );

    /// percent encodes everything but RFC 3986 unreserved characters
    std::string urlEncode( const std::string &value );

    /// application/x-www-form-urlencoded body
    std::string formEncode( const QueryParams &fields );
}

#endif
