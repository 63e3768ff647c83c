#ifndef CALCFLOW_REMOTE_HTTP_TRANSPORT_HPP
#define CALCFLOW_REMOTE_HTTP_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "outcome/outcome.hpp"
#include "remote/url.hpp"

namespace calcflow::remote
{
    struct HttpRequest
    {
        std::string                        method = "GET";
        std::string                        target;  ///< origin-form: path and query
        std::map<std::string, std::string> headers;
        std::string                        body;
        bool                               chunked = false; ///< send the body with chunked transfer encoding
    };

    struct HttpResponse
    {
        unsigned    status = 0;
        std::string content_type;
        std::string body;

        bool ok() const
        {
            return status >= 200 && status < 300;
        }
    };

    /**
     * @brief One logical connection to an origin, safe for concurrent use.
     * Returns transport failures only, any HTTP status is a response.
     */
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual outcome::result<HttpResponse> Send( const HttpRequest &request, std::chrono::milliseconds timeout ) = 0;
    };

    /// creates the transport of an origin
    using TransportFactory = std::function<outcome::result<std::shared_ptr<HttpTransport>>( const Url &url )>;
}

#endif
