#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <string>

namespace Arachne {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, RedirectLimit, Other };

enum class HTTPCode { NetworkError = 0 };

enum class MaxCode { ClientError = 400 };

}  // namespace Http
}  // namespace Network
}  // namespace Arachne

namespace Arachne {

struct Response {
    std::string                        effective_url;
    long                               status_code = 0;
    std::string                        content_type;
    std::string                        body;
    std::map<std::string, std::string> headers;  // names lower-cased
    std::string                        error;
    bool                               success    = false;
    Network::Http::ErrorType           error_type = Network::Http::ErrorType::None;

    bool is_redirect() const {
        return status_code >= 300 && status_code < 400 && headers.count("location") > 0;
    }
};

namespace Network {
namespace Http {

// Single-request HTTP client. Redirects are returned to the caller, not followed.
// Failures never escape as exceptions; they come back as a Response with an
// ErrorType.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_user_agent(const std::string& user_agent) = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual void set_request_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Arachne
