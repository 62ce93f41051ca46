#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include <vector>
#include "http_client.hpp"

namespace Arachne {
namespace Network {
namespace Http {

// Blocking client for outbound deliveries. One instance per thread; the
// underlying easy handle is reused between requests.
class CurlClient {
public:
    CurlClient();
    ~CurlClient()                            = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void set_user_agent(const std::string& user_agent);
    void set_timeout(long seconds);

    Response post(const std::string& url, const std::string& body, const std::string& content_type);

private:
    struct Request {
        std::string              url;
        std::string              body;
        long                     timeout_seconds = 10;
        std::vector<std::string> extra_headers;
        std::string              user_agent;
    };

    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        user_agent_;
    long                               timeout_seconds_;

    Response perform(const Request& req);
    Response create_error_response(const std::string& msg) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Arachne
