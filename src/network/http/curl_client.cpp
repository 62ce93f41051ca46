#include "curl_client.hpp"
#include <string>
#include <string_view>
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Arachne {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type";

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorType::Timeout;
        case CURLE_TOO_MANY_REDIRECTS:
            return ErrorType::RedirectLimit;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
            return ErrorType::Network;
        default:
            return ErrorType::Other;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*  ctx   = static_cast<CurlClient::RequestContext*>(userp);
    size_t total = size * nitems;
    if (!ctx || !ctx->content_type)
        return total;

    std::string header(buffer, total);
    auto        colon = header.find(':');
    if (colon == std::string::npos)
        return total;

    if (Arachne::Utils::Text::iequals(Arachne::Utils::Text::trim(header.substr(0, colon)),
                                      std::string(CONTENT_TYPE_HEADER))) {
        *ctx->content_type = Arachne::Utils::Text::trim(header.substr(colon + 1));
    }
    return total;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      user_agent_(Arachne::Core::Constants::USER_AGENT),
      timeout_seconds_(Arachne::Core::Constants::REQUEST_TIMEOUT_SECONDS) {
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void CurlClient::set_timeout(long seconds) {
    timeout_seconds_ = seconds;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Other;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

Response CurlClient::post(const std::string& url,
                          const std::string& body,
                          const std::string& content_type) {
    Request req;
    req.url             = url;
    req.body            = body;
    req.timeout_seconds = timeout_seconds_;
    req.user_agent      = user_agent_;
    req.extra_headers.push_back("Content-Type: " + content_type);
    return perform(req);
}

Response CurlClient::perform(const Request& req) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    CURL*          curl = curl_.get();
    std::string    body_buffer;
    std::string    content_type;
    RequestContext ctx{&body_buffer, &content_type};

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_seconds);
    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());

    curl_slist* raw = nullptr;
    for (const auto& h : req.extra_headers)
        raw = curl_slist_append(raw, h.c_str());
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw);
    if (raw)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, raw);

    CURLcode res           = curl_easy_perform(curl);
    long     response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

    Response response;
    response.effective_url = req.url;
    response.content_type  = content_type;

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.status_code = response_code;
    response.body        = std::move(body_buffer);
    response.success     = (response.status_code >= 200
                        && response.status_code < static_cast<long>(MaxCode::ClientError));
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Arachne
