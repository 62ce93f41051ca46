#include "page_fetcher.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;
using Arachne::Network::Http::ErrorType;
using Arachne::Network::Http::HttpClient;
using Arachne::Utils::Url;

PageFetcher::PageFetcher(HttpClient& client,
                         bool        ignore_redirects,
                         int         max_redirects,
                         HopCheck    hop_check)
    : client_(client),
      ignore_redirects_(ignore_redirects),
      max_redirects_(max_redirects),
      hop_check_(std::move(hop_check)) {
}

FetchStatus PageFetcher::classify(const Response& response) {
    switch (response.error_type) {
        case ErrorType::Timeout:
            return FetchStatus::Timeout;
        case ErrorType::RedirectLimit:
            return FetchStatus::RedirectLimit;
        case ErrorType::Network:
        case ErrorType::Other:
            return FetchStatus::Connection;
        case ErrorType::None:
            break;
    }
    if (response.status_code == 0)
        return FetchStatus::Connection;
    if (response.status_code >= 400)
        return FetchStatus::HttpError;
    return FetchStatus::Ok;
}

boost::asio::awaitable<FetchOutcome> PageFetcher::fetch(const std::string& url) {
    FetchOutcome outcome;
    std::string  current = url;

    for (int hops = 0;; ++hops) {
        Response res;
        try {
            res = co_await client_.get(current);
        } catch (const std::exception& e) {
            res.effective_url = current;
            res.error         = e.what();
            res.error_type    = ErrorType::Other;
        }

        outcome.final_url    = current;
        outcome.http_status  = res.status_code;
        outcome.content_type = res.content_type;
        outcome.headers      = res.headers;

        if (res.is_redirect()) {
            std::string target = Url::resolve(current, res.headers.at("location"));
            if (ignore_redirects_ || hops >= max_redirects_) {
                outcome.status = FetchStatus::RedirectLimit;
                outcome.error  = ignore_redirects_
                                     ? "Redirect to " + target + " not followed"
                                     : "Exceeded " + std::to_string(max_redirects_) + " redirects";
                co_return outcome;
            }
            if (target.empty() || !Url::is_http_scheme(Url::parse(target).scheme)) {
                outcome.status = FetchStatus::Connection;
                outcome.error  = "Unsupported redirect target: " + res.headers.at("location");
                co_return outcome;
            }

            outcome.redirects.push_back(Redirect{current, target, res.status_code});
            if (hop_check_) {
                if (auto refusal = co_await hop_check_(target)) {
                    outcome.status = refusal->status;
                    outcome.error  = refusal->reason;
                    co_return outcome;
                }
            }
            Logger::debug("Redirect " + std::to_string(res.status_code) + ": " + current + " -> "
                          + target);
            current = target;
            continue;
        }

        outcome.status = classify(res);
        if (outcome.ok()) {
            outcome.body = std::move(res.body);
        }
        else {
            outcome.error = res.error.empty() ? "HTTP " + std::to_string(res.status_code)
                                              : res.error;
        }
        co_return outcome;
    }
}

}  // namespace Engine
}  // namespace Arachne
