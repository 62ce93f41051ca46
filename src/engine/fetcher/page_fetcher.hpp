#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../../network/http/http_client.hpp"
#include "../run/page_result.hpp"

namespace Arachne {
namespace Engine {

// Terminal outcome of fetching one URL, redirects already followed.
struct FetchOutcome {
    FetchStatus                        status = FetchStatus::Ok;
    std::string                        final_url;
    long                               http_status = 0;
    std::string                        content_type;
    std::string                        body;
    std::map<std::string, std::string> headers;
    std::vector<Redirect>              redirects;
    std::string                        error;

    bool ok() const {
        return status == FetchStatus::Ok;
    }
};

// Why a redirect hop was not followed.
struct HopRefusal {
    FetchStatus status = FetchStatus::DuplicateRedirect;
    std::string reason;
};

// Consulted before each redirect target is requested; a refusal ends the fetch.
using HopCheck =
    std::function<boost::asio::awaitable<std::optional<HopRefusal>>(const std::string& target)>;

/**
 * Fetches a URL over an HttpClient and follows redirects itself, so each hop
 * can be recorded and the hop limit enforced. Never throws; every failure is
 * classified into a FetchStatus.
 */
class PageFetcher {
public:
    PageFetcher(Arachne::Network::Http::HttpClient& client,
                bool                                ignore_redirects,
                int                                 max_redirects,
                HopCheck                            hop_check = {});

    boost::asio::awaitable<FetchOutcome> fetch(const std::string& url);

    static FetchStatus classify(const Response& response);

private:
    Arachne::Network::Http::HttpClient& client_;
    bool                                ignore_redirects_;
    int                                 max_redirects_;
    HopCheck                            hop_check_;
};

}  // namespace Engine
}  // namespace Arachne
