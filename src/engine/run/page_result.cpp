#include "page_result.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Arachne {
namespace Engine {

std::string to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok:
            return "OK";
        case FetchStatus::Timeout:
            return "TIMEOUT";
        case FetchStatus::Connection:
            return "CONNECTION";
        case FetchStatus::RedirectLimit:
            return "REDIRECT_LIMIT";
        case FetchStatus::HttpError:
            return "HTTP_ERROR";
        case FetchStatus::DuplicateRedirect:
            return "DUPLICATE_REDIRECT";
        case FetchStatus::RobotsBlocked:
            return "ROBOTS_BLOCKED";
    }
    return "UNKNOWN";
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto        millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    std::time_t t      = std::chrono::system_clock::to_time_t(tp);
    std::tm     utc{};
    gmtime_r(&t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis.count() << 'Z';
    return out.str();
}

void to_json(nlohmann::json& j, const Redirect& redirect) {
    j = nlohmann::json{{"source", redirect.source},
                       {"destination", redirect.destination},
                       {"status", redirect.status_code}};
}

void to_json(nlohmann::json& j, const PageResult& result) {
    nlohmann::json links = nlohmann::json::array();
    for (const auto& link : result.links)
        links.push_back({{"url", link.url}, {"scope", Utils::Html::to_string(link.scope)}});

    j = nlohmann::json{{"run_id", result.run_id},
                       {"url", result.url},
                       {"final_url", result.final_url},
                       {"status", to_string(result.status)},
                       {"http_status", result.http_status},
                       {"depth", result.depth},
                       {"discovered_links", links},
                       {"content_type", result.content_type},
                       {"redirects", result.redirects},
                       {"headers", result.headers},
                       {"started_at", format_timestamp(result.started_at)},
                       {"finished_at", format_timestamp(result.finished_at)},
                       {"timestamp", format_timestamp(result.timestamp)}};
    if (!result.error.empty())
        j["error"] = result.error;
    if (result.content)
        j["content"] = *result.content;
}

void to_json(nlohmann::json& j, const RunSummary& summary) {
    j = nlohmann::json{{"run_id", summary.run_id},
                       {"seed", summary.seed},
                       {"state", to_string(summary.state)},
                       {"pages", summary.pages},
                       {"visited", summary.visited},
                       {"finished_at", format_timestamp(summary.finished_at)}};
}

}  // namespace Engine
}  // namespace Arachne
