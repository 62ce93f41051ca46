#pragma once
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "../../utils/html/link_extractor.hpp"
#include "run_state.hpp"

namespace Arachne {
namespace Engine {

enum class FetchStatus {
    Ok,
    Timeout,
    Connection,
    RedirectLimit,
    HttpError,
    DuplicateRedirect,  // redirect target already known to the run
    RobotsBlocked       // redirect target disallowed by robots.txt
};

std::string to_string(FetchStatus status);

struct Redirect {
    std::string source;
    std::string destination;
    long        status_code = 0;
};

// One fetched page as reported to the result sink. Immutable once emitted.
struct PageResult {
    using Clock = std::chrono::system_clock;

    std::string                        run_id;
    std::string                        url;
    std::string                        final_url;
    FetchStatus                        status      = FetchStatus::Ok;
    long                               http_status = 0;
    std::string                        error;
    int                                depth = 0;
    std::vector<Utils::Html::Link>     links;
    std::optional<std::string>         content;
    std::string                        content_type;
    std::vector<Redirect>              redirects;
    std::map<std::string, std::string> headers;
    Clock::time_point                  started_at;
    Clock::time_point                  finished_at;
    Clock::time_point                  timestamp;

    bool ok() const {
        return status == FetchStatus::Ok;
    }
};

// Final notice for a run, delivered after every PageResult of that run.
struct RunSummary {
    std::string                           run_id;
    std::string                           seed;
    RunState                              state   = RunState::Completed;
    std::size_t                           pages   = 0;
    std::size_t                           visited = 0;
    std::chrono::system_clock::time_point finished_at;
};

std::string format_timestamp(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json& j, const Redirect& redirect);
void to_json(nlohmann::json& j, const PageResult& result);
void to_json(nlohmann::json& j, const RunSummary& summary);

}  // namespace Engine
}  // namespace Arachne
