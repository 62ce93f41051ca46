#include "robots_resolver.hpp"
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;
using Arachne::Network::Http::HttpClient;
using Arachne::Utils::RobotsTxt;
using Arachne::Utils::Url;

namespace {
constexpr int         MAX_ROBOTS_REDIRECTS = 5;
constexpr const char* ROBOTS_PATH          = "/robots.txt";

RobotsResolver::Rules allow_all_rules() {
    static const RobotsResolver::Rules rules =
        std::make_shared<const RobotsTxt>(RobotsTxt::allow_all());
    return rules;
}
}  // namespace

RobotsResolver::Rules RobotsResolver::cached(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = entries_.find(origin);
    return it != entries_.end() ? it->second->rules : nullptr;
}

boost::asio::awaitable<RobotsResolver::Rules> RobotsResolver::rules_for(const std::string& url,
                                                                        HttpClient& client) {
    std::string origin = Url::origin(url);
    if (origin.empty())
        co_return allow_all_rules();

    std::shared_ptr<Entry> entry;
    bool                   owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto&                       slot = entries_[origin];
        if (!slot) {
            slot  = std::make_shared<Entry>();
            owner = true;
        }
        entry = slot;
        if (entry->rules)
            co_return entry->rules;
    }

    if (!owner) {
        co_await async_wait_ready(entry, boost::asio::use_awaitable);
        std::lock_guard<std::mutex> lock(mutex_);
        co_return entry->rules;
    }

    Rules rules = co_await fetch(origin, client);

    std::vector<std::function<void()>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->rules = rules;
        waiters.swap(entry->waiters);
    }
    for (auto& resume : waiters)
        resume();
    co_return rules;
}

boost::asio::awaitable<RobotsResolver::Rules> RobotsResolver::fetch(const std::string& origin,
                                                                    HttpClient&        client) {
    std::string robots_url = origin + ROBOTS_PATH;
    fetch_count_++;
    Logger::debug("Fetching robots.txt: " + robots_url);

    try {
        for (int hop = 0; hop <= MAX_ROBOTS_REDIRECTS; ++hop) {
            Response res = co_await client.get(robots_url);

            if (res.is_redirect() && hop < MAX_ROBOTS_REDIRECTS) {
                std::string next = Url::resolve(robots_url, res.headers.at("location"));
                if (next.empty() || !Url::is_http_scheme(Url::parse(next).scheme))
                    break;
                robots_url = next;
                continue;
            }

            if (res.status_code == 200) {
                co_return std::make_shared<const RobotsTxt>(RobotsTxt::parse(res.body));
            }

            if (res.error_type != Arachne::Network::Http::ErrorType::None)
                Logger::warn("robots.txt unavailable for " + origin + ": " + res.error);
            else
                Logger::debug("No robots.txt for " + origin + " (HTTP "
                              + std::to_string(res.status_code) + ")");
            co_return allow_all_rules();
        }
        Logger::warn("robots.txt redirect loop for " + origin);
    } catch (const std::exception& e) {
        Logger::warn("robots.txt fetch failed for " + origin + ": " + e.what());
    }
    co_return allow_all_rules();
}

boost::asio::awaitable<bool> RobotsResolver::is_allowed(const std::string& url,
                                                        const std::string& user_agent,
                                                        HttpClient&        client) {
    auto parsed = Url::parse(url);
    if (parsed.host.empty() || parsed.path == ROBOTS_PATH)
        co_return true;

    Rules rules = co_await rules_for(url, client);

    std::string path = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        path += "?" + parsed.query;
    co_return rules->is_allowed(user_agent, path);
}

boost::asio::awaitable<std::optional<std::chrono::milliseconds>>
RobotsResolver::crawl_delay(const std::string& url,
                            const std::string& user_agent,
                            HttpClient&        client) {
    Rules rules = co_await rules_for(url, client);
    co_return rules->crawl_delay(user_agent);
}

}  // namespace Engine
}  // namespace Arachne
