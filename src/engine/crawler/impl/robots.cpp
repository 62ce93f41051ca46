#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Arachne {
namespace Engine {

boost::asio::awaitable<bool> Crawler::is_url_allowed(RunContext& run, const CrawlTask& task) {
    if (run.config.ignore_robots_txt)
        co_return true;
    co_return co_await robots_.is_allowed(task.url, run.config.user_agent, *run.client);
}

// A redirect target gets the same robots.txt and dedup checks as a
// discovered link; it is claimed only once both pass.
boost::asio::awaitable<std::optional<HopRefusal>>
Crawler::check_redirect(RunContext& run, const std::string& target) {
    if (!run.config.ignore_robots_txt
        && !co_await robots_.is_allowed(target, run.config.user_agent, *run.client))
        co_return HopRefusal{FetchStatus::RobotsBlocked,
                             "Redirect target blocked by robots.txt: " + target};

    if (!run.frontier->claim(target))
        co_return HopRefusal{FetchStatus::DuplicateRedirect,
                             "Redirect target already crawled: " + target};

    co_return std::nullopt;
}

boost::asio::awaitable<std::chrono::milliseconds> Crawler::effective_delay(RunContext&      run,
                                                                           const CrawlTask& task) {
    std::chrono::milliseconds gap(run.config.crawl_delay_ms);
    if (run.config.ignore_robots_txt)
        co_return gap;

    auto robots_delay = co_await robots_.crawl_delay(task.url, run.config.user_agent, *run.client);
    if (robots_delay && *robots_delay > gap) {
        Logger::debug("Politeness: robots.txt crawl-delay " + std::to_string(robots_delay->count())
                      + "ms for " + task.host);
        gap = *robots_delay;
    }
    co_return gap;
}

}  // namespace Engine
}  // namespace Arachne
