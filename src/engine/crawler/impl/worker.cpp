#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../core/types/constants.hpp"
#include "../../../utils/html/link_extractor.hpp"
#include "../crawler.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Utils::Html::LinkExtractor;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 50;

// Settles a taken task exactly once: requeued explicitly, otherwise marked
// done when the guard goes out of scope.
class TaskGuard {
public:
    TaskGuard(UrlFrontier& frontier, const CrawlTask& task) : frontier_(frontier), task_(task) {
    }
    ~TaskGuard() {
        if (!settled_)
            frontier_.mark_done(task_);
    }

    TaskGuard(const TaskGuard&)            = delete;
    TaskGuard& operator=(const TaskGuard&) = delete;

    void requeue(std::chrono::milliseconds retry_after) {
        settled_ = true;
        frontier_.requeue(task_, retry_after);
    }

private:
    UrlFrontier&     frontier_;
    const CrawlTask& task_;
    bool             settled_ = false;
};
}  // namespace

boost::asio::awaitable<void> Crawler::worker_loop(RunPtr run) {
    try {
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        auto eligible = [this](const std::string& host) { return rate_limiter_.would_grant(host); };

        while (!run->cancelled) {
            auto task = run->frontier->take(eligible);

            if (!task) {
                auto snapshot = run->frontier->snapshot();
                if (snapshot.pending == 0 && snapshot.in_flight == 0)
                    break;
                transition(*run, snapshot.pending == 0 ? RunState::Draining : RunState::Running);

                auto wait = std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS);
                if (auto ready = run->frontier->next_ready_in()) {
                    auto ready_ms = std::chrono::ceil<std::chrono::milliseconds>(*ready);
                    wait          = std::clamp(ready_ms, std::chrono::milliseconds(1), wait);
                }
                timer.expires_after(wait);
                boost::system::error_code ec;
                co_await                  timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            transition(*run, RunState::Running);
            co_await process_url_task(run, std::move(*task));
        }
    } catch (const std::exception& e) {
        Logger::error("Run " + run->id + ": Worker Loop Exception: " + std::string(e.what()));
    }

    if (--run->active_workers == 0)
        finish_run(run);
}

boost::asio::awaitable<void> Crawler::process_url_task(RunPtr run, CrawlTask task) {
    TaskGuard settle(*run->frontier, task);

    if (!co_await is_url_allowed(*run, task)) {
        Logger::info("Blocked by robots.txt: " + task.url);
        co_return;
    }
    if (run->cancelled)
        co_return;

    auto gap      = co_await effective_delay(*run, task);
    auto decision = rate_limiter_.try_acquire(task.host, gap);
    if (!decision.granted) {
        Logger::debug("Politeness: " + task.host + " busy, retry in "
                      + std::to_string(decision.retry_after.count()) + "ms");
        settle.requeue(decision.retry_after);
        co_return;
    }

    {
        HostSlot   slot(rate_limiter_, task.host);
        PageResult result = co_await fetch_page(*run, task);
        emit(*run, std::move(result));
    }
}

boost::asio::awaitable<PageResult> Crawler::fetch_page(RunContext& run, const CrawlTask& task) {
    PageFetcher fetcher(*run.client,
                        run.config.ignore_redirects,
                        run.config.maximum_redirects,
                        [this, &run](const std::string& target) {
                            return check_redirect(run, target);
                        });

    PageResult result;
    result.run_id     = run.id;
    result.url        = task.url;
    result.depth      = task.depth;
    result.started_at = std::chrono::system_clock::now();

    Logger::info("Fetching: " + task.url + " (Depth " + std::to_string(task.depth) + ")");
    FetchOutcome outcome = co_await fetcher.fetch(task.url);

    result.finished_at  = std::chrono::system_clock::now();
    result.timestamp    = result.finished_at;
    result.final_url    = outcome.final_url;
    result.status       = outcome.status;
    result.http_status  = outcome.http_status;
    result.error        = outcome.error;
    result.content_type = outcome.content_type;
    result.headers      = std::move(outcome.headers);
    result.redirects    = std::move(outcome.redirects);

    if (!outcome.ok()) {
        Logger::warn("Failed: " + task.url + " - " + to_string(outcome.status) + " ("
                     + outcome.error + ")");
        co_return result;
    }

    if (is_html_content_type(result.content_type)) {
        result.links = LinkExtractor::classify(
            run.config.url, LinkExtractor::extract(result.final_url, outcome.body));
        expand_links(run, task, result.links);
    }
    if (run.config.keep_html_in_memory)
        result.content = std::move(outcome.body);

    co_return result;
}

void Crawler::expand_links(RunContext&                           run,
                           const CrawlTask&                      task,
                           const std::vector<Utils::Html::Link>& links) {
    if (run.cancelled || task.depth >= run.config.maximum_depth)
        return;

    int accepted = 0;
    for (const auto& link : links) {
        if (run.config.same_domain_only && !LinkExtractor::in_seed_domain(link.scope))
            continue;
        if (run.frontier->offer(link.url, task.depth + 1) == OfferResult::Accepted)
            accepted++;
    }
    Logger::debug("Queued " + std::to_string(accepted) + "/" + std::to_string(links.size())
                  + " links from " + task.url);
}

}  // namespace Engine
}  // namespace Arachne
