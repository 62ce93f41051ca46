#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Arachne {
namespace Engine {

// A discovered URL bound to its discovery depth and owning run.
struct CrawlTask {
    std::string run_id;
    std::string url;   // normalized
    std::string host;  // Url::host_key of url
    int         depth = 0;
};

enum class OfferResult { Accepted, Duplicate, DepthExceeded, SchemeUnsupported, Malformed };

std::string to_string(OfferResult result);

/**
 * Per-run set of pending, in-flight and visited URLs.
 *
 * Pending tasks are queued per host and handed out round-robin across hosts,
 * so a host with a long queue cannot starve the others. All counters and
 * sets change together under one lock: a URL is never absent from every
 * set while its task is still alive.
 */
class UrlFrontier {
public:
    using Clock      = std::chrono::steady_clock;
    using HostFilter = std::function<bool(const std::string& host)>;

    struct Snapshot {
        std::size_t pending   = 0;
        std::size_t in_flight = 0;
        std::size_t visited   = 0;
        std::size_t known     = 0;
    };

    UrlFrontier(std::string run_id, int max_depth);

    OfferResult offer(const std::string& url, int depth);

    // Hands out the next task from a host that is not deferred and passes
    // `eligible`. The returned task already counts as in flight.
    std::optional<CrawlTask> take(const HostFilter& eligible = {});

    // Returns an in-flight task to the front of its host queue and defers the
    // host for `retry_after`.
    void requeue(const CrawlTask& task, std::chrono::milliseconds retry_after);
    void mark_done(const CrawlTask& task);

    // Records a URL reached other than by offer (a redirect target) as known.
    // Returns false if it was known already.
    bool claim(const std::string& url);

    // Drops every pending task. Used on cancellation.
    std::size_t clear_pending();

    Snapshot snapshot() const;
    bool     drained() const;

    // Time until the earliest deferred host becomes ready, if any host is deferred.
    std::optional<Clock::duration> next_ready_in() const;

    const std::string& run_id() const {
        return run_id_;
    }
    int max_depth() const {
        return max_depth_;
    }

private:
    struct HostQueue {
        std::deque<CrawlTask> tasks;
        Clock::time_point     ready_at{};
    };

    void push_task(CrawlTask task, bool front);

    const std::string run_id_;
    const int         max_depth_;

    mutable std::mutex                         mutex_;
    std::unordered_set<std::string>            known_;
    std::unordered_set<std::string>            visited_;
    std::unordered_map<std::string, HostQueue> hosts_;
    std::deque<std::string>                    rotation_;
    std::size_t                                pending_   = 0;
    std::size_t                                in_flight_ = 0;
};

}  // namespace Engine
}  // namespace Arachne
