#include "url_frontier.hpp"
#include <algorithm>
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Utils::Url;

std::string to_string(OfferResult result) {
    switch (result) {
        case OfferResult::Accepted:
            return "ACCEPTED";
        case OfferResult::Duplicate:
            return "DUPLICATE";
        case OfferResult::DepthExceeded:
            return "DEPTH_EXCEEDED";
        case OfferResult::SchemeUnsupported:
            return "SCHEME_UNSUPPORTED";
        case OfferResult::Malformed:
            return "MALFORMED";
    }
    return "UNKNOWN";
}

UrlFrontier::UrlFrontier(std::string run_id, int max_depth)
    : run_id_(std::move(run_id)), max_depth_(max_depth) {
}

OfferResult UrlFrontier::offer(const std::string& url, int depth) {
    auto parsed = Url::parse(url);
    if (parsed.scheme.empty() || depth < 0)
        return OfferResult::Malformed;
    if (!Url::is_http_scheme(parsed.scheme))
        return OfferResult::SchemeUnsupported;
    if (depth > max_depth_)
        return OfferResult::DepthExceeded;

    std::string normalized = Url::normalize(url);
    if (normalized.empty())
        return OfferResult::Malformed;

    CrawlTask task{run_id_, normalized, Url::host_key(normalized), depth};

    std::lock_guard<std::mutex> lock(mutex_);
    if (!known_.insert(normalized).second)
        return OfferResult::Duplicate;

    push_task(std::move(task), false);
    ++pending_;
    return OfferResult::Accepted;
}

void UrlFrontier::push_task(CrawlTask task, bool front) {
    auto& queue     = hosts_[task.host];
    bool  was_empty = queue.tasks.empty();
    if (was_empty)
        rotation_.push_back(task.host);

    if (front)
        queue.tasks.push_front(std::move(task));
    else
        queue.tasks.push_back(std::move(task));
}

std::optional<CrawlTask> UrlFrontier::take(const HostFilter& eligible) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        now = Clock::now();

    for (std::size_t i = 0, n = rotation_.size(); i < n; ++i) {
        std::string host = std::move(rotation_.front());
        rotation_.pop_front();

        auto it = hosts_.find(host);
        if (it == hosts_.end() || it->second.tasks.empty()) {
            if (it != hosts_.end())
                hosts_.erase(it);
            continue;
        }

        HostQueue& queue = it->second;
        if (queue.ready_at > now || (eligible && !eligible(host))) {
            rotation_.push_back(std::move(host));
            continue;
        }

        CrawlTask task = std::move(queue.tasks.front());
        queue.tasks.pop_front();
        if (queue.tasks.empty())
            hosts_.erase(it);
        else
            rotation_.push_back(std::move(host));

        --pending_;
        ++in_flight_;
        return task;
    }
    return std::nullopt;
}

void UrlFrontier::requeue(const CrawlTask& task, std::chrono::milliseconds retry_after) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_task(task, true);
    retry_after = std::clamp(retry_after,
                             std::chrono::milliseconds(0),
                             std::chrono::milliseconds(Core::Constants::MAX_CRAWL_DELAY_MS));
    hosts_[task.host].ready_at = Clock::now() + retry_after;
    --in_flight_;
    ++pending_;
}

void UrlFrontier::mark_done(const CrawlTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    visited_.insert(task.url);
    --in_flight_;
}

bool UrlFrontier::claim(const std::string& url) {
    std::string normalized = Url::normalize(url);
    if (normalized.empty())
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return known_.insert(std::move(normalized)).second;
}

std::size_t UrlFrontier::clear_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 dropped = pending_;
    hosts_.clear();
    rotation_.clear();
    pending_ = 0;
    return dropped;
}

UrlFrontier::Snapshot UrlFrontier::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{pending_, in_flight_, visited_.size(), known_.size()};
}

bool UrlFrontier::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ == 0 && in_flight_ == 0;
}

std::optional<UrlFrontier::Clock::duration> UrlFrontier::next_ready_in() const {
    std::lock_guard<std::mutex>                 lock(mutex_);
    auto                                        now = Clock::now();
    std::optional<UrlFrontier::Clock::duration> earliest;
    for (const auto& [host, queue] : hosts_) {
        if (queue.tasks.empty() || queue.ready_at <= now)
            continue;
        auto wait = queue.ready_at - now;
        if (!earliest || wait < *earliest)
            earliest = wait;
    }
    return earliest;
}

}  // namespace Engine
}  // namespace Arachne
