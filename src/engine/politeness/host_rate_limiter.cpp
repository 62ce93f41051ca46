#include "host_rate_limiter.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"

namespace Arachne {
namespace Engine {

namespace {
// Retry hint when a host is at its concurrency cap; a slot frees at an
// unknown time.
constexpr int CONCURRENCY_RETRY_MS = 50;

std::chrono::milliseconds clamp_gap(std::chrono::milliseconds gap) {
    return std::clamp(gap,
                      std::chrono::milliseconds(0),
                      std::chrono::milliseconds(Core::Constants::MAX_CRAWL_DELAY_MS));
}
}  // namespace

HostRateLimiter::HostRateLimiter(int max_concurrency)
    : max_concurrency_(std::max(1, max_concurrency)) {
}

std::shared_ptr<HostRateLimiter::HostState> HostRateLimiter::state_for(const std::string& host) {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    auto&                       state = hosts_[host];
    if (!state)
        state = std::make_shared<HostState>();
    return state;
}

std::shared_ptr<HostRateLimiter::HostState>
HostRateLimiter::find_state(const std::string& host) const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    auto                        it = hosts_.find(host);
    return it != hosts_.end() ? it->second : nullptr;
}

HostRateLimiter::Decision HostRateLimiter::try_acquire(const std::string&        host,
                                                       std::chrono::milliseconds min_gap) {
    auto                        state = state_for(host);
    std::lock_guard<std::mutex> lock(state->mutex);

    min_gap              = clamp_gap(min_gap);
    state->current_delay = min_gap;
    if (state->active >= max_concurrency_)
        return Decision{false, std::chrono::milliseconds(CONCURRENCY_RETRY_MS)};

    auto now = Clock::now();
    if (state->has_request) {
        auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - state->last_request);
        if (elapsed < min_gap)
            return Decision{false, min_gap - elapsed};
    }

    state->last_request = now;
    state->has_request  = true;
    state->active++;
    return Decision{true, std::chrono::milliseconds(0)};
}

void HostRateLimiter::release(const std::string& host) {
    auto state = find_state(host);
    if (!state) {
        Core::Logger::error("Rate limiter: release for unknown host " + host);
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->active > 0)
        state->active--;
}

bool HostRateLimiter::would_grant(const std::string& host) const {
    auto state = find_state(host);
    if (!state)
        return true;

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->active >= max_concurrency_)
        return false;
    if (!state->has_request)
        return true;
    return Clock::now() - state->last_request >= state->current_delay;
}

int HostRateLimiter::active(const std::string& host) const {
    auto state = find_state(host);
    if (!state)
        return 0;

    std::lock_guard<std::mutex> lock(state->mutex);
    return state->active;
}

}  // namespace Engine
}  // namespace Arachne
