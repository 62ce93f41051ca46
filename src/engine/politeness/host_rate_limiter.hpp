#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "../../core/types/constants.hpp"

namespace Arachne {
namespace Engine {

/**
 * Per-host politeness state shared by every run in the process.
 *
 * A host may have at most `max_concurrency` requests in flight, and two
 * successive grants for the same host are at least the requested gap apart.
 * try_acquire never blocks; a denied caller gets the time it should wait.
 */
class HostRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Decision {
        bool                      granted = false;
        std::chrono::milliseconds retry_after{0};
    };

    explicit HostRateLimiter(int max_concurrency = Core::Constants::DEFAULT_HOST_CONCURRENCY);

    HostRateLimiter(const HostRateLimiter&)            = delete;
    HostRateLimiter& operator=(const HostRateLimiter&) = delete;

    // min_gap is max(run default delay, robots crawl-delay) for this host.
    Decision try_acquire(const std::string& host, std::chrono::milliseconds min_gap);
    void     release(const std::string& host);

    // Non-mutating check used to skip hosts that are certain to be denied.
    bool would_grant(const std::string& host) const;

    int active(const std::string& host) const;
    int max_concurrency() const {
        return max_concurrency_;
    }

private:
    struct HostState {
        std::mutex                mutex;
        Clock::time_point         last_request{};
        bool                      has_request = false;
        std::chrono::milliseconds current_delay{0};
        int                       active = 0;
    };

    std::shared_ptr<HostState> state_for(const std::string& host);
    std::shared_ptr<HostState> find_state(const std::string& host) const;

    const int                                                   max_concurrency_;
    mutable std::mutex                                          hosts_mutex_;
    std::unordered_map<std::string, std::shared_ptr<HostState>> hosts_;
};

// Holds one granted slot and releases it on every exit path.
class HostSlot {
public:
    HostSlot(HostRateLimiter& limiter, std::string host)
        : limiter_(&limiter), host_(std::move(host)) {
    }
    ~HostSlot() {
        if (limiter_)
            limiter_->release(host_);
    }

    HostSlot(const HostSlot&)            = delete;
    HostSlot& operator=(const HostSlot&) = delete;
    HostSlot(HostSlot&& other) noexcept : limiter_(other.limiter_), host_(std::move(other.host_)) {
        other.limiter_ = nullptr;
    }
    HostSlot& operator=(HostSlot&&) = delete;

private:
    HostRateLimiter* limiter_;
    std::string      host_;
};

}  // namespace Engine
}  // namespace Arachne
