#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include "result_sink.hpp"

namespace Arachne {
namespace Engine {

/**
 * Bounded delivery queue drained by its own thread pool, so a slow or
 * unreachable destination never stalls crawling.
 *
 * Results are grouped in channels, one per run. A channel's summary is
 * delivered only after every result submitted to it has been delivered.
 */
class ResultDispatcher {
public:
    class Channel {
    public:
        explicit Channel(std::shared_ptr<ResultSink> sink) : sink_(std::move(sink)) {
        }

    private:
        friend class ResultDispatcher;

        std::shared_ptr<ResultSink> sink_;
        std::mutex                  mutex_;
        std::size_t                 outstanding_ = 0;
        std::optional<RunSummary>   summary_;
    };

    ResultDispatcher(int threads, std::size_t capacity);
    ~ResultDispatcher();

    ResultDispatcher(const ResultDispatcher&)            = delete;
    ResultDispatcher& operator=(const ResultDispatcher&) = delete;

    std::shared_ptr<Channel> open(std::shared_ptr<ResultSink> sink);

    // Queues a result. Returns false, and drops it, when the queue is full.
    bool submit(const std::shared_ptr<Channel>& channel, PageResult result);

    // Queues the channel's summary behind its outstanding results. Never dropped.
    void close(const std::shared_ptr<Channel>& channel, RunSummary summary);

    // Blocks until nothing is queued or being delivered.
    void wait_idle();
    void shutdown();

    std::size_t queued() const {
        return queued_.load();
    }
    std::size_t delivered() const {
        return delivered_.load();
    }
    std::size_t failed() const {
        return failed_.load();
    }
    std::size_t dropped() const {
        return dropped_.load();
    }

private:
    void deliver_summary(std::shared_ptr<Channel> channel, RunSummary summary);
    void finish_one(const std::shared_ptr<Channel>& channel);
    void task_done();

    const std::size_t        capacity_;
    boost::asio::thread_pool pool_;

    std::atomic<std::size_t> queued_{0};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> dropped_{0};
    std::atomic<bool>        is_shutdown_{false};

    std::mutex              idle_mutex_;
    std::condition_variable idle_cv_;
};

}  // namespace Engine
}  // namespace Arachne
