#include "result_dispatcher.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include "../../core/logger/logger.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;

ResultDispatcher::ResultDispatcher(int threads, std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)),
      pool_(static_cast<std::size_t>(std::max(1, threads))) {
}

ResultDispatcher::~ResultDispatcher() {
    shutdown();
}

std::shared_ptr<ResultDispatcher::Channel>
ResultDispatcher::open(std::shared_ptr<ResultSink> sink) {
    return std::make_shared<Channel>(std::move(sink));
}

bool ResultDispatcher::submit(const std::shared_ptr<Channel>& channel, PageResult result) {
    if (is_shutdown_) {
        dropped_++;
        return false;
    }

    std::size_t current = queued_.load();
    do {
        if (current >= capacity_) {
            dropped_++;
            Logger::warn("Delivery queue full, dropping result for " + result.url);
            return false;
        }
    } while (!queued_.compare_exchange_weak(current, current + 1));

    {
        std::lock_guard<std::mutex> lock(channel->mutex_);
        channel->outstanding_++;
    }

    boost::asio::post(pool_, [this, channel, result = std::move(result)]() {
        try {
            DeliveryResult status = channel->sink_->deliver(result);
            if (status == DeliveryResult::Ok)
                delivered_++;
            else
                failed_++;
        } catch (const std::exception& e) {
            failed_++;
            Logger::error("Delivery failed for " + result.url + ": " + std::string(e.what()));
        }
        finish_one(channel);
        task_done();
    });
    return true;
}

void ResultDispatcher::finish_one(const std::shared_ptr<Channel>& channel) {
    std::optional<RunSummary> summary;
    {
        std::lock_guard<std::mutex> lock(channel->mutex_);
        channel->outstanding_--;
        if (channel->outstanding_ == 0 && channel->summary_) {
            summary = std::move(channel->summary_);
            channel->summary_.reset();
        }
    }
    if (summary)
        deliver_summary(channel, std::move(*summary));
}

void ResultDispatcher::close(const std::shared_ptr<Channel>& channel, RunSummary summary) {
    {
        std::lock_guard<std::mutex> lock(channel->mutex_);
        if (channel->outstanding_ > 0) {
            channel->summary_ = std::move(summary);
            return;
        }
    }
    deliver_summary(channel, std::move(summary));
}

void ResultDispatcher::deliver_summary(std::shared_ptr<Channel> channel, RunSummary summary) {
    queued_++;
    boost::asio::post(pool_, [this, channel = std::move(channel), summary = std::move(summary)]() {
        try {
            if (channel->sink_->complete(summary) != DeliveryResult::Ok)
                Logger::error("Summary delivery failed for run " + summary.run_id);
        } catch (const std::exception& e) {
            Logger::error("Summary delivery failed for run " + summary.run_id + ": "
                          + std::string(e.what()));
        }
        task_done();
    });
}

void ResultDispatcher::task_done() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        queued_--;
    }
    idle_cv_.notify_all();
}

void ResultDispatcher::wait_idle() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return queued_.load() == 0; });
}

void ResultDispatcher::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    wait_idle();
    pool_.join();
}

}  // namespace Engine
}  // namespace Arachne
