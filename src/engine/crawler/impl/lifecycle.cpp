#include <algorithm>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Arachne {
namespace Engine {

Crawler::~Crawler() {
    shutdown();
}

void Crawler::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    int threads = std::max(1, options_.threads);
    for (int i = 0; i < threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::debug("Started " + std::to_string(threads) + " IO threads.");
}

void Crawler::init_signals() {
    signals_.clear();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number)
                         + " received. Cancelling runs...");
            cancel_all();
        }
    });
}

void Crawler::spawn_workers(const RunPtr& run) {
    int workers = std::max(1, options_.virtual_threads);
    // Counted up front so an early finisher cannot see zero and finish the run.
    run->active_workers = workers;
    for (int i = 0; i < workers; ++i) {
        boost::asio::co_spawn(ioc_, worker_loop(run), boost::asio::detached);
    }
}

bool Crawler::cancel_run(const std::string& run_id) {
    RunPtr run = find_run(run_id);
    if (!run || is_terminal(run->state.load()))
        return false;

    if (run->cancelled.exchange(true))
        return false;

    transition(*run, RunState::Cancelled);
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (run->frontier)
            dropped = run->frontier->clear_pending();
    }
    Logger::warn("Run " + run_id + ": Cancelled (" + std::to_string(dropped)
                 + " pending URLs dropped)");
    return true;
}

void Crawler::cancel_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        for (const auto& [id, run] : runs_) {
            if (!is_terminal(run->state.load()))
                ids.push_back(id);
        }
    }
    for (const auto& id : ids)
        cancel_run(id);
}

void Crawler::finish_run(const RunPtr& run) {
    RunState final_state = run->cancelled ? RunState::Cancelled : RunState::Completed;
    transition(*run, final_state);

    RunSummary summary;
    summary.run_id      = run->id;
    summary.seed        = run->config.url;
    summary.state       = run->state.load();
    summary.pages       = run->pages_emitted.load();
    summary.finished_at = std::chrono::system_clock::now();

    RunStatus final_status;
    final_status.run_id        = run->id;
    final_status.state         = summary.state;
    final_status.pages_emitted = summary.pages;

    std::shared_ptr<ResultDispatcher::Channel> channel;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        auto snapshot          = run->frontier->snapshot();
        summary.visited        = snapshot.visited;
        final_status.pending   = snapshot.pending;
        final_status.in_flight = snapshot.in_flight;
        final_status.visited   = snapshot.visited;
        run->frontier.reset();
        run->client.reset();
        channel = std::move(run->channel);

        std::lock_guard<std::mutex> runs_lock(runs_mutex_);
        finished_runs_[run->id] = final_status;
    }

    dispatcher_.close(channel, summary);

    if (summary.state == RunState::Completed)
        Logger::success("Run " + run->id + ": Completed, " + std::to_string(summary.pages)
                        + " pages");
    else
        Logger::warn("Run " + run->id + ": Finished as " + to_string(summary.state) + ", "
                     + std::to_string(summary.pages) + " pages");

    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        runs_.erase(run->id);
    }
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        run->finished = true;
    }
    run->done_cv.notify_all();
}

RunState Crawler::wait(const std::string& run_id) {
    RunPtr run = find_run(run_id);
    if (!run) {
        if (auto finished = find_finished(run_id))
            return finished->state;
        throw std::out_of_range("Unknown run: " + run_id);
    }

    std::unique_lock<std::mutex> lock(run->mutex);
    run->done_cv.wait(lock, [&run] { return run->finished; });
    return run->state.load();
}

void Crawler::wait_all() {
    std::vector<RunPtr> runs;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        for (const auto& [id, run] : runs_)
            runs.push_back(run);
    }
    for (const auto& run : runs) {
        std::unique_lock<std::mutex> lock(run->mutex);
        run->done_cv.wait(lock, [&run] { return run->finished; });
    }
}

void Crawler::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    Logger::debug("Shutting down resources...");
    cancel_all();
    wait_all();

    boost::system::error_code ec;
    signals_.cancel(ec);
    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    dispatcher_.shutdown();
    Logger::debug("Shutdown complete.");
}

}  // namespace Engine
}  // namespace Arachne
