#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../fetcher/page_fetcher.hpp"
#include "../frontier/url_frontier.hpp"
#include "../politeness/host_rate_limiter.hpp"
#include "../politeness/robots_resolver.hpp"
#include "../run/page_result.hpp"
#include "../run/run_config.hpp"
#include "../run/run_state.hpp"
#include "../sink/result_dispatcher.hpp"
#include "../sink/result_sink.hpp"

#ifndef CPPCHECK
class CrawlerTest_FinishedRunIsEvicted_Test;
#endif

namespace Arachne {
namespace Engine {

using namespace Arachne::Core;
using namespace Arachne::Network::Http;

// Process-wide resources shared by every run.
struct CrawlerOptions {
    using ClientFactory =
        std::function<std::unique_ptr<HttpClient>(boost::asio::io_context&, const RunConfig&)>;
    using SinkFactory = std::function<std::shared_ptr<ResultSink>(const RunConfig&)>;

    int                       threads          = Constants::DEFAULT_THREADS;
    int                       virtual_threads  = Constants::DEFAULT_VIRTUAL_THREADS;
    int                       host_concurrency = Constants::DEFAULT_HOST_CONCURRENCY;
    std::chrono::milliseconds request_timeout{Constants::REQUEST_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds connect_timeout{Constants::CONNECT_TIMEOUT_MS};
    int                       delivery_threads = Constants::DEFAULT_DELIVERY_THREADS;
    std::size_t               delivery_queue   = Constants::DEFAULT_DELIVERY_QUEUE;
    std::string               output_dir       = Constants::DEFAULT_OUTPUT_DIR;
    bool                      handle_signals   = false;

    // Overrides for the transport and the result destination. Empty means
    // BeastClient and CallbackSink/DiskSink.
    ClientFactory client_factory;
    SinkFactory   sink_factory;
};

class Crawler {
#ifndef CPPCHECK
    friend class ::CrawlerTest_FinishedRunIsEvicted_Test;
#endif

public:
    explicit Crawler(CrawlerOptions options = {});
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Validates the config, seeds the frontier and starts the run's workers.
    // Throws RunConfigError before any run state exists.
    std::string start_run(RunConfig config);

    // Stops dispatching new tasks for the run. In-flight fetches finish but
    // emit nothing. Returns false for an unknown or already finished run.
    bool cancel_run(const std::string& run_id);
    void cancel_all();

    std::optional<RunStatus> status(const std::string& run_id) const;

    // Blocks until the run is COMPLETED or CANCELLED and its summary is queued.
    // Must not be called from an IO thread.
    RunState wait(const std::string& run_id);
    void     wait_all();

    void shutdown();

    HostRateLimiter& rate_limiter() {
        return rate_limiter_;
    }
    RobotsResolver& robots() {
        return robots_;
    }
    ResultDispatcher& dispatcher() {
        return dispatcher_;
    }

#ifdef CPPCHECK
public:
#else
private:
#endif
    struct RunContext {
        RunContext(std::string run_id, RunConfig run_config)
            : id(std::move(run_id)),
              config(std::move(run_config)),
              frontier(std::make_unique<UrlFrontier>(id, config.maximum_depth)) {
        }

        // frontier, client and channel are released when the run finishes.
        const std::string                          id;
        const RunConfig                            config;
        std::unique_ptr<UrlFrontier>               frontier;
        std::unique_ptr<HttpClient>                client;
        std::shared_ptr<ResultDispatcher::Channel> channel;

        std::atomic<RunState>    state{RunState::Starting};
        std::atomic<bool>        cancelled{false};
        std::atomic<std::size_t> pages_emitted{0};
        std::atomic<int>         active_workers{0};

        std::mutex              mutex;
        std::condition_variable done_cv;
        bool                    finished = false;
    };
    using RunPtr = std::shared_ptr<RunContext>;

    CrawlerOptions options_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::signal_set  signals_{ioc_};

    HostRateLimiter              rate_limiter_;
    RobotsResolver               robots_;
    ResultDispatcher             dispatcher_;
    std::shared_ptr<ResultSink>  disk_sink_;
    std::mutex                   disk_sink_mutex_;

    // Live runs move to finished_runs_ once terminal; only their status is kept.
    mutable std::mutex               runs_mutex_;
    std::map<std::string, RunPtr>    runs_;
    std::map<std::string, RunStatus> finished_runs_;
    std::atomic<bool>             is_shutdown_{false};

    void init_io_services();
    void init_signals();

    std::string                 generate_run_id();
    RunPtr                      find_run(const std::string& run_id) const;
    std::optional<RunStatus>    find_finished(const std::string& run_id) const;
    std::unique_ptr<HttpClient> create_client(const RunConfig& config);
    std::shared_ptr<ResultSink> create_sink(const RunConfig& config);
    void                        spawn_workers(const RunPtr& run);
    void                        transition(RunContext& run, RunState next);
    void                        finish_run(const RunPtr& run);

    boost::asio::awaitable<void> worker_loop(RunPtr run);
    boost::asio::awaitable<void> process_url_task(RunPtr run, CrawlTask task);
    boost::asio::awaitable<bool> is_url_allowed(RunContext& run, const CrawlTask& task);
    boost::asio::awaitable<std::optional<HopRefusal>> check_redirect(RunContext&        run,
                                                                     const std::string& target);
    boost::asio::awaitable<std::chrono::milliseconds> effective_delay(RunContext&      run,
                                                                      const CrawlTask& task);
    boost::asio::awaitable<PageResult> fetch_page(RunContext& run, const CrawlTask& task);

    void expand_links(RunContext&                           run,
                      const CrawlTask&                      task,
                      const std::vector<Utils::Html::Link>& links);
    void emit(RunContext& run, PageResult result);
};

}  // namespace Engine
}  // namespace Arachne
