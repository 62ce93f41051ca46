#include "crawler.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "../../core/logger/logger.hpp"
#include "../../network/http/beast_client.hpp"
#include "../sink/callback_sink.hpp"
#include "../sink/disk_sink.hpp"

namespace Arachne {
namespace Engine {

Crawler::Crawler(CrawlerOptions options)
    : options_(std::move(options)),
      rate_limiter_(options_.host_concurrency),
      dispatcher_(options_.delivery_threads, options_.delivery_queue) {
    init_io_services();
    if (options_.handle_signals)
        init_signals();
}

std::string Crawler::generate_run_id() {
    static boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

Crawler::RunPtr Crawler::find_run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto                        it = runs_.find(run_id);
    return it != runs_.end() ? it->second : nullptr;
}

std::optional<RunStatus> Crawler::find_finished(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto                        it = finished_runs_.find(run_id);
    if (it == finished_runs_.end())
        return std::nullopt;
    return it->second;
}

std::unique_ptr<HttpClient> Crawler::create_client(const RunConfig& config) {
    std::unique_ptr<HttpClient> client;
    if (options_.client_factory)
        client = options_.client_factory(ioc_, config);
    else
        client = std::make_unique<BeastClient>(ioc_);

    client->set_user_agent(config.user_agent);
    client->set_connect_timeout(options_.connect_timeout);
    client->set_request_timeout(options_.request_timeout);
    return client;
}

std::shared_ptr<ResultSink> Crawler::create_sink(const RunConfig& config) {
    if (options_.sink_factory)
        return options_.sink_factory(config);

    if (!config.callback.empty())
        return std::make_shared<CallbackSink>(config.callback, config.user_agent);

    std::lock_guard<std::mutex> lock(disk_sink_mutex_);
    if (!disk_sink_)
        disk_sink_ = std::make_shared<DiskSink>(options_.output_dir);
    return disk_sink_;
}

std::string Crawler::start_run(RunConfig config) {
    if (is_shutdown_)
        throw RunConfigError("Crawler is shut down");
    config.validate();

    std::string id;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        id = generate_run_id();
    }

    auto run     = std::make_shared<RunContext>(id, std::move(config));
    run->client  = create_client(run->config);
    run->channel = dispatcher_.open(create_sink(run->config));

    OfferResult seeded = run->frontier->offer(run->config.url, 0);
    if (seeded != OfferResult::Accepted)
        throw RunConfigError("Seed URL rejected (" + to_string(seeded) + "): " + run->config.url);

    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        runs_.emplace(id, run);
    }

    Logger::info("Run " + id + ": Starting for " + run->config.url + " (Depth "
                 + std::to_string(run->config.maximum_depth) + ")");
    transition(*run, RunState::Running);
    spawn_workers(run);
    return id;
}

std::optional<RunStatus> Crawler::status(const std::string& run_id) const {
    RunPtr run = find_run(run_id);
    if (!run)
        return find_finished(run_id);

    RunStatus status;
    status.run_id        = run->id;
    status.state         = run->state.load();
    status.pages_emitted = run->pages_emitted.load();

    std::lock_guard<std::mutex> lock(run->mutex);
    if (!run->frontier)
        return find_finished(run_id);

    auto snapshot    = run->frontier->snapshot();
    status.pending   = snapshot.pending;
    status.in_flight = snapshot.in_flight;
    status.visited   = snapshot.visited;
    return status;
}

void Crawler::transition(RunContext& run, RunState next) {
    RunState current = run.state.load();
    do {
        if (current == next || is_terminal(current))
            return;
    } while (!run.state.compare_exchange_weak(current, next));

    Logger::debug("Run " + run.id + ": " + to_string(current) + " -> " + to_string(next));
}

}  // namespace Engine
}  // namespace Arachne
