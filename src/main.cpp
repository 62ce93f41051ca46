#include <curl/curl.h>
#include <exception>
#include <string>
#include <vector>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"

namespace {

Arachne::Engine::RunConfig make_run_config(const Arachne::Core::Config& config,
                                           const std::string&           url) {
    Arachne::Engine::RunConfig run;
    run.url                 = url;
    run.ignore_redirects    = config.ignore_redirects;
    run.maximum_redirects   = config.max_redirects;
    run.maximum_depth       = config.depth;
    run.ignore_robots_txt   = config.ignore_robots;
    run.keep_html_in_memory = config.keep_html;
    run.same_domain_only    = config.same_domain_only;
    run.user_agent          = config.user_agent;
    run.callback            = config.callback;
    run.crawl_delay_ms      = config.crawl_delay_ms;
    return run;
}

int run_crawler(const Arachne::Core::Config& config) {
    Arachne::Engine::CrawlerOptions options;
    options.threads          = config.threads;
    options.virtual_threads  = config.virtual_threads;
    options.host_concurrency = config.host_concurrency;
    options.request_timeout  = std::chrono::seconds(config.timeout_seconds);
    options.delivery_threads = config.delivery_threads;
    options.delivery_queue   = config.delivery_queue;
    options.output_dir       = config.output_dir;
    options.handle_signals   = true;

    Arachne::Engine::Crawler crawler(options);

    std::vector<std::string> run_ids;
    for (const auto& url : config.urls) {
        try {
            run_ids.push_back(crawler.start_run(make_run_config(config, url)));
        } catch (const Arachne::Engine::RunConfigError& e) {
            Arachne::Core::Logger::error(e.what());
            crawler.shutdown();
            return 1;
        }
    }

    for (const auto& id : run_ids)
        crawler.wait(id);

    crawler.shutdown();

    std::size_t failed = crawler.dispatcher().failed() + crawler.dispatcher().dropped();
    if (failed > 0)
        Arachne::Core::Logger::warn(std::to_string(failed) + " results were not delivered.");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Arachne::Core::Config config;
    try {
        config = Arachne::Core::Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Arachne::Core::Logger::error(e.what());
        return 1;
    }

    Arachne::Core::Logger::set_level(Arachne::Core::Logger::level_from_name(config.log_level));

    if (config.urls.empty()) {
        Arachne::Core::Logger::error("No URLs provided. See --help.");
        return 1;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    int rc = run_crawler(config);
    curl_global_cleanup();
    return rc;
}
