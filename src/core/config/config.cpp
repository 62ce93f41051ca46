#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Arachne {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["max_depth"])
            config.depth = yaml["max_depth"].as<int>();
        if (yaml["max_redirects"])
            config.max_redirects = yaml["max_redirects"].as<int>();
        if (yaml["ignore_redirects"])
            config.ignore_redirects = yaml["ignore_redirects"].as<bool>();
        if (yaml["ignore_robots"])
            config.ignore_robots = yaml["ignore_robots"].as<bool>();
        if (yaml["ignore_robots_txt"])
            config.ignore_robots = yaml["ignore_robots_txt"].as<bool>();
        if (yaml["keep_html"])
            config.keep_html = yaml["keep_html"].as<bool>();
        if (yaml["same_domain_only"])
            config.same_domain_only = yaml["same_domain_only"].as<bool>();
        if (yaml["all_domains"])
            config.same_domain_only = !yaml["all_domains"].as<bool>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["callback"])
            config.callback = yaml["callback"].as<std::string>();
        if (yaml["crawl_delay"])
            config.crawl_delay_ms = yaml["crawl_delay"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["workers"])
            config.virtual_threads = yaml["workers"].as<int>();
        if (yaml["host_concurrency"])
            config.host_concurrency = yaml["host_concurrency"].as<int>();
        if (yaml["timeout"])
            config.timeout_seconds = yaml["timeout"].as<int>();
        if (yaml["delivery_threads"])
            config.delivery_threads = yaml["delivery_threads"].as<int>();
        if (yaml["delivery_queue"])
            config.delivery_queue = yaml["delivery_queue"].as<std::size_t>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Arachne - Depth-bounded, polite web crawler"};

    std::vector<std::string> cli_urls;
    bool                     all_domains = false;

    app.add_option("-d,--depth", config.depth, "Maximum crawl depth");
    app.add_option("--max-redirects", config.max_redirects, "Redirects followed per page");
    app.add_flag("--ignore-redirects", config.ignore_redirects, "Report redirects as failures");
    app.add_flag("--ignore-robots", config.ignore_robots, "Do not consult robots.txt");
    app.add_flag("--keep-html", config.keep_html, "Include page content in results");
    app.add_flag("--all-domains", all_domains, "Follow links outside the seed's domain");
    app.add_option("--user-agent", config.user_agent, "User agent for pages and robots.txt");
    app.add_option("--callback", config.callback, "URL receiving results as JSON POSTs");
    app.add_option("--crawl-delay", config.crawl_delay_ms, "Minimum per-host delay (ms)");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("-w,--workers", config.virtual_threads, "Fetch workers per run");
    app.add_option("--host-concurrency", config.host_concurrency, "Max concurrent requests per host");
    app.add_option("--timeout", config.timeout_seconds, "Request timeout (seconds)");
    app.add_option("--delivery-threads", config.delivery_threads, "Result delivery threads");
    app.add_option("--delivery-queue", config.delivery_queue, "Result delivery queue capacity");
    app.add_option("-o,--output", config.output_dir, "Output directory when no callback is set");
    app.add_option("--log-level", config.log_level, "debug, info, warn, error or none");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_option("urls", cli_urls, "Seed URLs to crawl");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!cli_urls.empty())
        config.urls = cli_urls;
    if (all_domains)
        config.same_domain_only = false;
    return config;
}

}  // namespace Core
}  // namespace Arachne
