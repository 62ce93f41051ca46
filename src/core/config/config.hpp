#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Arachne {
namespace Core {

struct Config {
    std::vector<std::string> urls;

    // Per-run parameters, applied to every seed URL.
    int         depth            = Constants::DEFAULT_DEPTH;
    int         max_redirects    = Constants::DEFAULT_MAX_REDIRECTS;
    bool        ignore_redirects = false;
    bool        ignore_robots    = false;
    bool        keep_html        = false;
    bool        same_domain_only = true;
    std::string user_agent       = Constants::USER_AGENT;
    std::string callback;
    int         crawl_delay_ms = Constants::DEFAULT_CRAWL_DELAY_MS;

    // Process-wide resources.
    int         threads          = Constants::DEFAULT_THREADS;
    int         virtual_threads  = Constants::DEFAULT_VIRTUAL_THREADS;
    int         host_concurrency = Constants::DEFAULT_HOST_CONCURRENCY;
    int         timeout_seconds  = Constants::REQUEST_TIMEOUT_SECONDS;
    int         delivery_threads = Constants::DEFAULT_DELIVERY_THREADS;
    std::size_t delivery_queue   = Constants::DEFAULT_DELIVERY_QUEUE;
    std::string output_dir       = Constants::DEFAULT_OUTPUT_DIR;
    std::string log_level        = "info";
    std::string config_path;

    static Config parse(int argc, char* argv[]);
};

// Applies the keys present in a YAML file. Throws std::runtime_error when the
// file cannot be read or a value has the wrong type.
void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Arachne
