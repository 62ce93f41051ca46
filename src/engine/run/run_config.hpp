#pragma once
#include <stdexcept>
#include <string>
#include "../../core/types/constants.hpp"

namespace Arachne {
namespace Engine {

class RunConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parameters of one crawl run. Immutable once the run is started.
struct RunConfig {
    std::string url;
    bool        ignore_redirects    = false;
    int         maximum_redirects   = Core::Constants::DEFAULT_MAX_REDIRECTS;
    int         maximum_depth       = Core::Constants::DEFAULT_DEPTH;
    bool        ignore_robots_txt   = false;
    bool        keep_html_in_memory = false;
    bool        same_domain_only    = true;  // follow only links in the seed's domain
    std::string user_agent          = Core::Constants::USER_AGENT;
    std::string callback;
    int         crawl_delay_ms = Core::Constants::DEFAULT_CRAWL_DELAY_MS;

    // Throws RunConfigError describing the first problem found.
    void validate() const;
};

}  // namespace Engine
}  // namespace Arachne
