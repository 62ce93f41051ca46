#include "run_config.hpp"
#include "../../utils/url/url.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Utils::Url;

void RunConfig::validate() const {
    if (url.empty())
        throw RunConfigError("Seed URL is empty");

    auto parsed = Url::parse(url);
    if (!Url::is_http_scheme(parsed.scheme))
        throw RunConfigError("Seed URL must use http or https: " + url);
    if (Url::normalize(url).empty())
        throw RunConfigError("Seed URL is not a valid absolute URL: " + url);

    if (maximum_redirects < 0)
        throw RunConfigError("maximum_redirects must be >= 0");
    if (maximum_depth < 0)
        throw RunConfigError("maximum_depth must be >= 0");
    if (crawl_delay_ms < 0)
        throw RunConfigError("crawl_delay_ms must be >= 0");
    if (user_agent.empty())
        throw RunConfigError("user_agent must not be empty");

    if (!callback.empty()) {
        auto cb = Url::parse(callback);
        if (!Url::is_http_scheme(cb.scheme) || Url::normalize(callback).empty())
            throw RunConfigError("Callback must be an http(s) URL: " + callback);
    }
}

}  // namespace Engine
}  // namespace Arachne
