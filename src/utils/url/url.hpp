#pragma once
#include <string>

namespace Arachne {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    // Canonical form used for deduplication: lower-case scheme and host,
    // default port dropped, dot segments removed, fragment stripped.
    // Returns an empty string when the URL has no scheme or host.
    static std::string normalize(const std::string& url);

    // "scheme://host[:port]" of an absolute URL, host lower-cased.
    static std::string origin(const std::string& url);
    // Lower-cased "host[:port]" with the default port dropped. Politeness state is keyed by it.
    static std::string host_key(const std::string& url);

    static bool        is_http_scheme(const std::string& scheme);
    static std::string default_port(const std::string& scheme);
    static std::string remove_dot_segments(const std::string& path);
    static std::string to_flat_filename(const std::string& url, const std::string& extension);
};

}  // namespace Utils
}  // namespace Arachne
