#pragma once
#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace Arachne {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS         = 2;   // IO Threads
    static constexpr int         DEFAULT_VIRTUAL_THREADS = 16;  // Fetch coroutines per run
    static constexpr int         DEFAULT_DELIVERY_THREADS = 2;
    static constexpr std::size_t DEFAULT_DELIVERY_QUEUE   = 1024;
    static constexpr int         DEFAULT_HOST_CONCURRENCY = 2;
    static constexpr int         DEFAULT_CRAWL_DELAY_MS   = 1000;
    static constexpr int         DEFAULT_DEPTH            = 16;
    static constexpr int         DEFAULT_MAX_REDIRECTS    = 10;
    static constexpr const char* DEFAULT_OUTPUT_DIR       = "output";
    static constexpr long long   MAX_CRAWL_DELAY_MS       = 24LL * 60 * 60 * 1000;  // one day

    static constexpr int         MAX_RETRIES             = 3;
    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr int         CONNECT_TIMEOUT_MS      = 5000;
    static constexpr const char* USER_AGENT              = "Arachne-Crawler/1.0";
};

inline const std::vector<std::string>& get_html_content_types() {
    static const std::vector<std::string> types = {"text/html", "application/xhtml+xml"};
    return types;
}

// An absent content type is treated as HTML.
inline bool is_html_content_type(const std::string& content_type) {
    if (content_type.empty())
        return true;

    std::string lower = content_type;
    for (char& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const auto& type : get_html_content_types()) {
        if (lower.find(type) != std::string::npos)
            return true;
    }
    return false;
}

inline std::chrono::milliseconds get_backoff_time(int attempt) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(1000 * (1 << (attempt - 1)));
}

}  // namespace Core
}  // namespace Arachne
