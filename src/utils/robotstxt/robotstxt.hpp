/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace Arachne {
namespace Utils {

class RobotsTxt {
public:
    RobotsTxt() = default;

    static RobotsTxt parse(const std::string& content);
    // Rules used when robots.txt is missing or unreadable.
    static RobotsTxt allow_all();

    bool is_allowed(const std::string& user_agent, const std::string& path) const;
    std::optional<std::chrono::milliseconds> crawl_delay(const std::string& user_agent) const;

    bool empty() const {
        return content_.empty();
    }

private:
    std::string content_;
};

}  // namespace Utils
}  // namespace Arachne
