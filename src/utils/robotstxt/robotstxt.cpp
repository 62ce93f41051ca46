/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "absl/strings/match.h"
#include "robots.h"
#include "../../core/types/constants.hpp"

namespace Arachne {
namespace Utils {

namespace {
// Groups in robots.txt name the product token only ("Arachne-Crawler"),
// not the full user agent string ("Arachne-Crawler/1.0").
std::string product_token(const std::string& user_agent) {
    size_t end = 0;
    while (end < user_agent.size()
           && (std::isalpha(static_cast<unsigned char>(user_agent[end])) || user_agent[end] == '-'
               || user_agent[end] == '_'))
        ++end;
    return end == 0 ? user_agent : user_agent.substr(0, end);
}
}  // namespace

RobotsTxt RobotsTxt::parse(const std::string& content) {
    RobotsTxt robots;
    robots.content_ = content;
    return robots;
}

RobotsTxt RobotsTxt::allow_all() {
    return RobotsTxt{};
}

bool RobotsTxt::is_allowed(const std::string& user_agent, const std::string& path) const {
    if (content_.empty())
        return true;

    googlebot::RobotsMatcher matcher;
    std::vector<std::string> user_agents{product_token(user_agent)};
    return matcher.AllowedByRobots(content_, &user_agents, path.empty() ? "/" : path);
}

namespace {
class CrawlDelayMatcher : public googlebot::RobotsMatcher {
public:
    explicit CrawlDelayMatcher(const std::vector<std::string>& user_agents) {
        InitUserAgentsAndPath(&user_agents, "/");
    }

    std::optional<double> get_delay(const std::string& content) {
        googlebot::ParseRobotsTxt(content, this);
        if (specific_delay_)
            return specific_delay_;
        return global_delay_;
    }

protected:
    void
    HandleUnknownAction(int line_num, absl::string_view action, absl::string_view value) override {
        if (absl::EqualsIgnoreCase(action, "Crawl-delay")) {
            try {
                double delay = std::stod(std::string(value));
                if (std::isfinite(delay) && delay >= 0.0) {
                    if (seen_specific_agent_)
                        specific_delay_ = delay;
                    else if (seen_global_agent_)
                        global_delay_ = delay;
                }
            } catch (const std::invalid_argument&) {
                // malformed value, rule ignored
            } catch (const std::out_of_range&) {
            }
        }
        googlebot::RobotsMatcher::HandleUnknownAction(line_num, action, value);
    }

private:
    std::optional<double> global_delay_;
    std::optional<double> specific_delay_;
};
}  // namespace

std::optional<std::chrono::milliseconds> RobotsTxt::crawl_delay(const std::string& user_agent) const {
    if (content_.empty())
        return std::nullopt;

    std::vector<std::string> ua_list{product_token(user_agent)};
    CrawlDelayMatcher        matcher(ua_list);
    auto                     seconds = matcher.get_delay(content_);
    if (!seconds)
        return std::nullopt;

    constexpr double max_seconds = Core::Constants::MAX_CRAWL_DELAY_MS / 1000.0;
    if (*seconds >= max_seconds)
        return std::chrono::milliseconds(Core::Constants::MAX_CRAWL_DELAY_MS);
    return std::chrono::milliseconds(static_cast<long long>(*seconds * 1000.0));
}

}  // namespace Utils
}  // namespace Arachne
