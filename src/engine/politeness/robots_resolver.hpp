#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include "../../network/http/http_client.hpp"
#include "../../utils/robotstxt/robotstxt.hpp"

namespace Arachne {
namespace Engine {

/**
 * Process-wide robots.txt cache keyed by origin (scheme://host[:port]).
 *
 * The first lookup for an origin fetches /robots.txt; lookups that arrive
 * while that fetch is running suspend until it completes instead of issuing
 * their own request. Entries never expire. A missing, unreadable or
 * timed-out robots.txt resolves to allow-all.
 */
class RobotsResolver {
public:
    using Rules = std::shared_ptr<const Arachne::Utils::RobotsTxt>;

    RobotsResolver() = default;

    RobotsResolver(const RobotsResolver&)            = delete;
    RobotsResolver& operator=(const RobotsResolver&) = delete;

    boost::asio::awaitable<Rules> rules_for(const std::string&                    url,
                                            Arachne::Network::Http::HttpClient& client);

    boost::asio::awaitable<bool> is_allowed(const std::string&                    url,
                                            const std::string&                    user_agent,
                                            Arachne::Network::Http::HttpClient& client);

    boost::asio::awaitable<std::optional<std::chrono::milliseconds>>
    crawl_delay(const std::string&                    url,
                const std::string&                    user_agent,
                Arachne::Network::Http::HttpClient& client);

    // Rules already resolved for an origin, or null.
    Rules cached(const std::string& origin) const;

    // Number of robots.txt requests issued so far.
    std::size_t fetch_count() const {
        return fetch_count_.load();
    }

private:
    struct Entry {
        Rules                              rules;  // null while the fetch is running
        std::vector<std::function<void()>> waiters;
    };

    template <typename CompletionToken>
    auto async_wait_ready(std::shared_ptr<Entry> entry, CompletionToken&& token) {
        return boost::asio::async_initiate<CompletionToken, void()>(
            [this, entry](auto handler) {
                using Handler = std::decay_t<decltype(handler)>;
                auto shared   = std::make_shared<Handler>(std::move(handler));
                auto resume   = [shared]() {
                    auto executor = boost::asio::get_associated_executor(*shared);
                    boost::asio::post(executor, [shared]() { (*shared)(); });
                };

                std::unique_lock<std::mutex> lock(mutex_);
                if (entry->rules) {
                    lock.unlock();
                    resume();
                    return;
                }
                entry->waiters.emplace_back(std::move(resume));
            },
            token);
    }

    boost::asio::awaitable<Rules> fetch(const std::string&                    origin,
                                        Arachne::Network::Http::HttpClient& client);

    mutable std::mutex                                      mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::atomic<std::size_t>                                fetch_count_{0};
};

}  // namespace Engine
}  // namespace Arachne
