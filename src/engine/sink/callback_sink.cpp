#include "callback_sink.hpp"
#include <algorithm>
#include <thread>
#include "../../core/logger/logger.hpp"
#include "../../network/http/curl_client.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;
using Arachne::Network::Http::CurlClient;

namespace {
constexpr const char* JSON_CONTENT_TYPE = "application/json";
}  // namespace

CallbackSink::CallbackSink(std::string callback_url,
                           std::string user_agent,
                           int         max_attempts,
                           long        timeout_seconds)
    : callback_url_(std::move(callback_url)),
      user_agent_(std::move(user_agent)),
      max_attempts_(std::max(1, max_attempts)),
      timeout_seconds_(timeout_seconds) {
}

DeliveryResult CallbackSink::deliver(const PageResult& result) {
    return post(to_payload(result), result.url);
}

DeliveryResult CallbackSink::complete(const RunSummary& summary) {
    return post(to_payload(summary), "run " + summary.run_id + " summary");
}

DeliveryResult CallbackSink::post(const std::string& payload, const std::string& what) {
    CurlClient client;
    client.set_user_agent(user_agent_);
    client.set_timeout(timeout_seconds_);

    DeliveryResult last = DeliveryResult::Transport;
    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        Response res = client.post(callback_url_, payload, JSON_CONTENT_TYPE);

        if (res.success)
            return DeliveryResult::Ok;

        bool retryable = res.status_code == 0 || res.status_code >= 500;
        last           = res.status_code == 0 ? DeliveryResult::Transport : DeliveryResult::Rejected;
        if (!retryable) {
            Logger::error("Callback rejected " + what + ": " + res.error);
            return last;
        }

        if (attempt == max_attempts_) {
            Logger::error("Callback failed for " + what + ": " + res.error + " - Max retries");
        }
        else {
            Logger::warn("Callback failed for " + what + ": " + res.error + " [Retry "
                         + std::to_string(attempt + 1) + "]");
            std::this_thread::sleep_for(Core::get_backoff_time(attempt));
        }
    }
    return last;
}

}  // namespace Engine
}  // namespace Arachne
