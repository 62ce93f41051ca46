#pragma once
#include <chrono>
#include <string>
#include "../../core/types/constants.hpp"
#include "result_sink.hpp"

namespace Arachne {
namespace Engine {

// POSTs each payload as JSON to the run's callback URL, retrying transport
// failures and 5xx answers with exponential backoff.
class CallbackSink : public ResultSink {
public:
    CallbackSink(std::string callback_url,
                 std::string user_agent,
                 int         max_attempts    = Core::Constants::MAX_RETRIES,
                 long        timeout_seconds = Core::Constants::REQUEST_TIMEOUT_SECONDS);

    DeliveryResult deliver(const PageResult& result) override;
    DeliveryResult complete(const RunSummary& summary) override;

    const std::string& callback_url() const {
        return callback_url_;
    }

private:
    DeliveryResult post(const std::string& payload, const std::string& what);

    std::string callback_url_;
    std::string user_agent_;
    int         max_attempts_;
    long        timeout_seconds_;
};

}  // namespace Engine
}  // namespace Arachne
