#pragma once
#include <string>
#include "../run/page_result.hpp"

namespace Arachne {
namespace Engine {

enum class DeliveryResult { Ok, Transport, Rejected, Storage };

std::string to_string(DeliveryResult result);

// Destination of a run's results. Called from delivery threads only, never
// from a crawl worker; implementations must be safe to call concurrently.
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual DeliveryResult deliver(const PageResult& result)  = 0;
    virtual DeliveryResult complete(const RunSummary& summary) = 0;
};

// Serialized payload sent or stored for a result. Invalid UTF-8 in page
// content is replaced rather than rejected.
std::string to_payload(const PageResult& result);
std::string to_payload(const RunSummary& summary);

}  // namespace Engine
}  // namespace Arachne
