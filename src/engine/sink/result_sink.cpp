#include "result_sink.hpp"
#include <nlohmann/json.hpp>

namespace Arachne {
namespace Engine {

namespace {
constexpr int JSON_INDENT = 2;

std::string dump(const nlohmann::json& j) {
    return j.dump(JSON_INDENT, ' ', false, nlohmann::json::error_handler_t::replace);
}
}  // namespace

std::string to_string(DeliveryResult result) {
    switch (result) {
        case DeliveryResult::Ok:
            return "OK";
        case DeliveryResult::Transport:
            return "TRANSPORT";
        case DeliveryResult::Rejected:
            return "REJECTED";
        case DeliveryResult::Storage:
            return "STORAGE";
    }
    return "UNKNOWN";
}

std::string to_payload(const PageResult& result) {
    return dump(nlohmann::json(result));
}

std::string to_payload(const RunSummary& summary) {
    return dump(nlohmann::json(summary));
}

}  // namespace Engine
}  // namespace Arachne
