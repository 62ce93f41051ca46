#pragma once
#include <cstddef>
#include <string>

namespace Arachne {
namespace Engine {

enum class RunState { Starting, Running, Draining, Completed, Cancelled };

inline std::string to_string(RunState state) {
    switch (state) {
        case RunState::Starting:
            return "STARTING";
        case RunState::Running:
            return "RUNNING";
        case RunState::Draining:
            return "DRAINING";
        case RunState::Completed:
            return "COMPLETED";
        case RunState::Cancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

inline bool is_terminal(RunState state) {
    return state == RunState::Completed || state == RunState::Cancelled;
}

struct RunStatus {
    std::string run_id;
    RunState    state         = RunState::Starting;
    std::size_t pages_emitted = 0;
    std::size_t pending       = 0;
    std::size_t in_flight     = 0;
    std::size_t visited       = 0;
};

}  // namespace Engine
}  // namespace Arachne
