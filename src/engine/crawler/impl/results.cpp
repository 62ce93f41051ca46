#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Arachne {
namespace Engine {

void Crawler::emit(RunContext& run, PageResult result) {
    if (run.cancelled) {
        Logger::debug("Run " + run.id + ": Result suppressed after cancel: " + result.url);
        return;
    }

    run.pages_emitted++;
    if (!dispatcher_.submit(run.channel, std::move(result)))
        Logger::debug("Run " + run.id + ": Result not queued");
}

}  // namespace Engine
}  // namespace Arachne
