#include "scheduler.h"

#include "log.h"

namespace cutie {

int RefreshScheduler::tick(TimePoint now) {
    int fetched = 0;
    for (auto& slot : slots_) {
        if (!slot->due(now)) {
            continue;
        }
        const auto started = Clock::now();
        slot->refresh(now);
        ++fetched;
        const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        spdlog::debug("refresh {} took {}ms", slot->name(), took.count());
    }
    return fetched;
}

}  // namespace cutie
