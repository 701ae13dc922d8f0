#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "common/models.hpp"
#include "engine/cache_sweeper.hpp"
#include "engine/profile_locator.hpp"
#include "engine/store_file_ops.hpp"
#include "engine/store_mutator.hpp"

namespace histscrub {

struct SweepOptions {
    std::vector<Browser> browsers;
    bool cleanHistory = true;
    bool cleanCache = false;
    TimeWindow window = TimeWindow::lastHour();
    // Unset means the current instant, read once per run.
    std::optional<std::chrono::system_clock::time_point> now;
};

// Runs one sweep over every store and cache directory the locator finds for
// the selected browsers, one at a time. Per-store failures are folded into
// the summary; run() itself does not throw for them.
class SweepOrchestrator {
public:
    explicit SweepOrchestrator(const ProfileLocator &locator);
    // `fileOps` is passed through to the mutator and must outlive this.
    SweepOrchestrator(const ProfileLocator &locator, StoreFileOps &fileOps);

    SweepSummary run(const SweepOptions &options);

private:
    void pruneStore(const StoreTarget &target, const TimeWindow &window,
                    const CutoffSet &cutoffs, SweepSummary &summary);
    void sweepCache(const CacheTarget &cache, SweepSummary &summary);

    const ProfileLocator &m_locator;
    StoreMutator m_mutator;
    CacheSweeper m_cacheSweeper;
};

} // namespace histscrub
