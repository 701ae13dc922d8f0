#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/profile_locator.hpp"
#include "engine/store_file_ops.hpp"

namespace histscrub {

// Lists the most recent visits of every located store. The live file is
// only copied: each read opens a throwaway working copy beside it, which
// is removed again before the next store.
class HistoryInspector {
public:
    explicit HistoryInspector(const ProfileLocator &locator);
    // Non-owning; `fileOps` must outlive the inspector.
    HistoryInspector(const ProfileLocator &locator, StoreFileOps &fileOps);
    ~HistoryInspector();

    HistoryInspector(const HistoryInspector &) = delete;
    HistoryInspector &operator=(const HistoryInspector &) = delete;

    // Throws std::invalid_argument when limit <= 0. Per-store failures are
    // folded into the report.
    InspectReport inspect(const std::vector<Browser> &browsers, int limit);

    // Newest `limit` visits of one store, newest first. Throws SweepError;
    // cleanup problems are appended to `warnings`.
    std::vector<HistoryEntry> readStore(const StoreTarget &target, int limit,
                                        std::vector<std::string> &warnings);

    static constexpr const char *kViewSuffix = ".view";

private:
    const ProfileLocator &m_locator;
    std::unique_ptr<StoreFileOps> m_ownedOps;
    StoreFileOps *m_ops = nullptr;
};

} // namespace histscrub
