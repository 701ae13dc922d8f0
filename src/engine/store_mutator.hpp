#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "common/models.hpp"
#include "engine/schema_adapter.hpp"
#include "engine/store_file_ops.hpp"

namespace histscrub {

/**
 * StoreMutator runs one crash-safe prune-and-compact cycle against a live
 * history store:
 *
 *   Idle -> BackedUp -> WorkingCopyOpen -> CountedAffected -> Deleted
 *        -> Committed -> Compacted -> Swapped -> BackupRemoved -> Done
 *
 * with Failed reachable from every non-terminal state. The live file is
 * only read (for copying) until the swap. All mutation happens on a
 * working copy beside it; the backup is kept whenever the cycle fails.
 *
 * run() never throws. Every failure is reported through MutationResult.
 */
class StoreMutator {
public:
    StoreMutator();
    // Non-owning; `fileOps` must outlive the mutator.
    explicit StoreMutator(StoreFileOps &fileOps);
    ~StoreMutator();

    StoreMutator(const StoreMutator &) = delete;
    StoreMutator &operator=(const StoreMutator &) = delete;

    MutationResult run(const std::filesystem::path &storePath,
                       SchemaFamily family,
                       const CutoffSet &cutoffs);
    MutationResult run(const std::filesystem::path &storePath,
                       const SchemaDescriptor &descriptor,
                       const CutoffSet &cutoffs);

    // Suffix markers for transient files; a random token sits between the
    // store name and these.
    static constexpr const char *kBackupSuffix = ".bak";
    static constexpr const char *kWorkingSuffix = ".work";
    static constexpr const char *kTransientTag = ::histscrub::kTransientTag;

private:
    struct Cycle;

    void backUp(Cycle &cycle);
    void openWorkingCopy(Cycle &cycle);
    void compact(Cycle &cycle);
    void swap(Cycle &cycle);
    void removeBackup(Cycle &cycle, MutationResult &result);

    void fail(Cycle &cycle, ErrorKind kind, const std::string &detail,
              MutationResult &result);
    bool restoreFromBackup(Cycle &cycle, std::string &error);
    void discardWorkingCopy(Cycle &cycle, MutationResult &result);
    void transition(Cycle &cycle, MutationState next);

    std::unique_ptr<StoreFileOps> m_ownedOps;
    StoreFileOps *m_ops = nullptr;
};

} // namespace histscrub
