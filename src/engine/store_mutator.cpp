#include "engine/store_mutator.hpp"

#include <cstdint>
#include <vector>

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/sqlite_database.hpp"

namespace histscrub {

struct StoreMutator::Cycle {
    std::filesystem::path live;
    std::filesystem::path backup;
    std::filesystem::path working;
    std::string family;

    MutationState state = MutationState::Idle;
    std::unique_ptr<SqliteDatabase> db;

    bool backupCreated = false;
    std::vector<const char *> backedUpSidecars;
    bool workingCreated = false;
    bool liveRemoved = false;
    bool liveReplaced = false;
};

StoreMutator::StoreMutator()
    : m_ownedOps(std::make_unique<StoreFileOps>())
    , m_ops(m_ownedOps.get())
{
}

StoreMutator::StoreMutator(StoreFileOps &fileOps)
    : m_ops(&fileOps)
{
}

StoreMutator::~StoreMutator() = default;

MutationResult StoreMutator::run(const std::filesystem::path &storePath,
                                 SchemaFamily family,
                                 const CutoffSet &cutoffs)
{
    return run(storePath, descriptorFor(family), cutoffs);
}

MutationResult StoreMutator::run(const std::filesystem::path &storePath,
                                 const SchemaDescriptor &descriptor,
                                 const CutoffSet &cutoffs)
{
    const std::string token = newTransientToken();

    Cycle cycle;
    cycle.live = storePath;
    cycle.backup = transientPath(storePath, token, kBackupSuffix);
    cycle.working = transientPath(storePath, token, kWorkingSuffix);
    cycle.family = toFamilyString(descriptor.family);

    MutationResult result;

    try {
        backUp(cycle);
        openWorkingCopy(cycle);

        SchemaAdapter adapter = guarded(ErrorKind::SchemaMismatch, "resolve schema", [&]() {
            return SchemaAdapter(descriptor, *cycle.db);
        });

        guarded(ErrorKind::DeleteFailed, "prune", [&]() {
            Transaction transaction(*cycle.db);

            result.rowsRemoved = adapter.countAffectedVisits(cutoffs);
            transition(cycle, MutationState::CountedAffected);

            const int64_t visitsRemoved = adapter.deleteVisits(cutoffs);
            const std::vector<int64_t> orphans = adapter.findOrphanPages();
            const int64_t auxRemoved = adapter.deleteAuxiliaryOrphans(orphans);
            const int64_t pagesRemoved = adapter.deleteOrphanPages();
            const int64_t timedRemoved = adapter.deleteTimedRecords(cutoffs);

            const IntegrityReport integrity = adapter.verifyIntegrity();
            if (!integrity.clean()) {
                throw SweepError(ErrorKind::DeleteFailed,
                                 "referential integrity not restored: "
                                     + std::to_string(integrity.danglingVisits)
                                     + " dangling visits, "
                                     + std::to_string(integrity.orphanPages)
                                     + " orphan pages");
            }
            transition(cycle, MutationState::Deleted);

            HSLOG_DEBUG(QStringLiteral("StoreMutator"),
                        QStringLiteral("run"),
                        QStringLiteral("rows_deleted"),
                        QStringLiteral("prune"),
                        QStringLiteral("sqlite_delete"),
                        ::histscrub::logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"store", cycle.live.string()},
                                        {"counted", result.rowsRemoved},
                                        {"visits", visitsRemoved},
                                        {"auxiliary", auxRemoved},
                                        {"pages", pagesRemoved},
                                        {"timedRecords", timedRemoved}}));

            // Compaction cannot run inside a transaction; end it first.
            transaction.commit();
            transition(cycle, MutationState::Committed);
        });

        compact(cycle);
        swap(cycle);
        removeBackup(cycle, result);
    } catch (const SweepError &e) {
        fail(cycle, e.kind(), e.what(), result);
        return result;
    } catch (const std::exception &e) {
        fail(cycle, ErrorKind::DeleteFailed, e.what(), result);
        return result;
    }

    transition(cycle, MutationState::Done);
    result.succeeded = true;
    result.finalState = MutationState::Done;

    HSLOG_INFO(QStringLiteral("StoreMutator"),
               QStringLiteral("run"),
               QStringLiteral("store_pruned"),
               QStringLiteral("user_request"),
               QStringLiteral("backup_copy_swap"),
               ::histscrub::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"store", cycle.live.string()},
                               {"family", cycle.family},
                               {"rowsRemoved", result.rowsRemoved},
                               {"warnings", result.warnings}}));
    return result;
}

void StoreMutator::transition(Cycle &cycle, MutationState next)
{
    HSLOG_DEBUG(QStringLiteral("StoreMutator"),
                QStringLiteral("transition"),
                QStringLiteral("state_change"),
                QStringLiteral("mutation_cycle"),
                QStringLiteral("state_machine"),
                ::histscrub::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"store", cycle.live.string()},
                                {"from", toStateString(cycle.state)},
                                {"to", toStateString(next)}}));
    cycle.state = next;
}

void StoreMutator::backUp(Cycle &cycle)
{
    std::string error;
    if (!m_ops->copyFile(cycle.live, cycle.backup, error)) {
        std::string cleanupError;
        m_ops->removeFile(cycle.backup, cleanupError);
        throw SweepError(ErrorKind::BackupFailed, error);
    }
    cycle.backupCreated = true;

    for (const char *suffix : kContentSidecars) {
        const auto liveSidecar = sidecarPath(cycle.live, suffix);
        if (!m_ops->exists(liveSidecar)) {
            continue;
        }
        if (!m_ops->copyFile(liveSidecar, sidecarPath(cycle.backup, suffix), error)) {
            std::string cleanupError;
            m_ops->removeFile(cycle.backup, cleanupError);
            for (const char *copied : cycle.backedUpSidecars) {
                m_ops->removeFile(sidecarPath(cycle.backup, copied), cleanupError);
            }
            m_ops->removeFile(sidecarPath(cycle.backup, suffix), cleanupError);
            cycle.backupCreated = false;
            cycle.backedUpSidecars.clear();
            throw SweepError(ErrorKind::BackupFailed, error);
        }
        cycle.backedUpSidecars.push_back(suffix);
    }

    transition(cycle, MutationState::BackedUp);
}

void StoreMutator::openWorkingCopy(Cycle &cycle)
{
    std::string error;
    cycle.workingCreated = true;
    if (!m_ops->copyFile(cycle.live, cycle.working, error)) {
        throw SweepError(ErrorKind::CopyFailed, error);
    }
    for (const char *suffix : kContentSidecars) {
        const auto liveSidecar = sidecarPath(cycle.live, suffix);
        if (m_ops->exists(liveSidecar)
            && !m_ops->copyFile(liveSidecar, sidecarPath(cycle.working, suffix), error)) {
            throw SweepError(ErrorKind::CopyFailed, error);
        }
    }

    cycle.db = guarded(ErrorKind::CopyFailed, "open working copy", [&]() {
        return std::make_unique<SqliteDatabase>(cycle.working);
    });
    transition(cycle, MutationState::WorkingCopyOpen);
}

void StoreMutator::compact(Cycle &cycle)
{
    guarded(ErrorKind::CompactFailed, "compact", [&]() {
        cycle.db->exec("VACUUM;");

        const std::string check = cycle.db->quickCheck();
        if (check != "ok") {
            throw SweepError(ErrorKind::CompactFailed, "quick_check: " + check);
        }

        // Fold the WAL back into the main file so the copy travels alone.
        if (cycle.db->isWalMode()) {
            cycle.db->exec("PRAGMA wal_checkpoint(TRUNCATE);");
        }
        cycle.db->close();
    });
    cycle.db.reset();
    transition(cycle, MutationState::Compacted);
}

void StoreMutator::swap(Cycle &cycle)
{
    std::string error;
    if (!m_ops->removeFile(cycle.live, error)) {
        throw SweepError(ErrorKind::SwapFailed, error);
    }
    cycle.liveRemoved = true;

    // A stale WAL beside the new file would be replayed into it on open.
    for (const char *suffix : kAllSidecars) {
        if (!m_ops->removeFile(sidecarPath(cycle.live, suffix), error)) {
            throw SweepError(ErrorKind::SwapFailed, error);
        }
    }

    if (!m_ops->renameFile(cycle.working, cycle.live, error)) {
        throw SweepError(ErrorKind::SwapFailed, error);
    }
    cycle.liveReplaced = true;
    cycle.workingCreated = false;

    for (const char *suffix : kAllSidecars) {
        std::string ignored;
        m_ops->removeFile(sidecarPath(cycle.working, suffix), ignored);
    }

    transition(cycle, MutationState::Swapped);
}

void StoreMutator::removeBackup(Cycle &cycle, MutationResult &result)
{
    std::string error;
    bool removed = m_ops->removeFile(cycle.backup, error);
    for (const char *suffix : cycle.backedUpSidecars) {
        std::string sidecarError;
        if (!m_ops->removeFile(sidecarPath(cycle.backup, suffix), sidecarError)) {
            removed = false;
            error = sidecarError;
        }
    }

    if (!removed) {
        result.backupRetained = cycle.backup;
        result.warnings.push_back("backup not removed: " + error);
        HSLOG_WARN(QStringLiteral("StoreMutator"),
                   QStringLiteral("removeBackup"),
                   QStringLiteral("backup_not_removed"),
                   QStringLiteral("cleanup_after_swap"),
                   QStringLiteral("filesystem_remove"),
                   ::histscrub::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"backup", cycle.backup.string()}, {"error", error}}));
        return;
    }
    transition(cycle, MutationState::BackupRemoved);
}

void StoreMutator::discardWorkingCopy(Cycle &cycle, MutationResult &result)
{
    cycle.db.reset();
    if (!cycle.workingCreated) {
        return;
    }

    std::string error;
    if (!m_ops->removeFile(cycle.working, error)) {
        result.warnings.push_back("working copy not removed: " + error);
    }
    for (const char *suffix : kAllSidecars) {
        if (!m_ops->removeFile(sidecarPath(cycle.working, suffix), error)) {
            result.warnings.push_back("working copy sidecar not removed: " + error);
        }
    }
    cycle.workingCreated = false;
}

bool StoreMutator::restoreFromBackup(Cycle &cycle, std::string &error)
{
    if (!m_ops->copyFile(cycle.backup, cycle.live, error)) {
        return false;
    }
    for (const char *suffix : cycle.backedUpSidecars) {
        if (!m_ops->copyFile(sidecarPath(cycle.backup, suffix),
                             sidecarPath(cycle.live, suffix), error)) {
            return false;
        }
    }
    return true;
}

void StoreMutator::fail(Cycle &cycle, ErrorKind kind, const std::string &detail,
                        MutationResult &result)
{
    const MutationState failedAt = cycle.state;
    discardWorkingCopy(cycle, result);

    ErrorKind finalKind = kind;
    std::string finalDetail = detail;

    if (cycle.backupCreated) {
        result.backupRetained = cycle.backup;

        const bool liveDamaged = cycle.liveRemoved || cycle.liveReplaced
            || !m_ops->exists(cycle.live);
        if (liveDamaged) {
            result.restoreAttempted = true;
            std::string restoreError;
            if (restoreFromBackup(cycle, restoreError)) {
                finalDetail += "; live store restored from backup";
            } else {
                finalKind = ErrorKind::RestoreFailed;
                finalDetail += "; restore from backup failed: " + restoreError;
            }
        }
    }

    result.succeeded = false;
    result.rowsRemoved = 0;
    result.errorKind = finalKind;
    result.errorDetail = finalDetail;
    result.finalState = MutationState::Failed;
    transition(cycle, MutationState::Failed);

    const nlohmann::json context{{"store", cycle.live.string()},
                                 {"family", cycle.family},
                                 {"kind", toErrorKindString(finalKind)},
                                 {"failedAfter", toStateString(failedAt)},
                                 {"detail", finalDetail},
                                 {"backup", result.backupRetained.string()},
                                 {"restoreAttempted", result.restoreAttempted}};
    if (finalKind == ErrorKind::RestoreFailed) {
        HSLOG_ERROR(QStringLiteral("StoreMutator"),
                    QStringLiteral("fail"),
                    QStringLiteral("restore_failed"),
                    QStringLiteral("data_durability"),
                    QStringLiteral("backup_copy"),
                    ::histscrub::logging::defaultWho(),
                    QString(),
                    context);
    } else {
        HSLOG_ERROR(QStringLiteral("StoreMutator"),
                    QStringLiteral("fail"),
                    QStringLiteral("store_prune_failed"),
                    QStringLiteral("mutation_step_failed"),
                    QStringLiteral("state_machine"),
                    ::histscrub::logging::defaultWho(),
                    QString(),
                    context);
    }
}

} // namespace histscrub
