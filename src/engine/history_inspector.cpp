#include "engine/history_inspector.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/epoch_normalizer.hpp"
#include "engine/schema_adapter.hpp"
#include "engine/sqlite_database.hpp"

namespace histscrub {

namespace {

// Removes a working copy and its sidecars when the read is over.
class ViewCopy {
public:
    ViewCopy(StoreFileOps &ops, std::filesystem::path path, std::vector<std::string> &warnings)
        : m_ops(ops)
        , m_path(std::move(path))
        , m_warnings(warnings)
    {
    }

    ~ViewCopy()
    {
        std::string error;
        if (!m_ops.removeFile(m_path, error)) {
            m_warnings.push_back("working copy not removed: " + error);
        }
        for (const char *suffix : kAllSidecars) {
            if (!m_ops.removeFile(sidecarPath(m_path, suffix), error)) {
                m_warnings.push_back("working copy sidecar not removed: " + error);
            }
        }
    }

    ViewCopy(const ViewCopy &) = delete;
    ViewCopy &operator=(const ViewCopy &) = delete;

    const std::filesystem::path &path() const { return m_path; }

private:
    StoreFileOps &m_ops;
    std::filesystem::path m_path;
    std::vector<std::string> &m_warnings;
};

} // namespace

HistoryInspector::HistoryInspector(const ProfileLocator &locator)
    : m_locator(locator)
    , m_ownedOps(std::make_unique<StoreFileOps>())
    , m_ops(m_ownedOps.get())
{
}

HistoryInspector::HistoryInspector(const ProfileLocator &locator, StoreFileOps &fileOps)
    : m_locator(locator)
    , m_ops(&fileOps)
{
}

HistoryInspector::~HistoryInspector() = default;

InspectReport HistoryInspector::inspect(const std::vector<Browser> &browsers, int limit)
{
    if (limit <= 0) {
        throw std::invalid_argument("list limit must be positive");
    }

    InspectReport report;
    const LocatedStores located = m_locator.locate(browsers);
    report.absent = located.absent;

    for (const StoreTarget &target : located.targets) {
        ::histscrub::logging::CorrelationScope scope(
            ::histscrub::logging::newCorrelationId());

        std::vector<std::string> warnings;
        try {
            const std::vector<HistoryEntry> entries = readStore(target, limit, warnings);
            report.entries.insert(report.entries.end(), entries.begin(), entries.end());
            ++report.storesRead;
        } catch (const SweepError &e) {
            report.errors.push_back(StoreError{target.browser, target.profileLabel,
                                               target.storePath, e.kind(), e.what()});
            HSLOG_WARN(QStringLiteral("HistoryInspector"),
                       QStringLiteral("inspect"),
                       QStringLiteral("store_not_read"),
                       QStringLiteral("inspection_failed"),
                       QStringLiteral("store_boundary"),
                       ::histscrub::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"browser", target.browser},
                                       {"store", target.storePath.string()},
                                       {"kind", e.kind()},
                                       {"detail", e.what()}}));
        }
        for (const std::string &warning : warnings) {
            report.warnings.push_back(
                SweepWarning{target.browser, target.profileLabel, target.storePath, warning});
        }
    }

    std::stable_sort(report.entries.begin(), report.entries.end(),
                     [](const HistoryEntry &a, const HistoryEntry &b) {
                         return a.visitedAt > b.visitedAt;
                     });
    if (report.entries.size() > static_cast<size_t>(limit)) {
        report.entries.resize(static_cast<size_t>(limit));
    }

    HSLOG_INFO(QStringLiteral("HistoryInspector"),
               QStringLiteral("inspect"),
               QStringLiteral("inspect_finished"),
               QStringLiteral("user_request"),
               QStringLiteral("working_copy_read"),
               ::histscrub::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"browsers", browsers},
                               {"limit", limit},
                               {"storesRead", report.storesRead},
                               {"entries", report.entries.size()},
                               {"errors", report.errors.size()}}));
    return report;
}

std::vector<HistoryEntry> HistoryInspector::readStore(const StoreTarget &target, int limit,
                                                      std::vector<std::string> &warnings)
{
    const SchemaDescriptor &d = descriptorFor(familyOf(target.browser));
    const ViewCopy copy(*m_ops,
                        transientPath(target.storePath, newTransientToken(), kViewSuffix),
                        warnings);

    std::string error;
    if (!m_ops->copyFile(target.storePath, copy.path(), error)) {
        throw SweepError(ErrorKind::CopyFailed, error);
    }
    for (const char *suffix : kContentSidecars) {
        const auto liveSidecar = sidecarPath(target.storePath, suffix);
        if (m_ops->exists(liveSidecar)
            && !m_ops->copyFile(liveSidecar, sidecarPath(copy.path(), suffix), error)) {
            throw SweepError(ErrorKind::CopyFailed, error);
        }
    }

    // Declared after `copy` so the connection closes before the files go.
    const auto db = guarded(ErrorKind::CopyFailed, "open working copy", [&]() {
        return std::make_unique<SqliteDatabase>(copy.path());
    });

    const std::string pageRef = guarded(ErrorKind::SchemaMismatch, "resolve schema", [&]() {
        const SchemaAdapter adapter(d, *db);
        if (!db->columnExists(d.visitTable, d.visitTimeColumn)) {
            throw SweepError(ErrorKind::SchemaMismatch,
                             "'" + d.visitTable + "' has no '" + d.visitTimeColumn + "' column");
        }
        if (!db->columnExists(d.pageTable, d.pageUrlColumn)) {
            throw SweepError(ErrorKind::SchemaMismatch,
                             "'" + d.pageTable + "' has no '" + d.pageUrlColumn + "' column");
        }
        return adapter.pageRefColumn();
    });

    return guarded(ErrorKind::ReadFailed, "list visits", [&]() {
        const std::string visitTime = "v." + quoteIdentifier(d.visitTimeColumn);
        Statement stmt(db->handle(),
                       "SELECT p." + quoteIdentifier(d.pageUrlColumn) + ", " + visitTime
                           + " FROM " + quoteIdentifier(d.visitTable) + " v JOIN "
                           + quoteIdentifier(d.pageTable) + " p ON p."
                           + quoteIdentifier(d.pageKey) + " = v." + quoteIdentifier(pageRef)
                           + " ORDER BY " + visitTime + " DESC, v."
                           + quoteIdentifier(d.visitIdColumn) + " DESC LIMIT ?1;");
        stmt.bindInt64(1, limit);

        std::vector<HistoryEntry> entries;
        while (stmt.step()) {
            HistoryEntry entry;
            entry.browser = target.browser;
            entry.profileLabel = target.profileLabel;
            entry.url = stmt.columnText(0);
            entry.visitedAt = toUnixSeconds(d.epoch, stmt.columnInt64(1));
            entries.push_back(std::move(entry));
        }
        return entries;
    });
}

} // namespace histscrub
