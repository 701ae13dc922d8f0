#include "engine/schema_adapter.hpp"

#include <algorithm>

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace histscrub {

namespace {

constexpr const char *kDoomedPagesTable = "histscrub_doomed_pages";

SchemaDescriptor makeChromiumDescriptor()
{
    SchemaDescriptor d;
    d.family = SchemaFamily::Chromium;
    d.epoch = EpochFamily::ChromiumMicros1601;
    d.visitTable = "visits";
    d.visitIdColumn = "id";
    d.visitTimeColumn = "visit_time";
    // Current builds name the column `url`; some forks and older dumps use `url_id`.
    d.pageRefAliases = {"url", "url_id"};
    d.pageTable = "urls";
    d.pageKey = "id";
    d.pageUrlColumn = "url";
    d.pageAuxiliaries = {
        {"keyword_search_terms", {"url_id"}},
    };
    d.visitAuxiliaries = {
        {"visit_source", {"id"}},
        {"content_annotations", {"visit_id"}},
        {"context_annotations", {"visit_id"}},
    };
    d.timedRecords = {
        {"downloads", "id", "start_time",
         {{"downloads_url_chains", {"id"}}, {"downloads_slices", {"download_id"}}}},
    };
    d.timeFiltered = true;
    return d;
}

SchemaDescriptor makeGeckoDescriptor()
{
    SchemaDescriptor d;
    d.family = SchemaFamily::Gecko;
    d.epoch = EpochFamily::GeckoMicros1970;
    d.visitTable = "moz_historyvisits";
    d.visitIdColumn = "id";
    d.visitTimeColumn = "visit_date";
    d.pageRefAliases = {"place_id"};
    d.pageTable = "moz_places";
    d.pageKey = "id";
    d.pageUrlColumn = "url";
    d.pageAuxiliaries = {
        {"moz_inputhistory", {"place_id"}},
        {"moz_annos", {"place_id"}},
        {"moz_places_metadata", {"place_id"}},
    };
    d.preserveRelations = {
        {"moz_bookmarks", {"fk", "place_id"}},
        {"moz_keywords", {"place_id"}},
    };
    d.timeFiltered = true;
    return d;
}

SchemaDescriptor makeWebKitDescriptor()
{
    SchemaDescriptor d;
    d.family = SchemaFamily::WebKit;
    d.epoch = EpochFamily::WebKitSeconds1970;
    d.visitTable = "history_visits";
    d.visitIdColumn = "id";
    d.visitTimeColumn = "visit_time";
    d.pageRefAliases = {"history_item"};
    d.pageTable = "history_items";
    d.pageKey = "id";
    d.pageUrlColumn = "url";
    d.pageAuxiliaries = {
        {"history_items_to_tags", {"history_item"}},
    };
    d.timeFiltered = false;
    return d;
}

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

} // namespace

const SchemaDescriptor &descriptorFor(SchemaFamily family)
{
    static const SchemaDescriptor chromium = makeChromiumDescriptor();
    static const SchemaDescriptor gecko = makeGeckoDescriptor();
    static const SchemaDescriptor webkit = makeWebKitDescriptor();

    switch (family) {
    case SchemaFamily::Chromium:
        return chromium;
    case SchemaFamily::Gecko:
        return gecko;
    case SchemaFamily::WebKit:
        return webkit;
    }
    return chromium;
}

SchemaAdapter::SchemaAdapter(const SchemaDescriptor &descriptor, SqliteDatabase &db)
    : m_descriptor(descriptor)
    , m_db(db)
{
    resolveSchema();
}

bool SchemaAdapter::resolveKeyed(const KeyedTable &keyed, ResolvedTable &resolved,
                                 bool &tablePresent) const
{
    tablePresent = m_db.tableExists(keyed.table);
    if (!tablePresent) {
        return false;
    }
    const auto columns = m_db.columnNames(keyed.table);
    for (const auto &alias : keyed.keyAliases) {
        if (std::find(columns.begin(), columns.end(), alias) != columns.end()) {
            resolved.table = keyed.table;
            resolved.column = alias;
            return true;
        }
    }
    return false;
}

void SchemaAdapter::resolveSchema()
{
    const auto &d = m_descriptor;
    const std::string family = toFamilyString(d.family);

    if (!m_db.tableExists(d.visitTable)) {
        throw SweepError(ErrorKind::SchemaMismatch,
                         family + ": visit table '" + d.visitTable + "' not found");
    }
    if (!m_db.tableExists(d.pageTable)) {
        throw SweepError(ErrorKind::SchemaMismatch,
                         family + ": page table '" + d.pageTable + "' not found");
    }

    const auto visitColumns = m_db.columnNames(d.visitTable);
    const auto hasVisitColumn = [&visitColumns](const std::string &name) {
        return std::find(visitColumns.begin(), visitColumns.end(), name) != visitColumns.end();
    };

    for (const auto &alias : d.pageRefAliases) {
        if (hasVisitColumn(alias)) {
            m_pageRef = alias;
            break;
        }
    }
    if (m_pageRef.empty()) {
        throw SweepError(ErrorKind::SchemaMismatch,
                         family + ": '" + d.visitTable
                             + "' has none of the page-reference columns ("
                             + joinNames(d.pageRefAliases) + ")");
    }
    if (d.timeFiltered && !hasVisitColumn(d.visitTimeColumn)) {
        throw SweepError(ErrorKind::SchemaMismatch,
                         family + ": '" + d.visitTable + "' has no '"
                             + d.visitTimeColumn + "' column");
    }
    if (!m_db.columnExists(d.pageTable, d.pageKey)) {
        throw SweepError(ErrorKind::SchemaMismatch,
                         family + ": '" + d.pageTable + "' has no '" + d.pageKey + "' column");
    }

    for (const auto &keyed : d.preserveRelations) {
        ResolvedTable resolved;
        bool present = false;
        if (resolveKeyed(keyed, resolved, present)) {
            m_preserved.push_back(resolved);
        } else if (present) {
            // Cannot tell which pages are protected; pruning would be unsafe.
            throw SweepError(ErrorKind::SchemaMismatch,
                             family + ": preserved table '" + keyed.table
                                 + "' has none of the columns ("
                                 + joinNames(keyed.keyAliases) + ")");
        }
    }

    const auto resolveOptional = [this, &family](const std::vector<KeyedTable> &tables,
                                                 std::vector<ResolvedTable> &out) {
        for (const auto &keyed : tables) {
            ResolvedTable resolved;
            bool present = false;
            if (resolveKeyed(keyed, resolved, present)) {
                out.push_back(resolved);
                continue;
            }
            if (present) {
                HSLOG_WARN(QStringLiteral("SchemaAdapter"),
                           QStringLiteral("resolve_schema"),
                           QStringLiteral("auxiliary_column_missing"),
                           QStringLiteral("schema_drift"),
                           QStringLiteral("pragma_table_info"),
                           ::histscrub::logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"family", family},
                                           {"table", keyed.table},
                                           {"aliases", keyed.keyAliases}}));
            }
        }
    };

    resolveOptional(d.pageAuxiliaries, m_pageAuxiliaries);
    for (const auto &timed : d.timedRecords) {
        if (!m_db.tableExists(timed.table)) {
            continue;
        }
        if (!m_db.columnExists(timed.table, timed.idColumn)
            || !m_db.columnExists(timed.table, timed.timeColumn)) {
            HSLOG_WARN(QStringLiteral("SchemaAdapter"),
                       QStringLiteral("resolve_schema"),
                       QStringLiteral("timed_table_column_missing"),
                       QStringLiteral("schema_drift"),
                       QStringLiteral("pragma_table_info"),
                       ::histscrub::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"family", family},
                                       {"table", timed.table},
                                       {"columns", nlohmann::json::array({timed.idColumn, timed.timeColumn})}}));
            continue;
        }
        std::vector<ResolvedTable> children;
        resolveOptional(timed.children, children);
        m_timed.emplace_back(&timed, std::move(children));
    }
    if (hasVisitColumn(d.visitIdColumn)) {
        resolveOptional(d.visitAuxiliaries, m_visitAuxiliaries);
    }

    nlohmann::json auxNames = nlohmann::json::array();
    for (const auto &aux : m_pageAuxiliaries) {
        auxNames.push_back(aux.table);
    }
    for (const auto &aux : m_visitAuxiliaries) {
        auxNames.push_back(aux.table);
    }
    for (const auto &timed : m_timed) {
        auxNames.push_back(timed.first->table);
    }
    nlohmann::json preservedNames = nlohmann::json::array();
    for (const auto &rel : m_preserved) {
        preservedNames.push_back(rel.table + "." + rel.column);
    }
    HSLOG_DEBUG(QStringLiteral("SchemaAdapter"),
                QStringLiteral("resolve_schema"),
                QStringLiteral("schema_resolved"),
                QStringLiteral("adapter_bind"),
                QStringLiteral("pragma_table_info"),
                ::histscrub::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"family", family},
                                {"pageRef", m_pageRef},
                                {"auxiliaries", auxNames},
                                {"preserved", preservedNames}}));
}

bool SchemaAdapter::filtersByTime(const CutoffSet &cutoffs) const
{
    return m_descriptor.timeFiltered && !cutoffs.unbounded;
}

std::string SchemaAdapter::affectedVisitPredicate(bool byTime) const
{
    if (!byTime) {
        return "1";
    }
    const std::string visits = quoteIdentifier(m_descriptor.visitTable);
    const std::string pages = quoteIdentifier(m_descriptor.pageTable);
    return "(" + visits + "." + quoteIdentifier(m_descriptor.visitTimeColumn) + " >= ?1"
        + " OR NOT EXISTS (SELECT 1 FROM " + pages + " WHERE " + pages + "."
        + quoteIdentifier(m_descriptor.pageKey) + " = " + visits + "."
        + quoteIdentifier(m_pageRef) + "))";
}

std::string SchemaAdapter::orphanPagePredicate(const std::string &pageRef) const
{
    std::string predicate = "NOT EXISTS (SELECT 1 FROM "
        + quoteIdentifier(m_descriptor.visitTable) + " AS hs_v WHERE hs_v."
        + quoteIdentifier(m_pageRef) + " = " + pageRef + ")";

    int index = 0;
    for (const auto &rel : m_preserved) {
        const std::string alias = "hs_p" + std::to_string(index++);
        predicate += " AND NOT EXISTS (SELECT 1 FROM " + quoteIdentifier(rel.table)
            + " AS " + alias + " WHERE " + alias + "." + quoteIdentifier(rel.column)
            + " = " + pageRef + ")";
    }
    return predicate;
}

int64_t SchemaAdapter::countAffectedVisits(const CutoffSet &cutoffs)
{
    const bool byTime = filtersByTime(cutoffs);
    Statement stmt(m_db.handle(),
                   "SELECT COUNT(*) FROM " + quoteIdentifier(m_descriptor.visitTable)
                       + " WHERE " + affectedVisitPredicate(byTime) + ";");
    if (byTime) {
        stmt.bindInt64(1, cutoffs.valueFor(m_descriptor.epoch));
    }
    if (!stmt.step()) {
        return 0;
    }
    return stmt.columnInt64(0);
}

int64_t SchemaAdapter::deleteVisits(const CutoffSet &cutoffs)
{
    const bool byTime = filtersByTime(cutoffs);
    const std::string visits = quoteIdentifier(m_descriptor.visitTable);

    Statement stmt(m_db.handle(),
                   "DELETE FROM " + visits + " WHERE " + affectedVisitPredicate(byTime) + ";");
    if (byTime) {
        stmt.bindInt64(1, cutoffs.valueFor(m_descriptor.epoch));
    }
    stmt.step();
    const int64_t removed = m_db.changes();

    for (const auto &aux : m_visitAuxiliaries) {
        const std::string table = quoteIdentifier(aux.table);
        m_db.exec("DELETE FROM " + table + " WHERE NOT EXISTS (SELECT 1 FROM " + visits
                  + " WHERE " + visits + "." + quoteIdentifier(m_descriptor.visitIdColumn)
                  + " = " + table + "." + quoteIdentifier(aux.column) + ");");
    }

    return removed;
}

std::vector<int64_t> SchemaAdapter::findOrphanPages()
{
    const std::string pages = quoteIdentifier(m_descriptor.pageTable);
    const std::string key = pages + "." + quoteIdentifier(m_descriptor.pageKey);
    Statement stmt(m_db.handle(),
                   "SELECT " + key + " FROM " + pages + " WHERE "
                       + orphanPagePredicate(key) + ";");

    std::vector<int64_t> ids;
    while (stmt.step()) {
        if (!stmt.columnIsNull(0)) {
            ids.push_back(stmt.columnInt64(0));
        }
    }
    return ids;
}

int64_t SchemaAdapter::deleteAuxiliaryOrphans(const std::vector<int64_t> &pageIds)
{
    if (pageIds.empty() || m_pageAuxiliaries.empty()) {
        return 0;
    }

    const std::string doomed = std::string("temp.") + kDoomedPagesTable;
    m_db.exec("CREATE TEMP TABLE IF NOT EXISTS " + std::string(kDoomedPagesTable)
              + " (id INTEGER PRIMARY KEY);");
    m_db.exec("DELETE FROM " + doomed + ";");
    {
        Statement insert(m_db.handle(),
                         "INSERT OR IGNORE INTO " + doomed + " (id) VALUES (?1);");
        for (const int64_t id : pageIds) {
            insert.bindInt64(1, id);
            insert.step();
            insert.reset();
        }
    }

    int64_t removed = 0;
    for (const auto &aux : m_pageAuxiliaries) {
        const std::string table = quoteIdentifier(aux.table);
        m_db.exec("DELETE FROM " + table + " WHERE " + table + "."
                  + quoteIdentifier(aux.column) + " IN (SELECT id FROM " + doomed + ");");
        removed += m_db.changes();
    }

    m_db.exec("DROP TABLE " + doomed + ";");
    return removed;
}

int64_t SchemaAdapter::deleteOrphanPages()
{
    const std::string pages = quoteIdentifier(m_descriptor.pageTable);
    m_db.exec("DELETE FROM " + pages + " WHERE "
              + orphanPagePredicate(pages + "." + quoteIdentifier(m_descriptor.pageKey)) + ";");
    return m_db.changes();
}

int64_t SchemaAdapter::deleteTimedRecords(const CutoffSet &cutoffs)
{
    const bool byTime = filtersByTime(cutoffs);
    int64_t removed = 0;

    for (const auto &entry : m_timed) {
        const TimedTable &timed = *entry.first;
        const std::string parent = quoteIdentifier(timed.table);

        Statement stmt(m_db.handle(),
                       "DELETE FROM " + parent
                           + (byTime ? " WHERE " + quoteIdentifier(timed.timeColumn) + " >= ?1"
                                     : std::string())
                           + ";");
        if (byTime) {
            stmt.bindInt64(1, cutoffs.valueFor(m_descriptor.epoch));
        }
        stmt.step();
        removed += m_db.changes();

        for (const auto &child : entry.second) {
            const std::string table = quoteIdentifier(child.table);
            m_db.exec("DELETE FROM " + table + " WHERE NOT EXISTS (SELECT 1 FROM " + parent
                      + " WHERE " + parent + "." + quoteIdentifier(timed.idColumn) + " = "
                      + table + "." + quoteIdentifier(child.column) + ");");
            removed += m_db.changes();
        }
    }
    return removed;
}

IntegrityReport SchemaAdapter::verifyIntegrity()
{
    const std::string visits = quoteIdentifier(m_descriptor.visitTable);
    const std::string pages = quoteIdentifier(m_descriptor.pageTable);
    const std::string key = pages + "." + quoteIdentifier(m_descriptor.pageKey);

    IntegrityReport report;
    report.danglingVisits = m_db.queryInt64(
        "SELECT COUNT(*) FROM " + visits + " WHERE NOT EXISTS (SELECT 1 FROM " + pages
        + " WHERE " + key + " = " + visits + "." + quoteIdentifier(m_pageRef) + ");");
    report.orphanPages = m_db.queryInt64(
        "SELECT COUNT(*) FROM " + pages + " WHERE " + orphanPagePredicate(key) + ";");
    return report;
}

} // namespace histscrub
