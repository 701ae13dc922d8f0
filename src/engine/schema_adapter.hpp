#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"
#include "engine/sqlite_database.hpp"

namespace histscrub {

// A table whose rows hang off a page (or visit) id through one of several
// historically used column names.
struct KeyedTable {
    std::string table;
    std::vector<std::string> keyAliases;
};

// Activity records kept in the history store but outside the visit
// graph (downloads). Rows at or after the cutoff go, then children whose
// parent row is gone.
struct TimedTable {
    std::string table;
    std::string idColumn;
    std::string timeColumn;
    std::vector<KeyedTable> children;
};

// Static description of one browser family's history schema.
struct SchemaDescriptor {
    SchemaFamily family = SchemaFamily::Chromium;
    EpochFamily epoch = EpochFamily::ChromiumMicros1601;

    std::string visitTable;
    std::string visitIdColumn;
    std::string visitTimeColumn;
    // Tried in order against the live schema; the first present wins.
    std::vector<std::string> pageRefAliases;

    std::string pageTable;
    std::string pageKey;
    std::string pageUrlColumn;

    // Rows removed together with their parent page.
    std::vector<KeyedTable> pageAuxiliaries;
    // Rows removed once their visit is gone.
    std::vector<KeyedTable> visitAuxiliaries;
    // Pages referenced here survive without any visit (e.g. bookmarks).
    std::vector<KeyedTable> preserveRelations;
    // Pruned with the same cutoff as visits; optional in the live schema.
    std::vector<TimedTable> timedRecords;

    // False for stores that only support whole-table clears.
    bool timeFiltered = true;
};

const SchemaDescriptor &descriptorFor(SchemaFamily family);

struct IntegrityReport {
    int64_t danglingVisits = 0;
    int64_t orphanPages = 0;

    bool clean() const { return danglingVisits == 0 && orphanPages == 0; }
};

// SchemaAdapter binds a descriptor to an open working copy. Construction
// resolves the live schema and throws SweepError(SchemaMismatch) when a
// required table or column cannot be resolved. Operations never commit
// or compact; SQL failures surface as std::runtime_error.
class SchemaAdapter {
public:
    SchemaAdapter(const SchemaDescriptor &descriptor, SqliteDatabase &db);

    const SchemaDescriptor &descriptor() const { return m_descriptor; }
    const std::string &pageRefColumn() const { return m_pageRef; }

    // Visits newer than or equal to the cutoff, plus visits whose page row
    // is missing. Every visit when the cutoff is unbounded or the family is
    // not time filtered.
    int64_t countAffectedVisits(const CutoffSet &cutoffs);
    int64_t deleteVisits(const CutoffSet &cutoffs);

    // Pages referenced by no visit and no preserved relation.
    std::vector<int64_t> findOrphanPages();
    int64_t deleteAuxiliaryOrphans(const std::vector<int64_t> &pageIds);
    int64_t deleteOrphanPages();

    // Rows removed across every resolved timed table and its children.
    int64_t deleteTimedRecords(const CutoffSet &cutoffs);

    IntegrityReport verifyIntegrity();

private:
    struct ResolvedTable {
        std::string table;
        std::string column;
    };

    void resolveSchema();
    bool resolveKeyed(const KeyedTable &keyed, ResolvedTable &resolved,
                      bool &tablePresent) const;

    bool filtersByTime(const CutoffSet &cutoffs) const;
    std::string affectedVisitPredicate(bool byTime) const;
    std::string orphanPagePredicate(const std::string &pageRef) const;

    const SchemaDescriptor &m_descriptor;
    SqliteDatabase &m_db;

    std::string m_pageRef;
    std::vector<ResolvedTable> m_pageAuxiliaries;
    std::vector<ResolvedTable> m_visitAuxiliaries;
    std::vector<ResolvedTable> m_preserved;
    // Parent timed tables with the children that resolved against them.
    std::vector<std::pair<const TimedTable *, std::vector<ResolvedTable>>> m_timed;
};

} // namespace histscrub
