#include "engine/sqlite_database.hpp"

#include <stdexcept>

#include <sqlite3.h>

#include <QString>

#include "common/logging.hpp"

namespace histscrub {

namespace {

constexpr int kBusyTimeoutMs = 2000;

std::string errorMessage(sqlite3 *db, const std::string &context)
{
    const char *message = db ? sqlite3_errmsg(db) : nullptr;
    return context + ": " + (message ? message : "unknown sqlite error");
}

} // namespace

std::string quoteIdentifier(const std::string &name)
{
    std::string quoted = "\"";
    for (const char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

SqliteDatabase::SqliteDatabase(const std::filesystem::path &path)
    : m_path(path)
{
    const int rc = sqlite3_open_v2(path.string().c_str(), &m_db,
                                   SQLITE_OPEN_READWRITE, nullptr);
    if (rc != SQLITE_OK) {
        const std::string message = errorMessage(m_db, "open " + path.string());
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(message);
    }
    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);

    // sqlite3_open_v2 is lazy; touch the schema so a non-database file
    // fails here rather than halfway through a mutation.
    queryInt64("SELECT COUNT(*) FROM sqlite_master;");
}

SqliteDatabase::~SqliteDatabase()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

void SqliteDatabase::close()
{
    if (!m_db) {
        return;
    }
    if (sqlite3_close(m_db) != SQLITE_OK) {
        throw std::runtime_error(errorMessage(m_db, "close"));
    }
    m_db = nullptr;
}

void SqliteDatabase::exec(const std::string &sql)
{
    char *error = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message + " [" + sql + "]");
    }
}

int64_t SqliteDatabase::queryInt64(const std::string &sql)
{
    Statement stmt(m_db, sql);
    if (!stmt.step()) {
        throw std::runtime_error("query returned no rows [" + sql + "]");
    }
    return stmt.columnInt64(0);
}

int64_t SqliteDatabase::changes() const
{
    return sqlite3_changes(m_db);
}

bool SqliteDatabase::tableExists(const std::string &table) const
{
    Statement stmt(m_db,
                   "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ? LIMIT 1;");
    stmt.bindText(1, table);
    return stmt.step();
}

std::vector<std::string> SqliteDatabase::columnNames(const std::string &table) const
{
    Statement stmt(m_db, "PRAGMA table_info(" + quoteIdentifier(table) + ");");
    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(stmt.columnText(1));
    }
    return names;
}

bool SqliteDatabase::columnExists(const std::string &table, const std::string &column) const
{
    for (const auto &name : columnNames(table)) {
        if (name == column) {
            return true;
        }
    }
    return false;
}

std::string SqliteDatabase::quickCheck()
{
    Statement stmt(m_db, "PRAGMA quick_check;");
    if (!stmt.step()) {
        return "quick_check returned no result";
    }
    return stmt.columnText(0);
}

bool SqliteDatabase::isWalMode()
{
    Statement stmt(m_db, "PRAGMA journal_mode;");
    if (!stmt.step()) {
        return false;
    }
    return stmt.columnText(0) == "wal";
}

Statement::Statement(sqlite3 *db, const std::string &sql)
    : m_db(db)
{
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(errorMessage(db, "prepare [" + sql + "]"));
    }
}

Statement::~Statement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

void Statement::bindInt64(int index, int64_t value)
{
    if (sqlite3_bind_int64(m_stmt, index, value) != SQLITE_OK) {
        throw std::runtime_error(errorMessage(m_db, "bind"));
    }
}

void Statement::bindText(int index, const std::string &value)
{
    if (sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error(errorMessage(m_db, "bind"));
    }
}

bool Statement::step()
{
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(errorMessage(m_db, "step"));
}

void Statement::reset()
{
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

int64_t Statement::columnInt64(int index) const
{
    return sqlite3_column_int64(m_stmt, index);
}

bool Statement::columnIsNull(int index) const
{
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

std::string Statement::columnText(int index) const
{
    const unsigned char *text = sqlite3_column_text(m_stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

Transaction::Transaction(SqliteDatabase &db)
    : m_db(db)
{
    m_db.exec("BEGIN IMMEDIATE;");
    m_open = true;
}

Transaction::~Transaction()
{
    if (!m_open || !m_db.isOpen()) {
        return;
    }
    char *error = nullptr;
    if (sqlite3_exec(m_db.handle(), "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
        HSLOG_WARN(QStringLiteral("SqliteDatabase"),
                   QStringLiteral("~Transaction"),
                   QStringLiteral("rollback_failed"),
                   QStringLiteral("transaction_abandoned"),
                   QStringLiteral("sqlite_exec"),
                   ::histscrub::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_db.path().string()},
                                   {"error", error ? error : "unknown"}}));
    }
    sqlite3_free(error);
}

void Transaction::commit()
{
    m_db.exec("COMMIT;");
    m_open = false;
}

} // namespace histscrub
