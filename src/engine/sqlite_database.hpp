#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace histscrub {

// Thin RAII layer over the SQLite C API. Every failure throws
// std::runtime_error carrying sqlite3_errmsg(); callers decide which
// ErrorKind a failure maps to.
class SqliteDatabase {
public:
    // Opens an existing file read-write. Never creates a database.
    explicit SqliteDatabase(const std::filesystem::path &path);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase &) = delete;
    SqliteDatabase &operator=(const SqliteDatabase &) = delete;

    sqlite3 *handle() const { return m_db; }
    bool isOpen() const { return m_db != nullptr; }
    const std::filesystem::path &path() const { return m_path; }

    void exec(const std::string &sql);
    int64_t queryInt64(const std::string &sql);
    int64_t changes() const;

    bool tableExists(const std::string &table) const;
    std::vector<std::string> columnNames(const std::string &table) const;
    bool columnExists(const std::string &table, const std::string &column) const;

    // PRAGMA quick_check; returns the first result row ("ok" when healthy).
    std::string quickCheck();
    // True when the main database is in WAL journal mode.
    bool isWalMode();

    // Explicit close so close failures can be reported; the destructor
    // closes silently.
    void close();

private:
    sqlite3 *m_db = nullptr;
    std::filesystem::path m_path;
};

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void bindInt64(int index, int64_t value);
    void bindText(int index, const std::string &value);

    // Returns true while rows are available, false once done.
    bool step();
    void reset();

    int64_t columnInt64(int index) const;
    bool columnIsNull(int index) const;
    std::string columnText(int index) const;

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_stmt = nullptr;
};

// Rolls back on destruction unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(SqliteDatabase &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:
    SqliteDatabase &m_db;
    bool m_open = false;
};

std::string quoteIdentifier(const std::string &name);

} // namespace histscrub
