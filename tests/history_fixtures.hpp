#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

#include <QFile>

#include "engine/epoch_normalizer.hpp"

// Builders for small but structurally faithful history stores. Every
// seeded timestamp is relative to kFixtureNow so the one-hour window
// cutoff lands at kFixtureNow - 3600.
namespace fixtures {

constexpr int64_t kFixtureNow = 1700000000;

inline int64_t chromiumTime(int64_t unixSeconds)
{
    return (unixSeconds + histscrub::kChromiumEpochOffsetSeconds) * histscrub::kMicrosPerSecond;
}

inline int64_t geckoTime(int64_t unixSeconds)
{
    return unixSeconds * histscrub::kMicrosPerSecond;
}

inline void execSql(const std::filesystem::path &path, const std::string &sql)
{
    sqlite3 *db = nullptr;
    if (sqlite3_open_v2(path.string().c_str(), &db,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        throw std::runtime_error("fixture open failed: " + path.string());
    }
    char *error = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    const std::string message = error ? error : "";
    sqlite3_free(error);
    sqlite3_close(db);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("fixture sql failed: " + message);
    }
}

inline int64_t queryInt(const std::filesystem::path &path, const std::string &sql)
{
    sqlite3 *db = nullptr;
    if (sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        throw std::runtime_error("fixture open failed: " + path.string());
    }
    sqlite3_stmt *stmt = nullptr;
    int64_t value = -1;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return value;
}

inline int64_t countRows(const std::filesystem::path &path, const std::string &table,
                         const std::string &where = std::string())
{
    std::string sql = "SELECT COUNT(*) FROM " + table;
    if (!where.empty()) {
        sql += " WHERE " + where;
    }
    return queryInt(path, sql + ";");
}

inline QByteArray readAll(const std::filesystem::path &path)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

// Names beside `store` carrying the transient marker (backups, working copies).
inline std::vector<std::string> transientFiles(const std::filesystem::path &store)
{
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(store.parent_path(), ec)) {
        const std::string name = entry.path().filename().string();
        if (name.find(".histscrub-") != std::string::npos) {
            names.push_back(name);
        }
    }
    return names;
}

inline bool hasTransientWithSuffix(const std::filesystem::path &store, const std::string &suffix)
{
    for (const auto &name : transientFiles(store)) {
        if (name.size() >= suffix.size()
            && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

inline std::string chromiumSchema()
{
    return "CREATE TABLE urls (id INTEGER PRIMARY KEY, url LONGVARCHAR, title LONGVARCHAR,"
           " visit_count INTEGER DEFAULT 0 NOT NULL);"
           "CREATE TABLE visits (id INTEGER PRIMARY KEY, url INTEGER NOT NULL,"
           " visit_time INTEGER NOT NULL, from_visit INTEGER, transition INTEGER DEFAULT 0);"
           "CREATE TABLE keyword_search_terms (keyword_id INTEGER NOT NULL,"
           " url_id INTEGER NOT NULL, term LONGVARCHAR NOT NULL);"
           "CREATE TABLE visit_source (id INTEGER PRIMARY KEY, source INTEGER NOT NULL);"
           "CREATE TABLE content_annotations (visit_id INTEGER PRIMARY KEY,"
           " page_language VARCHAR);"
           "CREATE TABLE downloads (id INTEGER PRIMARY KEY, target_path LONGVARCHAR,"
           " start_time INTEGER NOT NULL, end_time INTEGER NOT NULL DEFAULT 0);"
           "CREATE TABLE downloads_url_chains (id INTEGER NOT NULL, chain_index INTEGER NOT NULL,"
           " url LONGVARCHAR NOT NULL, PRIMARY KEY (id, chain_index));"
           "CREATE TABLE downloads_slices (download_id INTEGER NOT NULL, offset INTEGER NOT NULL,"
           " received_bytes INTEGER NOT NULL, PRIMARY KEY (download_id, offset));";
}

// Pages: 1 old visit only, 2 recent only, 3 one old and one recent,
// 4 recent only with a search term. One hour prunes visits 2, 4, 5.
// Downloads: 1 old with one chain entry, 2 recent with two chain entries
// and one slice.
inline void createChromiumStore(const std::filesystem::path &path)
{
    execSql(path, chromiumSchema());
    execSql(path,
            "INSERT INTO urls (id, url, title) VALUES"
            " (1, 'https://old.example/', 'old'),"
            " (2, 'https://recent.example/', 'recent'),"
            " (3, 'https://both.example/', 'both'),"
            " (4, 'https://search.example/?q=x', 'search');"
            "INSERT INTO visits (id, url, visit_time) VALUES"
            " (1, 1, " + std::to_string(chromiumTime(kFixtureNow - 7200)) + "),"
            " (2, 2, " + std::to_string(chromiumTime(kFixtureNow - 60)) + "),"
            " (3, 3, " + std::to_string(chromiumTime(kFixtureNow - 7200)) + "),"
            " (4, 3, " + std::to_string(chromiumTime(kFixtureNow - 30)) + "),"
            " (5, 4, " + std::to_string(chromiumTime(kFixtureNow - 10)) + ");"
            "INSERT INTO keyword_search_terms (keyword_id, url_id, term) VALUES"
            " (1, 4, 'x'), (1, 1, 'y');"
            "INSERT INTO visit_source (id, source) VALUES (1, 0), (2, 0);"
            "INSERT INTO content_annotations (visit_id, page_language) VALUES"
            " (1, 'en'), (5, 'de');"
            "INSERT INTO downloads (id, target_path, start_time) VALUES"
            " (1, '/tmp/old.zip', " + std::to_string(chromiumTime(kFixtureNow - 7200)) + "),"
            " (2, '/tmp/new.zip', " + std::to_string(chromiumTime(kFixtureNow - 100)) + ");"
            "INSERT INTO downloads_url_chains (id, chain_index, url) VALUES"
            " (1, 0, 'https://old.example/old.zip'),"
            " (2, 0, 'https://recent.example/r'), (2, 1, 'https://cdn.example/new.zip');"
            "INSERT INTO downloads_slices (download_id, offset, received_bytes) VALUES"
            " (2, 0, 512);");
}

// Pages: 1 old visit, 2 recent visit and bookmarked, 3 recent visit only,
// 4 no visits but a keyword. One hour prunes visits 2 and 3.
inline void createGeckoStore(const std::filesystem::path &path)
{
    execSql(path,
            "CREATE TABLE moz_places (id INTEGER PRIMARY KEY, url LONGVARCHAR,"
            " title LONGVARCHAR, visit_count INTEGER DEFAULT 0);"
            "CREATE TABLE moz_historyvisits (id INTEGER PRIMARY KEY, from_visit INTEGER,"
            " place_id INTEGER, visit_date INTEGER, visit_type INTEGER);"
            "CREATE TABLE moz_bookmarks (id INTEGER PRIMARY KEY, type INTEGER,"
            " fk INTEGER DEFAULT NULL, parent INTEGER, title LONGVARCHAR);"
            "CREATE TABLE moz_keywords (id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " keyword TEXT UNIQUE, place_id INTEGER, post_data TEXT);"
            "CREATE TABLE moz_inputhistory (place_id INTEGER NOT NULL,"
            " input LONGVARCHAR NOT NULL, use_count INTEGER, PRIMARY KEY (place_id, input));"
            "CREATE TABLE moz_annos (id INTEGER PRIMARY KEY, place_id INTEGER NOT NULL,"
            " anno_attribute_id INTEGER, content LONGVARCHAR);");
    execSql(path,
            "INSERT INTO moz_places (id, url, title) VALUES"
            " (1, 'https://old.example/', 'old'),"
            " (2, 'https://bookmarked.example/', 'bookmarked'),"
            " (3, 'https://recent.example/', 'recent'),"
            " (4, 'https://keyword.example/%s', 'keyword');"
            "INSERT INTO moz_historyvisits (id, place_id, visit_date, visit_type) VALUES"
            " (1, 1, " + std::to_string(geckoTime(kFixtureNow - 7200)) + ", 1),"
            " (2, 2, " + std::to_string(geckoTime(kFixtureNow - 120)) + ", 1),"
            " (3, 3, " + std::to_string(geckoTime(kFixtureNow - 60)) + ", 1);"
            "INSERT INTO moz_bookmarks (id, type, fk, parent, title) VALUES"
            " (1, 2, NULL, 0, 'root'), (2, 1, 2, 1, 'kept');"
            "INSERT INTO moz_keywords (keyword, place_id) VALUES ('kw', 4);"
            "INSERT INTO moz_inputhistory (place_id, input, use_count) VALUES"
            " (1, 'old', 1), (3, 'rec', 1);"
            "INSERT INTO moz_annos (id, place_id, content) VALUES (1, 3, 'note');");
}

inline void createWebKitStore(const std::filesystem::path &path)
{
    execSql(path,
            "CREATE TABLE history_items (id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " url TEXT NOT NULL UNIQUE, visit_count INTEGER NOT NULL DEFAULT 0);"
            "CREATE TABLE history_visits (id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " history_item INTEGER NOT NULL, visit_time REAL NOT NULL, title TEXT);"
            "CREATE TABLE history_items_to_tags (history_item INTEGER, tag_id INTEGER);");
    execSql(path,
            "INSERT INTO history_items (id, url) VALUES"
            " (1, 'https://a.example/'), (2, 'https://b.example/');"
            "INSERT INTO history_visits (history_item, visit_time) VALUES"
            " (1, 700000000.0), (1, 700000100.0), (2, 700000200.0);"
            "INSERT INTO history_items_to_tags (history_item, tag_id) VALUES (1, 7);");
}

// Breaks the b-tree page type byte of `table`'s root page. Statements that
// never read the table keep working; anything scanning it fails.
inline void corruptTableRootPage(const std::filesystem::path &path, const std::string &table)
{
    const int64_t pageSize = queryInt(path, "PRAGMA page_size;");
    const int64_t rootPage =
        queryInt(path, "SELECT rootpage FROM sqlite_master WHERE name = '" + table + "';");
    if (pageSize <= 0 || rootPage <= 1) {
        throw std::runtime_error("fixture cannot locate root page of " + table);
    }
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadWrite) || !file.seek((rootPage - 1) * pageSize)) {
        throw std::runtime_error("fixture cannot open " + path.string());
    }
    const char broken = static_cast<char>(0xFF);
    file.write(&broken, 1);
}

// Leaves committed rows only in the -wal sidecar by skipping the
// checkpoint that normally runs on close.
inline void moveChromiumRowsIntoWal(const std::filesystem::path &path)
{
    execSql(path, "PRAGMA journal_mode=WAL;");

    sqlite3 *db = nullptr;
    if (sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        throw std::runtime_error("fixture open failed: " + path.string());
    }
    sqlite3_db_config(db, SQLITE_DBCONFIG_NO_CKPT_ON_CLOSE, 1, nullptr);
    char *error = nullptr;
    const std::string sql =
        "PRAGMA wal_autocheckpoint=0;"
        "INSERT INTO urls (id, url, title) VALUES (10, 'https://wal.example/', 'wal');"
        "INSERT INTO visits (id, url, visit_time) VALUES (10, 10, "
        + std::to_string(chromiumTime(kFixtureNow - 5)) + ");";
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    const std::string message = error ? error : "";
    sqlite3_free(error);
    sqlite3_close(db);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("fixture sql failed: " + message);
    }
}

} // namespace fixtures
