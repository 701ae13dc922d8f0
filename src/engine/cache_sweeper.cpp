#include "engine/cache_sweeper.hpp"

#include <cstdio>
#include <system_error>

#include <QString>

#include "common/logging.hpp"

namespace histscrub {

namespace fs = std::filesystem;

CacheSweepResult CacheSweeper::sweep(const fs::path &dir) const
{
    CacheSweepResult result;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return result;
    }

    fs::recursive_directory_iterator it(
        dir, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entryError;
        if (!it->is_regular_file(entryError)) {
            continue;
        }

        uint64_t size = it->file_size(entryError);
        if (entryError) {
            size = 0;
            entryError.clear();
        }
        if (!fs::remove(it->path(), entryError) || entryError) {
            ++result.failures;
            HSLOG_WARN(QStringLiteral("CacheSweeper"),
                       QStringLiteral("sweep"),
                       QStringLiteral("cache_file_not_removed"),
                       QStringLiteral("filesystem_error"),
                       QStringLiteral("filesystem_remove"),
                       ::histscrub::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", it->path().string()},
                                       {"error", entryError.message()}}));
            continue;
        }
        ++result.filesRemoved;
        result.bytesFreed += size;
    }

    if (ec) {
        HSLOG_WARN(QStringLiteral("CacheSweeper"),
                   QStringLiteral("sweep"),
                   QStringLiteral("cache_walk_incomplete"),
                   QStringLiteral("filesystem_error"),
                   QStringLiteral("directory_iterator"),
                   ::histscrub::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"dir", dir.string()}, {"error", ec.message()}}));
    }

    HSLOG_DEBUG(QStringLiteral("CacheSweeper"),
                QStringLiteral("sweep"),
                QStringLiteral("cache_swept"),
                QStringLiteral("user_request"),
                QStringLiteral("filesystem_remove"),
                ::histscrub::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"dir", dir.string()},
                                {"bytesFreed", result.bytesFreed},
                                {"filesRemoved", result.filesRemoved},
                                {"failures", result.failures}}));
    return result;
}

std::string formatBytes(uint64_t bytes)
{
    static const char *const kLabels[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size > 1024.0 && unit + 1 < sizeof(kLabels) / sizeof(kLabels[0])) {
        size /= 1024.0;
        ++unit;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", size, kLabels[unit]);
    return buffer;
}

} // namespace histscrub
