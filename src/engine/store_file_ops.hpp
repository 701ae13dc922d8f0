#pragma once

#include <filesystem>
#include <string>

namespace histscrub {

// Filesystem primitives used by the store mutator. Each returns false and
// fills `error` on failure instead of throwing. Tests subclass this to
// inject failures at a specific step.
class StoreFileOps {
public:
    virtual ~StoreFileOps() = default;

    virtual bool exists(const std::filesystem::path &path) const;
    // Overwrites `to` when it exists.
    virtual bool copyFile(const std::filesystem::path &from,
                          const std::filesystem::path &to,
                          std::string &error);
    // Removing a path that does not exist succeeds.
    virtual bool removeFile(const std::filesystem::path &path, std::string &error);
    virtual bool renameFile(const std::filesystem::path &from,
                            const std::filesystem::path &to,
                            std::string &error);
};

// Sidecars carrying committed or in-flight content; copied with the store.
inline constexpr const char *kContentSidecars[] = {"-wal", "-journal"};
// Every sidecar SQLite may leave beside a database file.
inline constexpr const char *kAllSidecars[] = {"-wal", "-shm", "-journal"};

// Marks every file histscrub creates beside a store.
inline constexpr const char *kTransientTag = ".histscrub-";

// Journal sidecars that travel with a store file.
std::filesystem::path sidecarPath(const std::filesystem::path &store,
                                  const char *suffix);

// 16 random hex digits naming one cycle's transient files.
std::string newTransientToken();
// <store>.histscrub-<token><suffix>
std::filesystem::path transientPath(const std::filesystem::path &store,
                                    const std::string &token,
                                    const char *suffix);

} // namespace histscrub
