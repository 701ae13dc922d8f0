#pragma once

#include <filesystem>
#include <vector>

#include "common/models.hpp"

namespace histscrub {

HostPlatform currentPlatform();

struct LocatedStores {
    std::vector<StoreTarget> targets;
    // Existing cache directories, per profile then per-user cache roots.
    std::vector<CacheTarget> caches;
    // Browsers whose profile root does not exist under the home directory.
    std::vector<Browser> absent;
};

// Discovers per-profile history stores and cache directories under a home
// directory. Only looks; never opens or modifies anything it finds.
class ProfileLocator {
public:
    explicit ProfileLocator(std::filesystem::path home,
                            HostPlatform platform = currentPlatform());

    const std::filesystem::path &home() const { return m_home; }
    HostPlatform platform() const { return m_platform; }

    // Targets come back in the order of `browsers`, profiles in discovery
    // order within a browser.
    LocatedStores locate(const std::vector<Browser> &browsers) const;

    // Candidate profile roots for a browser, first existing one wins.
    std::vector<std::filesystem::path> profileRoots(Browser browser) const;
    static const char *storeFileName(Browser browser);

    // Cache subdirectories of one profile directory, relative to it.
    static std::vector<std::filesystem::path> profileCacheDirs(Browser browser);
    // Per-user cache roots outside the profile tree.
    std::vector<std::filesystem::path> systemCacheDirs(Browser browser) const;

private:
    void collectChromium(Browser browser, const std::filesystem::path &root,
                         LocatedStores &located) const;
    void collectGecko(const std::filesystem::path &root, LocatedStores &located) const;
    void collectWebKit(const std::filesystem::path &root, LocatedStores &located) const;
    void addProfileCaches(Browser browser, const std::filesystem::path &profile,
                          LocatedStores &located) const;
    void addSystemCaches(Browser browser, LocatedStores &located) const;

    std::filesystem::path m_home;
    HostPlatform m_platform;
};

// $HOME, or the current directory when HOME is unset.
std::filesystem::path defaultHomeDirectory();

} // namespace histscrub
