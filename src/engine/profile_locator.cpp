#include "engine/profile_locator.hpp"

#include <algorithm>
#include <system_error>

#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace histscrub {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> sortedSubdirectories(const fs::path &root)
{
    std::vector<fs::path> dirs;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeError;
        if (it->is_directory(typeError)) {
            dirs.push_back(it->path());
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

bool isFile(const fs::path &path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool isDirectory(const fs::path &path)
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool looksLikeGeckoProfile(const std::string &name)
{
    return endsWith(name, ".default")
        || name.find(".default-") != std::string::npos
        || endsWith(name, "release");
}

} // namespace

HostPlatform currentPlatform()
{
#if defined(__APPLE__)
    return HostPlatform::MacOS;
#elif defined(_WIN32)
    return HostPlatform::Windows;
#else
    return HostPlatform::Linux;
#endif
}

fs::path defaultHomeDirectory()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        std::error_code ec;
        return fs::current_path(ec);
    }
    return fs::path(home.toStdString());
}

ProfileLocator::ProfileLocator(fs::path home, HostPlatform platform)
    : m_home(std::move(home))
    , m_platform(platform)
{
}

const char *ProfileLocator::storeFileName(Browser browser)
{
    switch (browser) {
    case Browser::Chrome:
    case Browser::Brave:
        return "History";
    case Browser::Firefox:
        return "places.sqlite";
    case Browser::Safari:
        return "History.db";
    }
    return "History";
}

std::vector<fs::path> ProfileLocator::profileRoots(Browser browser) const
{
    switch (browser) {
    case Browser::Chrome:
        switch (m_platform) {
        case HostPlatform::MacOS:
            return {m_home / "Library/Application Support/Google/Chrome"};
        case HostPlatform::Linux:
            return {m_home / ".config/google-chrome"};
        case HostPlatform::Windows:
            return {m_home / "AppData/Local/Google/Chrome/User Data"};
        }
        break;
    case Browser::Brave:
        switch (m_platform) {
        case HostPlatform::MacOS:
            return {m_home / "Library/Application Support/BraveSoftware/Brave-Browser",
                    m_home / "Library/Application Support/Brave-Browser"};
        case HostPlatform::Linux:
            return {m_home / ".config/BraveSoftware/Brave-Browser"};
        case HostPlatform::Windows:
            return {m_home / "AppData/Local/BraveSoftware/Brave-Browser/User Data"};
        }
        break;
    case Browser::Firefox:
        switch (m_platform) {
        case HostPlatform::MacOS:
            return {m_home / "Library/Application Support/Firefox/Profiles"};
        case HostPlatform::Linux:
            return {m_home / ".mozilla/firefox"};
        case HostPlatform::Windows:
            return {m_home / "AppData/Roaming/Mozilla/Firefox/Profiles"};
        }
        break;
    case Browser::Safari:
        if (m_platform == HostPlatform::MacOS) {
            return {m_home / "Library/Safari"};
        }
        return {};
    }
    return {};
}

LocatedStores ProfileLocator::locate(const std::vector<Browser> &browsers) const
{
    LocatedStores located;

    for (const Browser browser : browsers) {
        fs::path root;
        for (const auto &candidate : profileRoots(browser)) {
            if (isDirectory(candidate)) {
                root = candidate;
                break;
            }
        }

        if (root.empty()) {
            located.absent.push_back(browser);
            HSLOG_INFO(QStringLiteral("ProfileLocator"),
                       QStringLiteral("locate"),
                       QStringLiteral("profile_not_found"),
                       QStringLiteral("root_missing"),
                       QStringLiteral("filesystem_scan"),
                       ::histscrub::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"browser", toBrowserString(browser)}}));
            continue;
        }

        const size_t storesBefore = located.targets.size();
        const size_t cachesBefore = located.caches.size();
        switch (familyOf(browser)) {
        case SchemaFamily::Chromium:
            collectChromium(browser, root, located);
            break;
        case SchemaFamily::Gecko:
            collectGecko(root, located);
            break;
        case SchemaFamily::WebKit:
            collectWebKit(root, located);
            break;
        }
        addSystemCaches(browser, located);

        HSLOG_DEBUG(QStringLiteral("ProfileLocator"),
                    QStringLiteral("locate"),
                    QStringLiteral("profiles_found"),
                    QStringLiteral("discovery"),
                    QStringLiteral("filesystem_scan"),
                    ::histscrub::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"browser", toBrowserString(browser)},
                                    {"root", root.string()},
                                    {"stores", located.targets.size() - storesBefore},
                                    {"caches", located.caches.size() - cachesBefore}}));
    }

    return located;
}

std::vector<fs::path> ProfileLocator::profileCacheDirs(Browser browser)
{
    switch (familyOf(browser)) {
    case SchemaFamily::Chromium:
        return {"Cache", "Code Cache", "GPUCache", "Media Cache"};
    case SchemaFamily::Gecko:
        return {"cache2", "startupCache", "thumbnails"};
    case SchemaFamily::WebKit:
        return {};
    }
    return {};
}

std::vector<fs::path> ProfileLocator::systemCacheDirs(Browser browser) const
{
    switch (m_platform) {
    case HostPlatform::MacOS:
        switch (browser) {
        case Browser::Chrome:
            return {m_home / "Library/Caches/Google/Chrome",
                    m_home / "Library/Caches/com.google.Chrome"};
        case Browser::Brave:
            return {m_home / "Library/Caches/BraveSoftware/Brave-Browser",
                    m_home / "Library/Caches/com.brave.Browser"};
        case Browser::Firefox:
            return {m_home / "Library/Caches/Mozilla/Firefox",
                    m_home / "Library/Caches/org.mozilla.firefox"};
        case Browser::Safari:
            return {m_home / "Library/Safari/WebKit/MediaCache",
                    m_home / "Library/Caches/com.apple.Safari/fsCachedData"};
        }
        break;
    case HostPlatform::Linux:
        switch (browser) {
        case Browser::Chrome:
            return {m_home / ".cache/google-chrome"};
        case Browser::Brave:
            return {m_home / ".cache/BraveSoftware/Brave-Browser"};
        case Browser::Firefox:
            return {m_home / ".cache/mozilla/firefox"};
        case Browser::Safari:
            return {};
        }
        break;
    case HostPlatform::Windows:
        if (browser == Browser::Firefox) {
            return {m_home / "AppData/Local/Mozilla/Firefox/Profiles"};
        }
        return {};
    }
    return {};
}

void ProfileLocator::addProfileCaches(Browser browser, const fs::path &profile,
                                      LocatedStores &located) const
{
    for (const auto &relative : profileCacheDirs(browser)) {
        const fs::path dir = profile / relative;
        if (isDirectory(dir)) {
            located.caches.push_back(CacheTarget{browser, profile.filename().string(), dir});
        }
    }
}

void ProfileLocator::addSystemCaches(Browser browser, LocatedStores &located) const
{
    // Safari keeps no per-profile tree, so its caches carry the profile label.
    const std::string label = browser == Browser::Safari ? "Default" : "system";
    for (const auto &dir : systemCacheDirs(browser)) {
        if (isDirectory(dir)) {
            located.caches.push_back(CacheTarget{browser, label, dir});
        }
    }
}

void ProfileLocator::collectChromium(Browser browser, const fs::path &root,
                                     LocatedStores &located) const
{
    std::vector<fs::path> profiles;
    if (isDirectory(root / "Default")) {
        profiles.push_back(root / "Default");
    }
    for (const auto &dir : sortedSubdirectories(root)) {
        if (dir.filename().string().rfind("Profile", 0) == 0) {
            profiles.push_back(dir);
        }
    }

    for (const auto &profile : profiles) {
        const fs::path store = profile / storeFileName(browser);
        if (isFile(store)) {
            located.targets.push_back(StoreTarget{browser, profile.filename().string(), store});
        }
        addProfileCaches(browser, profile, located);
    }
}

void ProfileLocator::collectGecko(const fs::path &root, LocatedStores &located) const
{
    const std::vector<fs::path> all = sortedSubdirectories(root);
    std::vector<fs::path> profiles;
    for (const auto &dir : all) {
        if (looksLikeGeckoProfile(dir.filename().string())) {
            profiles.push_back(dir);
        }
    }
    if (profiles.empty()) {
        profiles = all;
    }

    for (const auto &profile : profiles) {
        const fs::path store = profile / storeFileName(Browser::Firefox);
        if (isFile(store)) {
            located.targets.push_back(
                StoreTarget{Browser::Firefox, profile.filename().string(), store});
        }
        addProfileCaches(Browser::Firefox, profile, located);
    }
}

void ProfileLocator::collectWebKit(const fs::path &root, LocatedStores &located) const
{
    const fs::path store = root / storeFileName(Browser::Safari);
    if (isFile(store)) {
        located.targets.push_back(StoreTarget{Browser::Safari, "Default", store});
    }
}

} // namespace histscrub
