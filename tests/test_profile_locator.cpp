#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>

#include "engine/profile_locator.hpp"

using namespace histscrub;

class ProfileLocatorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testChromiumProfilesOnLinux();
    void testGeckoProfileSelection();
    void testGeckoFallsBackToEveryDirectory();
    void testSafariOnlyOnMacOS();
    void testBraveLegacyRootOnMacOS();
    void testMissingRootIsAbsent();
    void testChromiumCachesWithoutStore();
    void testGeckoProfileAndSystemCaches();
    void testSafariCachesOnMacOS();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_counter = 0;

    std::filesystem::path freshHome();
    static void touch(const std::filesystem::path &path);
};

void ProfileLocatorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ProfileLocatorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path ProfileLocatorTests::freshHome()
{
    const auto home = std::filesystem::path(m_tempDir.path().toStdString())
        / ("home" + std::to_string(++m_counter));
    std::filesystem::create_directories(home);
    return home;
}

void ProfileLocatorTests::touch(const std::filesystem::path &path)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << "x";
}

void ProfileLocatorTests::testChromiumProfilesOnLinux()
{
    const auto home = freshHome();
    const auto root = home / ".config/google-chrome";
    touch(root / "Profile 2" / "History");
    touch(root / "Default" / "History");
    touch(root / "Profile 1" / "History");
    // No store file: not a target.
    std::filesystem::create_directories(root / "Profile 3");
    // Not a profile directory.
    touch(root / "System Profile-x" / "History");
    touch(root / "Crashpad" / "History");

    const ProfileLocator locator(home, HostPlatform::Linux);
    const LocatedStores located = locator.locate({Browser::Chrome});

    QVERIFY(located.absent.empty());
    QCOMPARE(located.targets.size(), size_t{3});
    QCOMPARE(QString::fromStdString(located.targets[0].profileLabel), QStringLiteral("Default"));
    QCOMPARE(QString::fromStdString(located.targets[1].profileLabel), QStringLiteral("Profile 1"));
    QCOMPARE(QString::fromStdString(located.targets[2].profileLabel), QStringLiteral("Profile 2"));
    QCOMPARE(located.targets[0].storePath, root / "Default" / "History");
    QCOMPARE(located.targets[0].browser, Browser::Chrome);
    QVERIFY(located.caches.empty());
}

void ProfileLocatorTests::testGeckoProfileSelection()
{
    const auto home = freshHome();
    const auto root = home / ".mozilla/firefox";
    touch(root / "abcd.default" / "places.sqlite");
    touch(root / "efgh.default-release" / "places.sqlite");
    touch(root / "ijkl.dev-edition-default" / "places.sqlite");
    touch(root / "Crash Reports" / "places.sqlite");

    const ProfileLocator locator(home, HostPlatform::Linux);
    const LocatedStores located = locator.locate({Browser::Firefox});

    QCOMPARE(located.targets.size(), size_t{2});
    QCOMPARE(QString::fromStdString(located.targets[0].profileLabel), QStringLiteral("abcd.default"));
    QCOMPARE(QString::fromStdString(located.targets[1].profileLabel),
             QStringLiteral("efgh.default-release"));
}

void ProfileLocatorTests::testGeckoFallsBackToEveryDirectory()
{
    const auto home = freshHome();
    const auto root = home / "Library/Application Support/Firefox/Profiles";
    touch(root / "custom" / "places.sqlite");

    const ProfileLocator locator(home, HostPlatform::MacOS);
    const LocatedStores located = locator.locate({Browser::Firefox});

    QCOMPARE(located.targets.size(), size_t{1});
    QCOMPARE(QString::fromStdString(located.targets[0].profileLabel), QStringLiteral("custom"));
}

void ProfileLocatorTests::testSafariOnlyOnMacOS()
{
    const auto home = freshHome();
    touch(home / "Library/Safari/History.db");

    const ProfileLocator mac(home, HostPlatform::MacOS);
    const LocatedStores onMac = mac.locate({Browser::Safari});
    QCOMPARE(onMac.targets.size(), size_t{1});
    QCOMPARE(QString::fromStdString(onMac.targets[0].profileLabel), QStringLiteral("Default"));

    const ProfileLocator other(home, HostPlatform::Linux);
    const LocatedStores onLinux = other.locate({Browser::Safari});
    QVERIFY(onLinux.targets.empty());
    QCOMPARE(onLinux.absent.size(), size_t{1});
    QCOMPARE(onLinux.absent.front(), Browser::Safari);
}

void ProfileLocatorTests::testBraveLegacyRootOnMacOS()
{
    const auto home = freshHome();
    touch(home / "Library/Application Support/Brave-Browser/Default/History");

    const ProfileLocator locator(home, HostPlatform::MacOS);
    const LocatedStores located = locator.locate({Browser::Brave});
    QCOMPARE(located.targets.size(), size_t{1});
    QCOMPARE(located.targets[0].browser, Browser::Brave);
}

void ProfileLocatorTests::testMissingRootIsAbsent()
{
    const auto home = freshHome();
    touch(home / "AppData/Roaming/Mozilla/Firefox/Profiles/x.default/places.sqlite");

    const ProfileLocator locator(home, HostPlatform::Windows);
    const LocatedStores located =
        locator.locate({Browser::Chrome, Browser::Firefox, Browser::Brave});

    QCOMPARE(located.targets.size(), size_t{1});
    QCOMPARE(located.targets[0].browser, Browser::Firefox);
    QCOMPARE(located.absent, (std::vector<Browser>{Browser::Chrome, Browser::Brave}));
}

void ProfileLocatorTests::testChromiumCachesWithoutStore()
{
    const auto home = freshHome();
    const auto root = home / ".config/google-chrome";
    touch(root / "Default" / "History");
    touch(root / "Default" / "Code Cache" / "js" / "index");
    touch(root / "Default" / "Media Cache" / "f_000001");
    // A profile that never wrote history still has caches.
    touch(root / "Profile 1" / "Cache" / "data_0");
    touch(root / "Profile 1" / "GPUCache" / "data_1");
    touch(home / ".cache/google-chrome/Default/Cache/Cache_Data/f_000002");

    const ProfileLocator locator(home, HostPlatform::Linux);
    const LocatedStores located = locator.locate({Browser::Chrome});

    QCOMPARE(located.targets.size(), size_t{1});
    QCOMPARE(located.caches.size(), size_t{5});
    QCOMPARE(QString::fromStdString(located.caches[0].profileLabel), QStringLiteral("Default"));
    QCOMPARE(located.caches[0].dir, root / "Default" / "Code Cache");
    QCOMPARE(located.caches[1].dir, root / "Default" / "Media Cache");
    QCOMPARE(QString::fromStdString(located.caches[2].profileLabel), QStringLiteral("Profile 1"));
    QCOMPARE(located.caches[2].dir, root / "Profile 1" / "Cache");
    QCOMPARE(located.caches[3].dir, root / "Profile 1" / "GPUCache");
    QCOMPARE(QString::fromStdString(located.caches[4].profileLabel), QStringLiteral("system"));
    QCOMPARE(located.caches[4].dir, home / ".cache/google-chrome");
    for (const CacheTarget &cache : located.caches) {
        QCOMPARE(cache.browser, Browser::Chrome);
    }
}

void ProfileLocatorTests::testGeckoProfileAndSystemCaches()
{
    const auto home = freshHome();
    const auto root = home / "Library/Application Support/Firefox/Profiles";
    touch(root / "abcd.default-release" / "cache2" / "entries" / "A1");
    touch(root / "abcd.default-release" / "startupCache" / "scriptCache.bin");
    touch(root / "abcd.default-release" / "thumbnails" / "0a.png");
    touch(home / "Library/Caches/Mozilla/Firefox/Profiles/abcd/cache2/entries/B2");
    touch(home / "Library/Caches/org.mozilla.firefox/Cache.db");

    const ProfileLocator locator(home, HostPlatform::MacOS);
    const LocatedStores located = locator.locate({Browser::Firefox});

    QVERIFY(located.targets.empty());
    QVERIFY(located.absent.empty());
    QCOMPARE(located.caches.size(), size_t{5});
    QCOMPARE(located.caches[0].dir, root / "abcd.default-release" / "cache2");
    QCOMPARE(located.caches[1].dir, root / "abcd.default-release" / "startupCache");
    QCOMPARE(located.caches[2].dir, root / "abcd.default-release" / "thumbnails");
    QCOMPARE(located.caches[3].dir, home / "Library/Caches/Mozilla/Firefox");
    QCOMPARE(located.caches[4].dir, home / "Library/Caches/org.mozilla.firefox");
    QCOMPARE(QString::fromStdString(located.caches[3].profileLabel), QStringLiteral("system"));
}

void ProfileLocatorTests::testSafariCachesOnMacOS()
{
    const auto home = freshHome();
    touch(home / "Library/Safari/Bookmarks.plist");
    touch(home / "Library/Safari/WebKit/MediaCache/media.bin");
    touch(home / "Library/Caches/com.apple.Safari/fsCachedData/0A1B");

    const ProfileLocator mac(home, HostPlatform::MacOS);
    const LocatedStores located = mac.locate({Browser::Safari});

    QVERIFY(located.targets.empty());
    QCOMPARE(located.caches.size(), size_t{2});
    QCOMPARE(located.caches[0].dir, home / "Library/Safari/WebKit/MediaCache");
    QCOMPARE(located.caches[1].dir, home / "Library/Caches/com.apple.Safari/fsCachedData");
    QCOMPARE(QString::fromStdString(located.caches[0].profileLabel), QStringLiteral("Default"));
    QCOMPARE(located.caches[1].browser, Browser::Safari);
}

QTEST_MAIN(ProfileLocatorTests)
#include "test_profile_locator.moc"
