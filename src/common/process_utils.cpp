#include "common/process_utils.hpp"

#include <QProcess>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace histscrub {

namespace {

constexpr int kPgrepTimeoutMs = 500;

} // namespace

QString browserProcessName(Browser browser)
{
    switch (browser) {
    case Browser::Chrome:
        return QStringLiteral("chrome");
    case Browser::Brave:
        return QStringLiteral("brave");
    case Browser::Firefox:
        return QStringLiteral("firefox");
    case Browser::Safari:
        return QStringLiteral("Safari");
    }
    return QString();
}

bool isBrowserRunning(Browser browser)
{
    const QString name = browserProcessName(browser);
    QProcess proc;
    proc.start(QStringLiteral("pgrep"), {QStringLiteral("-x"), name});
    if (!proc.waitForStarted(kPgrepTimeoutMs)) {
        HSLOG_DEBUG(QStringLiteral("process_utils"),
                    QStringLiteral("isBrowserRunning"),
                    QStringLiteral("pgrep_unavailable"),
                    QStringLiteral("pgrep_not_started"),
                    QStringLiteral("qprocess"),
                    ::histscrub::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"process", name.toStdString()}}));
        return false;
    }
    if (!proc.waitForFinished(kPgrepTimeoutMs)) {
        proc.kill();
        proc.waitForFinished(kPgrepTimeoutMs);
        return false;
    }
    return proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0;
}

} // namespace histscrub
