#include "cli/ScrubCli.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

#include "common/histscrub_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "engine/cache_sweeper.hpp"
#include "engine/history_inspector.hpp"
#include "engine/profile_locator.hpp"
#include "engine/sweep_orchestrator.hpp"

namespace histscrub {

namespace {

const std::vector<Browser> kAllBrowsers = {
    Browser::Chrome, Browser::Brave, Browser::Firefox, Browser::Safari};

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  histscrub [--chrome] [--brave] [--firefox] [--safari] [--all]\n"
        "            [--history] [--cache]\n"
        "            [--hour | --day | --week | --all-time | --hours N]\n"
        "            [-y|--yes] [--format markdown|json] [--home PATH] [--trace]\n"
        "  histscrub --list N [browser flags] [--format markdown|json] [--home PATH]\n"
        "\n"
        "Without browser or data flags the missing choices are asked for.\n"
        "The time window defaults to the last hour.\n"
        "--list prints the N most recent visits without changing anything;\n"
        "without browser flags it reads every browser.\n");
}

// --chrome, --brave, --firefox, --safari
std::optional<Browser> browserFlag(const QString &arg)
{
    if (!arg.startsWith(QStringLiteral("--"))) {
        return std::nullopt;
    }
    const QString name = arg.mid(2);
    if (name != name.toLower()) {
        return std::nullopt;
    }
    return parseBrowserString(name.toStdString());
}

void addBrowser(std::vector<Browser> &browsers, Browser browser)
{
    if (std::find(browsers.begin(), browsers.end(), browser) == browsers.end()) {
        browsers.push_back(browser);
    }
}

std::string joinBrowsers(const std::vector<Browser> &browsers)
{
    if (browsers.empty()) {
        return "none";
    }
    std::string joined;
    for (const Browser browser : browsers) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += toBrowserString(browser);
    }
    return joined;
}

std::string describeError(const StoreError &error)
{
    return "- [" + toBrowserString(error.browser) + "/" + error.profileLabel + "] "
        + toErrorKindString(error.kind) + ": " + error.detail + " ("
        + error.storePath.string() + ")";
}

std::string describeWarning(const SweepWarning &warning)
{
    return "- [" + toBrowserString(warning.browser) + "/" + warning.profileLabel + "] "
        + warning.detail + " (" + warning.path.string() + ")";
}

void renderErrorList(const std::vector<StoreError> &errors, std::ostream &out)
{
    bool headerPrinted = false;
    for (const auto &error : errors) {
        if (error.kind == ErrorKind::RestoreFailed) {
            continue;
        }
        if (!headerPrinted) {
            out << "\n## Errors\n\n";
            headerPrinted = true;
        }
        out << describeError(error) << "\n";
    }
}

void renderWarningList(const std::vector<SweepWarning> &warnings, std::ostream &out)
{
    if (warnings.empty()) {
        return;
    }
    out << "\n## Warnings\n\n";
    for (const auto &warning : warnings) {
        out << describeWarning(warning) << "\n";
    }
}

void renderAbsentList(const std::vector<Browser> &absent, std::ostream &out)
{
    if (absent.empty()) {
        return;
    }
    out << "\n## Not Installed\n\n";
    for (const Browser browser : absent) {
        out << "- " << toBrowserString(browser) << "\n";
    }
}

void writeJson(const nlohmann::json &payload, std::ostream &out)
{
    out << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

} // namespace

int ScrubCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    Invocation invocation;
    QString error;
    if (!parseArgs(args, invocation, error)) {
        std::cerr << error.toStdString() << "\n" << usageText().toStdString();
        return kExitUsage;
    }
    if (invocation.help) {
        std::cout << "histscrub " << HISTSCRUB_VERSION << "\n\n"
                  << usageText().toStdString();
        return kExitOk;
    }
    if (invocation.listLimit > 0) {
        return runInspect(invocation);
    }

    if (!resolveSelections(invocation)) {
        return kExitOk;
    }

    for (const Browser browser : invocation.browsers) {
        if (isBrowserRunning(browser)) {
            std::cerr << "Warning: " << toBrowserString(browser)
                      << " appears to be running; close it first so the pruned"
                         " history is not overwritten.\n";
        }
    }

    std::string categories;
    if (invocation.history) {
        categories = "history";
    }
    if (invocation.cache) {
        categories += categories.empty() ? "cache" : " and cache";
    }
    std::cerr << "About to clean " << categories << " for "
              << joinBrowsers(invocation.browsers) << " covering "
              << invocation.window.describe() << ".\n";
    if (!invocation.assumeYes && !promptYesNo(QStringLiteral("Proceed?"))) {
        std::cerr << "Cancelled.\n";
        return kExitOk;
    }

    HSLOG_INFO(QStringLiteral("ScrubCli"),
               QStringLiteral("run"),
               QStringLiteral("sweep_confirmed"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               ::histscrub::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"browsers", invocation.browsers},
                               {"history", invocation.history},
                               {"cache", invocation.cache},
                               {"window", invocation.window.describe()},
                               {"home", invocation.home.string()}}));

    const ProfileLocator locator(invocation.home);
    SweepOrchestrator orchestrator(locator);

    SweepOptions options;
    options.browsers = invocation.browsers;
    options.cleanHistory = invocation.history;
    options.cleanCache = invocation.cache;
    options.window = invocation.window;
    const SweepSummary summary = orchestrator.run(options);

    if (invocation.format == QStringLiteral("json")) {
        renderJson(summary, invocation.window, std::cout);
    } else {
        renderMarkdown(summary, invocation.window, std::cout);
    }

    if (summary.hasRestoreFailure()) {
        return kExitRestoreFailed;
    }
    if (summary.hasErrors()) {
        return kExitStoreErrors;
    }
    return kExitOk;
}

bool ScrubCli::parseArgs(const QStringList &args, Invocation &invocation,
                         QString &error) const
{
    int windowFlags = 0;
    bool homeGiven = false;
    bool listGiven = false;

    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);

        if (arg == QStringLiteral("-h") || arg == QStringLiteral("--help")) {
            invocation.help = true;
        } else if (const auto browser = browserFlag(arg)) {
            addBrowser(invocation.browsers, *browser);
        } else if (arg == QStringLiteral("--all")) {
            for (const Browser browser : kAllBrowsers) {
                addBrowser(invocation.browsers, browser);
            }
        } else if (arg == QStringLiteral("--history")) {
            invocation.history = true;
            invocation.dataSelected = true;
        } else if (arg == QStringLiteral("--cache")) {
            invocation.cache = true;
            invocation.dataSelected = true;
        } else if (arg == QStringLiteral("--hour")) {
            invocation.window = TimeWindow::lastHour();
            ++windowFlags;
        } else if (arg == QStringLiteral("--day")) {
            invocation.window = TimeWindow::lastDay();
            ++windowFlags;
        } else if (arg == QStringLiteral("--week")) {
            invocation.window = TimeWindow::lastWeek();
            ++windowFlags;
        } else if (arg == QStringLiteral("--all-time")) {
            invocation.window = TimeWindow::allTime();
            ++windowFlags;
        } else if (arg == QStringLiteral("--hours")) {
            if (i + 1 >= args.size()) {
                error = QStringLiteral("--hours needs a value.");
                return false;
            }
            bool ok = false;
            const qlonglong hours = args.at(++i).toLongLong(&ok);
            if (!ok || hours <= 0 || hours > TimeWindow::kMaxHours) {
                error = QStringLiteral("--hours must be a positive whole number "
                                       "no larger than %1.")
                            .arg(TimeWindow::kMaxHours);
                return false;
            }
            invocation.window = TimeWindow::relativeHours(hours);
            ++windowFlags;
        } else if (arg == QStringLiteral("--list")) {
            if (i + 1 >= args.size()) {
                error = QStringLiteral("--list needs a value.");
                return false;
            }
            bool ok = false;
            const int limit = args.at(++i).toInt(&ok);
            if (!ok || limit <= 0) {
                error = QStringLiteral("--list must be a positive whole number.");
                return false;
            }
            invocation.listLimit = limit;
            listGiven = true;
        } else if (arg == QStringLiteral("-y") || arg == QStringLiteral("--yes")) {
            invocation.assumeYes = true;
        } else if (arg == QStringLiteral("--format")) {
            if (i + 1 >= args.size()) {
                error = QStringLiteral("--format needs a value.");
                return false;
            }
            invocation.format = args.at(++i).toLower();
            if (invocation.format != QStringLiteral("markdown")
                && invocation.format != QStringLiteral("json")) {
                error = QStringLiteral("Unknown format: %1").arg(invocation.format);
                return false;
            }
        } else if (arg == QStringLiteral("--home")) {
            if (i + 1 >= args.size()) {
                error = QStringLiteral("--home needs a path.");
                return false;
            }
            invocation.home = std::filesystem::path(args.at(++i).toStdString());
            homeGiven = true;
        } else if (arg == QStringLiteral("--trace")) {
            // Consumed by main() before logging starts.
        } else {
            error = QStringLiteral("Unknown argument: %1").arg(arg);
            return false;
        }
    }

    if (windowFlags > 1) {
        error = QStringLiteral("Choose only one time window.");
        return false;
    }
    if (listGiven && (windowFlags > 0 || invocation.dataSelected)) {
        error = QStringLiteral("--list cannot be combined with cleaning options.");
        return false;
    }
    if (!homeGiven) {
        invocation.home = defaultHomeDirectory();
    }
    return true;
}

bool ScrubCli::promptYesNo(const QString &question) const
{
    while (true) {
        std::cerr << question.toStdString() << " [y/n] " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cerr << "\n";
            return false;
        }
        const QString answer = QString::fromStdString(line).trimmed().toLower();
        if (answer == QStringLiteral("y") || answer == QStringLiteral("yes")) {
            return true;
        }
        if (answer == QStringLiteral("n") || answer == QStringLiteral("no")) {
            return false;
        }
        std::cerr << "Please answer y or n.\n";
    }
}

bool ScrubCli::resolveSelections(Invocation &invocation) const
{
    if (!invocation.dataSelected) {
        if (invocation.assumeYes) {
            invocation.history = true;
        } else {
            invocation.history = promptYesNo(QStringLiteral("Clean browsing history?"));
            invocation.cache = promptYesNo(QStringLiteral("Clean browser cache?"));
        }
    }
    if (!invocation.history && !invocation.cache) {
        std::cerr << "Nothing selected to clean.\n";
        return false;
    }

    if (invocation.browsers.empty()) {
        if (invocation.assumeYes || promptYesNo(QStringLiteral("Clean all browsers?"))) {
            invocation.browsers = kAllBrowsers;
        } else {
            for (const Browser browser : kAllBrowsers) {
                const QString question = QStringLiteral("Clean %1?")
                    .arg(QString::fromStdString(toBrowserString(browser)));
                if (promptYesNo(question)) {
                    invocation.browsers.push_back(browser);
                }
            }
        }
    }
    if (invocation.browsers.empty()) {
        std::cerr << "No browsers selected.\n";
        return false;
    }
    return true;
}

int ScrubCli::runInspect(const Invocation &invocation) const
{
    const std::vector<Browser> browsers =
        invocation.browsers.empty() ? kAllBrowsers : invocation.browsers;

    HSLOG_INFO(QStringLiteral("ScrubCli"),
               QStringLiteral("runInspect"),
               QStringLiteral("inspect_requested"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               ::histscrub::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"browsers", browsers},
                               {"limit", invocation.listLimit},
                               {"home", invocation.home.string()}}));

    const ProfileLocator locator(invocation.home);
    HistoryInspector inspector(locator);
    const InspectReport report = inspector.inspect(browsers, invocation.listLimit);

    if (invocation.format == QStringLiteral("json")) {
        renderInspectJson(report, std::cout);
    } else {
        renderInspectMarkdown(report, std::cout);
    }
    return report.errors.empty() ? kExitOk : kExitStoreErrors;
}

void ScrubCli::renderMarkdown(const SweepSummary &summary, const TimeWindow &window,
                              std::ostream &out)
{
    out << "# Browser History Sweep\n\n";
    out << "Window: " << window.describe() << "\n";
    out << "Stores processed: " << summary.storesProcessed << "\n";
    out << "History rows removed: " << summary.historyRowsRemoved << "\n";
    out << "Cache freed: " << formatBytes(summary.cacheBytesFreed) << "\n";
    if (summary.cacheFailures > 0) {
        out << "Cache files not removed: " << summary.cacheFailures << "\n";
    }
    out << "Browsers cleaned: " << joinBrowsers(summary.browsersCleaned) << "\n";

    if (summary.hasRestoreFailure()) {
        out << "\n## Restore Failures\n\n";
        out << "The live store below could not be restored; recover it from the"
               " retained backup beside it.\n\n";
        for (const auto &error : summary.errors) {
            if (error.kind == ErrorKind::RestoreFailed) {
                out << describeError(error) << "\n";
            }
        }
    }

    renderErrorList(summary.errors, out);
    renderWarningList(summary.warnings, out);
    renderAbsentList(summary.absent, out);

    if (!summary.skipped.empty()) {
        out << "\n## Skipped\n\n";
        for (const auto &skipped : summary.skipped) {
            out << "- [" << toBrowserString(skipped.browser) << "/"
                << skipped.profileLabel << "] " << skipped.reason << " ("
                << skipped.storePath.string() << ")\n";
        }
    }
}

void ScrubCli::renderJson(const SweepSummary &summary, const TimeWindow &window,
                          std::ostream &out)
{
    nlohmann::json payload = summary;
    payload["window"] = window.describe();
    payload["cacheFreed"] = formatBytes(summary.cacheBytesFreed);
    writeJson(payload, out);
}

void ScrubCli::renderInspectMarkdown(const InspectReport &report, std::ostream &out)
{
    out << "# Recent Browser History\n\n";
    out << "Stores read: " << report.storesRead << "\n";

    if (!report.entries.empty()) {
        out << "\n";
        int index = 0;
        for (const auto &entry : report.entries) {
            out << ++index << ". [" << toBrowserString(entry.browser) << "/"
                << entry.profileLabel << "] "
                << toIso8601Utc(std::chrono::system_clock::time_point(
                       std::chrono::seconds(entry.visitedAt)))
                << " " << entry.url << "\n";
        }
    }

    renderErrorList(report.errors, out);
    renderWarningList(report.warnings, out);
    renderAbsentList(report.absent, out);
}

void ScrubCli::renderInspectJson(const InspectReport &report, std::ostream &out)
{
    writeJson(report, out);
}

} // namespace histscrub
