#pragma once

#include <filesystem>
#include <ostream>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace histscrub {

class ScrubCli
{
public:
    // Parses flags, asks for anything not given on the command line, runs
    // one sweep and prints its summary.
    // returns exit code
    int run(int argc, char *argv[]);

    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitStoreErrors = 2;
    static constexpr int kExitRestoreFailed = 3;

    static void renderMarkdown(const SweepSummary &summary, const TimeWindow &window,
                               std::ostream &out);
    // Invalid UTF-8 in paths is replaced with U+FFFD rather than thrown on.
    static void renderJson(const SweepSummary &summary, const TimeWindow &window,
                           std::ostream &out);
    static void renderInspectMarkdown(const InspectReport &report, std::ostream &out);
    static void renderInspectJson(const InspectReport &report, std::ostream &out);

private:
    struct Invocation {
        std::vector<Browser> browsers;
        bool history = false;
        bool cache = false;
        bool dataSelected = false;
        TimeWindow window = TimeWindow::lastHour();
        bool assumeYes = false;
        QString format = QStringLiteral("markdown");
        std::filesystem::path home;
        bool help = false;
        // > 0 lists that many recent visits instead of cleaning.
        int listLimit = 0;
    };

    bool parseArgs(const QStringList &args, Invocation &invocation, QString &error) const;
    bool promptYesNo(const QString &question) const;
    bool resolveSelections(Invocation &invocation) const;
    int runInspect(const Invocation &invocation) const;
};

} // namespace histscrub
