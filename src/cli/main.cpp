#include <QCoreApplication>

#include "cli/ScrubCli.hpp"
#include "common/histscrub_version.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("histscrub"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(HISTSCRUB_VERSION));

    bool trace = qEnvironmentVariableIntValue("HISTSCRUB_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    histscrub::logging::initLogging(QStringLiteral("histscrub"), trace);
    HSLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               histscrub::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()},
                               {"version", HISTSCRUB_VERSION}}));

    histscrub::ScrubCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
