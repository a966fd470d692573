#include <QCoreApplication>

#include "review/ReviewCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

#include <vector>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = qEnvironmentVariableIntValue("KEEPSAKE_TRACE") == 1;
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
    keepsake::logging::initLogging(QStringLiteral("keepsake-review"), trace);
    KSLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("review_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               keepsake::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    keepsake::ReviewCli cli;
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
