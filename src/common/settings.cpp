#include "common/settings.hpp"

#include <QDir>
#include <QString>

#include <algorithm>
#include <cctype>

#include "common/logging.hpp"

namespace keepsake {

namespace {

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

bool parseUpdateMode(const std::string &value, bool *recognized)
{
    const std::string lowered = toLower(value);
    if (recognized) {
        *recognized = true;
    }
    if (lowered.empty() || lowered == "no" || lowered == "0" || lowered == "off") {
        return false;
    }
    if (lowered == "always" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (recognized) {
        *recognized = false;
    }
    return false;
}

RunSettings RunSettings::fromEnvironment()
{
    RunSettings settings;

    const std::string update = qEnvironmentVariable("KEEPSAKE_UPDATE").toStdString();
    bool recognized = true;
    settings.updateMode = parseUpdateMode(update, &recognized);
    if (!recognized) {
        KSLOG_WARN(QStringLiteral("RunSettings"),
                   QStringLiteral("fromEnvironment"),
                   QStringLiteral("unknown_update_mode"),
                   QStringLiteral("unrecognized_env_value"),
                   QStringLiteral("treated_as_off"),
                   keepsake::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"KEEPSAKE_UPDATE", update}}));
    }

    settings.traceEnabled = qEnvironmentVariableIntValue("KEEPSAKE_TRACE") == 1;

    const QString workspace = qEnvironmentVariable("KEEPSAKE_WORKSPACE");
    settings.workspaceRoot = workspace.isEmpty()
        ? QDir::currentPath().toStdString()
        : workspace.toStdString();

    return settings;
}

} // namespace keepsake
