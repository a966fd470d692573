#include "harness/snapshot_harness.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QtTest/QtTest>

#include <memory>
#include <mutex>
#include <optional>

#include "common/logging.hpp"

namespace keepsake::harness {

namespace {

std::mutex g_mutex;
std::optional<RunSettings> g_settings;
std::shared_ptr<SnapshotStore> g_store;

QString processName()
{
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("keepsake-tests");
}

void installLocked(const RunSettings &settings)
{
    g_settings = settings;
    g_store = std::make_shared<SnapshotStore>(settings.workspaceRoot);
    logging::initLogging(processName(), settings.traceEnabled);
}

void ensureLocked()
{
    if (!g_settings) {
        installLocked(RunSettings::fromEnvironment());
    }
}

// The settings and store one assertion runs against, taken together.
struct ActiveRun {
    bool updateMode = false;
    std::shared_ptr<SnapshotStore> store;
};

ActiveRun activeRun()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    ensureLocked();
    return {g_settings->updateMode, g_store};
}

bool report(const SnapshotIdentity &identity, const AssertionOutcome &outcome)
{
    if (outcome.status == AssertionStatus::Failed) {
        QTest::qFail(outcome.describe().c_str(), identity.sourceFile.c_str(), identity.line);
        return false;
    }
    if (outcome.status == AssertionStatus::Updated) {
        qInfo().noquote() << QString::fromStdString(outcome.describe());
    }
    return true;
}

} // namespace

RunSettings settings()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    ensureLocked();
    return *g_settings;
}

void configure(const RunSettings &settings)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    installLocked(settings);
}

std::shared_ptr<SnapshotStore> store()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    ensureLocked();
    return g_store;
}

SnapshotIdentity callSite(const char *file,
                          int line,
                          const std::string &name,
                          const char *expression)
{
    SnapshotIdentity identity;
    identity.workspaceRoot = settings().workspaceRoot;
    identity.line = line;
    identity.expression = expression ? expression : "";

    const QString source = QString::fromUtf8(file);
    const QFileInfo sourceInfo(source);
    identity.modulePath = sourceInfo.completeBaseName().toStdString();

    // Keep the header readable: sources inside the workspace are stored
    // relative to it.
    const QDir root(QString::fromStdString(identity.workspaceRoot));
    const QString relative = root.relativeFilePath(source);
    identity.sourceFile = (sourceInfo.isAbsolute() && !relative.startsWith(QStringLiteral("..")))
        ? relative.toStdString()
        : source.toStdString();

    identity.name = name;
    if (identity.name.empty()) {
        if (const char *function = QTest::currentTestFunction()) {
            identity.name = function;
            const char *tag = QTest::currentDataTag();
            if (tag && *tag) {
                identity.name += std::string("-") + tag;
            }
        }
    }
    return identity;
}

bool checkSnapshot(const SnapshotIdentity &identity,
                   const std::function<Content()> &captureValue,
                   const std::vector<RedactionArg> &redactions,
                   SnapshotFormat format)
{
    std::vector<Redaction> rules;
    rules.reserve(redactions.size());
    for (const auto &arg : redactions) {
        rules.push_back(arg.redaction);
    }

    try {
        const Content value = captureValue();
        const ActiveRun run = activeRun();
        AssertionCoordinator coordinator(*run.store);
        return report(identity,
                      coordinator.assertSnapshot(identity, value, rules, format, run.updateMode));
    } catch (const std::exception &error) {
        QTest::qFail(error.what(), identity.sourceFile.c_str(), identity.line);
        return false;
    }
}

bool checkText(const SnapshotIdentity &identity, const std::string &text)
{
    try {
        const ActiveRun run = activeRun();
        AssertionCoordinator coordinator(*run.store);
        return report(identity, coordinator.assertText(identity, text, run.updateMode));
    } catch (const std::exception &error) {
        QTest::qFail(error.what(), identity.sourceFile.c_str(), identity.line);
        return false;
    }
}

} // namespace keepsake::harness
