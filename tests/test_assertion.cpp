#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <memory>

#include "common/errors.hpp"
#include "engine/assertion_coordinator.hpp"
#include "engine/snapshot_file.hpp"

using keepsake::AssertionCoordinator;
using keepsake::AssertionOutcome;
using keepsake::AssertionStatus;
using keepsake::Content;
using keepsake::Redaction;
using keepsake::SnapshotFormat;
using keepsake::SnapshotIdentity;
using keepsake::SnapshotStore;

class AssertionTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testFirstRunFailsWithPending();
    void testAcceptedBaselinePasses();
    void testMismatchFailsWithDiff();
    void testUpdateModeWritesRenderedTextExactly();
    void testUpdateModeLeavesMatchingBaselineAlone();
    void testRedactionsAppliedBeforeRendering();
    void testMalformedSelectorFailsBeforeIo();
    void testSerializationErrorFailsBeforeIo();
    void testTextSnapshots();
    void testDescribeFailure();
    void testPassingRunLeavesStalePendingInPlace();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    QByteArray m_prevLogDir;

    SnapshotIdentity identity(const std::string &name) const;
    QString snapshotDir() const;
    static Content user(const char *name);
};

void AssertionTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    m_prevLogDir = qgetenv("KEEPSAKE_LOG_DIR");
    qputenv("KEEPSAKE_LOG_DIR", (m_tempDir->path() + "/logs").toUtf8());
}

void AssertionTests::cleanup()
{
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("KEEPSAKE_LOG_DIR");
    } else {
        qputenv("KEEPSAKE_LOG_DIR", m_prevLogDir);
    }
    m_tempDir.reset();
}

SnapshotIdentity AssertionTests::identity(const std::string &name) const
{
    SnapshotIdentity id;
    id.workspaceRoot = m_tempDir->path().toStdString();
    id.modulePath = "test_users";
    id.sourceFile = "tests/test_users.cpp";
    id.line = 12;
    id.name = name;
    id.expression = "user";
    return id;
}

QString AssertionTests::snapshotDir() const
{
    return m_tempDir->path() + "/tests/snapshots";
}

Content AssertionTests::user(const char *name)
{
    return Content::structure("User",
                              {{"name", Content::string(name)},
                               {"password", Content::string("hunter2")}});
}

void AssertionTests::testFirstRunFailsWithPending()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const AssertionOutcome outcome =
        coordinator.assertSnapshot(identity("login"), user("Alice"), {}, SnapshotFormat::Json, false);

    QVERIFY(outcome.status == AssertionStatus::Failed);
    QVERIFY(!outcome.passed());
    QVERIFY(outcome.baselineMissing);
    QVERIFY(!QFileInfo::exists(QString::fromStdString(outcome.baselinePath)));
    QVERIFY(QFileInfo::exists(QString::fromStdString(outcome.pendingPath)));
    QCOMPARE(QString::fromStdString(outcome.pendingPath),
             snapshotDir() + QStringLiteral("/test_users__login.snap.new"));

    const auto pending = store.loadBaseline(outcome.pendingPath);
    QVERIFY(pending.has_value());
    QCOMPARE(QString::fromStdString(pending->contents),
             QString::fromStdString(outcome.rendered + "\n"));
    QCOMPARE(QString::fromStdString(pending->metadata.source),
             QStringLiteral("tests/test_users.cpp:12"));
    QCOMPARE(QString::fromStdString(pending->metadata.expression), QStringLiteral("user"));
    QVERIFY(outcome.diff.find("+  \"name\": \"Alice\",") != std::string::npos);
}

void AssertionTests::testAcceptedBaselinePasses()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const AssertionOutcome first =
        coordinator.assertSnapshot(identity("login"), user("Alice"), {}, SnapshotFormat::Yaml, false);
    store.acceptPending(first.pendingPath);

    store.resetSequences();
    const AssertionOutcome second =
        coordinator.assertSnapshot(identity("login"), user("Alice"), {}, SnapshotFormat::Yaml, false);
    QVERIFY(second.status == AssertionStatus::Passed);
    QVERIFY(second.pendingPath.empty());
    QVERIFY(second.diff.empty());
}

void AssertionTests::testMismatchFailsWithDiff()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    coordinator.assertSnapshot(identity("login"), user("Alice"), {}, SnapshotFormat::Json, true);
    store.resetSequences();

    const AssertionOutcome outcome =
        coordinator.assertSnapshot(identity("login"), user("Bob"), {}, SnapshotFormat::Json, false);
    QVERIFY(outcome.status == AssertionStatus::Failed);
    QVERIFY(!outcome.baselineMissing);
    QVERIFY(outcome.diff.find("-  \"name\": \"Alice\",") != std::string::npos);
    QVERIFY(outcome.diff.find("+  \"name\": \"Bob\",") != std::string::npos);

    // The baseline is untouched by a failing run.
    QVERIFY(store.loadBaseline(outcome.baselinePath)->contents.find("Alice") != std::string::npos);
}

void AssertionTests::testUpdateModeWritesRenderedTextExactly()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    coordinator.assertSnapshot(identity("login"), user("Alice"), {}, SnapshotFormat::Ron, true);
    store.resetSequences();

    const AssertionOutcome outcome =
        coordinator.assertSnapshot(identity("login"), user("Bob"), {}, SnapshotFormat::Ron, true);
    QVERIFY(outcome.status == AssertionStatus::Updated);
    QVERIFY(outcome.passed());
    QVERIFY(outcome.pendingPath.empty());
    QVERIFY(!QFileInfo::exists(QString::fromStdString(
        SnapshotStore::pendingPathFor(outcome.baselinePath))));

    const auto baseline = store.loadBaseline(outcome.baselinePath);
    QVERIFY(baseline.has_value());
    QCOMPARE(QString::fromStdString(baseline->contents),
             QString::fromStdString(outcome.rendered));
    QCOMPARE(QString::fromStdString(outcome.rendered),
             QStringLiteral("User(\n  name: \"Bob\",\n  password: \"hunter2\",\n)"));
}

void AssertionTests::testUpdateModeLeavesMatchingBaselineAlone()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const AssertionOutcome first =
        coordinator.assertSnapshot(identity("same"), user("Alice"), {}, SnapshotFormat::Json, true);
    QVERIFY(first.status == AssertionStatus::Updated);
    store.resetSequences();

    const AssertionOutcome second =
        coordinator.assertSnapshot(identity("same"), user("Alice"), {}, SnapshotFormat::Json, true);
    QVERIFY(second.status == AssertionStatus::Passed);
}

void AssertionTests::testRedactionsAppliedBeforeRendering()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const std::vector<Redaction> redactions = {
        {".password", Content::string("[REDACTED]")}
    };
    const AssertionOutcome outcome = coordinator.assertSnapshot(
        identity("redacted"), user("Alice"), redactions, SnapshotFormat::Json, false);

    QCOMPARE(QString::fromStdString(outcome.rendered),
             QStringLiteral("{\n  \"name\": \"Alice\",\n  \"password\": \"[REDACTED]\"\n}"));
}

void AssertionTests::testMalformedSelectorFailsBeforeIo()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const std::vector<Redaction> redactions = {
        {".\"unterminated", Content::string("x")}
    };
    QVERIFY_EXCEPTION_THROWN(coordinator.assertSnapshot(identity("bad"), user("Alice"), redactions,
                                                        SnapshotFormat::Json, false),
                             keepsake::SelectorParseError);
    QVERIFY(!QDir(snapshotDir()).exists());

    // No identity was consumed either.
    QCOMPARE(store.resolve(identity("bad")).sequence, static_cast<std::uint32_t>(1));
}

void AssertionTests::testSerializationErrorFailsBeforeIo()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const Content duplicate = Content::map({{Content::string("a"), Content::integer(1)},
                                            {Content::string("a"), Content::integer(2)}});
    QVERIFY_EXCEPTION_THROWN(coordinator.assertSnapshot(identity("dup"), duplicate, {},
                                                        SnapshotFormat::Json, true),
                             keepsake::SerializationError);
    QVERIFY(!QDir(snapshotDir()).exists());
}

void AssertionTests::testTextSnapshots()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const AssertionOutcome first = coordinator.assertText(identity("text"), "line 1\nline 2\n", true);
    QVERIFY(first.status == AssertionStatus::Updated);
    store.resetSequences();

    // Line endings and trailing whitespace do not matter.
    const AssertionOutcome second = coordinator.assertText(identity("text"), "line 1\r\nline 2", false);
    QVERIFY(second.status == AssertionStatus::Passed);
}

void AssertionTests::testDescribeFailure()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const AssertionOutcome outcome =
        coordinator.assertSnapshot(identity("describe"), user("Alice"), {}, SnapshotFormat::Json, false);
    const QString text = QString::fromStdString(outcome.describe());

    QVERIFY(text.contains(QStringLiteral("has no baseline yet")));
    QVERIFY(text.contains(QStringLiteral("tests/test_users.cpp:12")));
    QVERIFY(text.contains(QString::fromStdString(outcome.pendingPath)));
    QVERIFY(text.contains(QStringLiteral("KEEPSAKE_UPDATE=always")));
}

void AssertionTests::testPassingRunLeavesStalePendingInPlace()
{
    SnapshotStore store;
    AssertionCoordinator coordinator(store);

    const AssertionOutcome failed =
        coordinator.assertSnapshot(identity("stale"), user("Alice"), {}, SnapshotFormat::Yaml, false);
    QVERIFY(failed.status == AssertionStatus::Failed);
    const QString pendingPath = QString::fromStdString(failed.pendingPath);
    QVERIFY(QFileInfo::exists(pendingPath));
    const QByteArray pendingBefore = [&]() {
        QFile f(pendingPath);
        return f.open(QIODevice::ReadOnly) ? f.readAll() : QByteArray();
    }();

    // A matching baseline arrives without going through the pending file.
    keepsake::SnapshotFile baseline;
    baseline.metadata.creator = keepsake::creatorString();
    baseline.contents = failed.rendered;
    store.writeBaseline(failed.baselinePath, baseline);
    store.resetSequences();

    const AssertionOutcome passed =
        coordinator.assertSnapshot(identity("stale"), user("Alice"), {}, SnapshotFormat::Yaml, false);
    QVERIFY(passed.status == AssertionStatus::Passed);
    QVERIFY(QFileInfo::exists(pendingPath));

    QFile after(pendingPath);
    QVERIFY(after.open(QIODevice::ReadOnly));
    QCOMPARE(after.readAll(), pendingBefore);
}

QTEST_MAIN(AssertionTests)
#include "test_assertion.moc"
