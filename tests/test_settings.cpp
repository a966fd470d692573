#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/settings.hpp"

class SettingsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();

    void testParseUpdateMode_data();
    void testParseUpdateMode();
    void testDefaults();
    void testFromEnvironment();
    void testUnknownUpdateModeWarns();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
};

void SettingsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("KEEPSAKE_LOG_DIR");
    qputenv("KEEPSAKE_LOG_DIR", (m_tempDir.path() + "/logs").toUtf8());
    keepsake::logging::initLogging(QStringLiteral("keepsake-settings-test"), false);
}

void SettingsTests::cleanupTestCase()
{
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("KEEPSAKE_LOG_DIR");
    } else {
        qputenv("KEEPSAKE_LOG_DIR", m_prevLogDir);
    }
}

void SettingsTests::cleanup()
{
    qunsetenv("KEEPSAKE_UPDATE");
    qunsetenv("KEEPSAKE_TRACE");
    qunsetenv("KEEPSAKE_WORKSPACE");
}

void SettingsTests::testParseUpdateMode_data()
{
    QTest::addColumn<QString>("value");
    QTest::addColumn<bool>("expected");
    QTest::addColumn<bool>("recognized");

    QTest::newRow("unset") << QString() << false << true;
    QTest::newRow("no") << QStringLiteral("no") << false << true;
    QTest::newRow("zero") << QStringLiteral("0") << false << true;
    QTest::newRow("always") << QStringLiteral("always") << true << true;
    QTest::newRow("one") << QStringLiteral("1") << true << true;
    QTest::newRow("yes-upper") << QStringLiteral("YES") << true << true;
    QTest::newRow("garbage") << QStringLiteral("sometimes") << false << false;
}

void SettingsTests::testParseUpdateMode()
{
    QFETCH(QString, value);
    QFETCH(bool, expected);
    QFETCH(bool, recognized);

    bool wasRecognized = !recognized;
    QCOMPARE(keepsake::parseUpdateMode(value.toStdString(), &wasRecognized), expected);
    QCOMPARE(wasRecognized, recognized);
}

void SettingsTests::testDefaults()
{
    const keepsake::RunSettings settings = keepsake::RunSettings::fromEnvironment();
    QVERIFY(!settings.updateMode);
    QVERIFY(!settings.traceEnabled);
    QCOMPARE(QString::fromStdString(settings.workspaceRoot), QDir::currentPath());
}

void SettingsTests::testFromEnvironment()
{
    qputenv("KEEPSAKE_UPDATE", "always");
    qputenv("KEEPSAKE_TRACE", "1");
    qputenv("KEEPSAKE_WORKSPACE", m_tempDir.path().toUtf8());

    const keepsake::RunSettings settings = keepsake::RunSettings::fromEnvironment();
    QVERIFY(settings.updateMode);
    QVERIFY(settings.traceEnabled);
    QCOMPARE(QString::fromStdString(settings.workspaceRoot), m_tempDir.path());
}

void SettingsTests::testUnknownUpdateModeWarns()
{
    qputenv("KEEPSAKE_UPDATE", "sometimes");
    QVERIFY(!keepsake::RunSettings::fromEnvironment().updateMode);

    QFile file(keepsake::logging::logsDirPath() + "/keepsake-settings-test.log");
    QVERIFY(file.open(QIODevice::ReadOnly));
    bool found = false;
    while (!file.atEnd()) {
        const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
        if (parsed.value("what", "") == "unknown_update_mode") {
            QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("WARN"));
            found = true;
        }
    }
    QVERIFY(found);
}

QTEST_MAIN(SettingsTests)
#include "test_settings.moc"
