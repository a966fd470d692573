#include <QtTest/QtTest>

#include "engine/snapshot_file.hpp"

using keepsake::SnapshotFile;

class SnapshotFileTests : public QObject
{
    Q_OBJECT
private slots:
    void testSerializeLayout();
    void testParseReadsHeaderAndBody();
    void testHeaderValuesAreJsonStrings();
    void testTextWithoutHeaderIsBody();
    void testUnclosedHeaderIsBody();
    void testCrlfHeader();
    void testBodyRoundTripsExactly();
};

void SnapshotFileTests::testSerializeLayout()
{
    SnapshotFile file;
    file.metadata.creator = "keepsake@0.1.0";
    file.metadata.source = "tests/test_users.cpp:42";
    file.metadata.expression = "user";
    file.metadata.snapshot = "test_users__login";
    file.contents = "name: Alice";

    QCOMPARE(QString::fromStdString(keepsake::serializeSnapshotFile(file)),
             QStringLiteral("---\n"
                            "creator: \"keepsake@0.1.0\"\n"
                            "source: \"tests/test_users.cpp:42\"\n"
                            "expression: \"user\"\n"
                            "snapshot: \"test_users__login\"\n"
                            "---\n"
                            "name: Alice\n"));
}

void SnapshotFileTests::testParseReadsHeaderAndBody()
{
    const std::string text = "---\n"
                             "creator: \"keepsake@0.1.0\"\n"
                             "source: \"a.cpp:1\"\n"
                             "expression: \"x\"\n"
                             "snapshot: \"a__x\"\n"
                             "---\n"
                             "line 1\n"
                             "---\n"
                             "line 3\n";

    const SnapshotFile file = keepsake::parseSnapshotFile(text);
    QCOMPARE(QString::fromStdString(file.metadata.creator), QStringLiteral("keepsake@0.1.0"));
    QCOMPARE(QString::fromStdString(file.metadata.source), QStringLiteral("a.cpp:1"));
    QCOMPARE(QString::fromStdString(file.metadata.expression), QStringLiteral("x"));
    QCOMPARE(QString::fromStdString(file.metadata.snapshot), QStringLiteral("a__x"));
    // A delimiter inside the body is body text.
    QCOMPARE(QString::fromStdString(file.contents), QStringLiteral("line 1\n---\nline 3"));
}

void SnapshotFileTests::testHeaderValuesAreJsonStrings()
{
    SnapshotFile file;
    file.metadata.expression = "split(\"a:b\")\n";
    file.contents = "[]";

    const SnapshotFile parsed =
        keepsake::parseSnapshotFile(keepsake::serializeSnapshotFile(file));
    QCOMPARE(QString::fromStdString(parsed.metadata.expression),
             QStringLiteral("split(\"a:b\")\n"));
    QCOMPARE(QString::fromStdString(parsed.contents), QStringLiteral("[]"));
}

void SnapshotFileTests::testTextWithoutHeaderIsBody()
{
    const SnapshotFile file = keepsake::parseSnapshotFile("plain body\n");
    QVERIFY(file.metadata.creator.empty());
    QCOMPARE(QString::fromStdString(file.contents), QStringLiteral("plain body\n"));

    QVERIFY(keepsake::parseSnapshotFile("").contents.empty());
}

void SnapshotFileTests::testUnclosedHeaderIsBody()
{
    const std::string text = "---\ncreator: \"x\"\nbody";
    const SnapshotFile file = keepsake::parseSnapshotFile(text);
    QVERIFY(file.metadata.creator.empty());
    QCOMPARE(QString::fromStdString(file.contents), QString::fromStdString(text));
}

void SnapshotFileTests::testCrlfHeader()
{
    const SnapshotFile file = keepsake::parseSnapshotFile(
        "---\r\ncreator: \"keepsake@0.1.0\"\r\nsnapshot: \"a\"\r\n---\r\nbody\r\n");
    QCOMPARE(QString::fromStdString(file.metadata.creator), QStringLiteral("keepsake@0.1.0"));
    QCOMPARE(QString::fromStdString(file.metadata.snapshot), QStringLiteral("a"));
    QCOMPARE(QString::fromStdString(file.contents), QStringLiteral("body"));
}

void SnapshotFileTests::testBodyRoundTripsExactly()
{
    for (const char *body : {"", "x", "x\n", "x\n\n", "a\r\nb", " trailing  "}) {
        SnapshotFile file;
        file.metadata.creator = keepsake::creatorString();
        file.contents = body;
        QCOMPARE(QString::fromStdString(keepsake::parseSnapshotFile(
                     keepsake::serializeSnapshotFile(file)).contents),
                 QString::fromUtf8(body));
    }
}

QTEST_MAIN(SnapshotFileTests)
#include "test_snapshot_file.moc"
