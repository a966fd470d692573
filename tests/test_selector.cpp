#include <QtTest/QtTest>

#include "common/errors.hpp"
#include "engine/selector.hpp"

using keepsake::ContentPath;
using keepsake::PathElement;
using keepsake::Selector;
using keepsake::SelectorParseError;

namespace {

ContentPath path(std::initializer_list<PathElement> elements)
{
    return ContentPath(elements);
}

} // namespace

class SelectorTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseSegments();
    void testBracketsAndQuotedKeys();
    void testToStringNormalizes();
    void testExactMatch();
    void testWildcardMatchesOneElement();
    void testRecursiveWildcard();
    void testEntryElementsOnlyMatchWildcards();
    void testParseErrors_data();
    void testParseErrors();
};

void SelectorTests::testParseSegments()
{
    const Selector selector = Selector::parse(".users[0].password");
    QCOMPARE(selector.segments().size(), static_cast<std::size_t>(3));
    QVERIFY(selector.segments()[0].kind == Selector::Segment::Kind::Key);
    QCOMPARE(QString::fromStdString(selector.segments()[0].key), QStringLiteral("users"));
    QVERIFY(selector.segments()[1].kind == Selector::Segment::Kind::Index);
    QCOMPARE(selector.segments()[1].index, static_cast<std::size_t>(0));
    QCOMPARE(QString::fromStdString(selector.segments()[2].key), QStringLiteral("password"));

    const Selector wild = Selector::parse("**.id");
    QVERIFY(wild.segments()[0].kind == Selector::Segment::Kind::RecursiveWildcard);

    // The leading dot is optional.
    QCOMPARE(QString::fromStdString(Selector::parse("a.b").toString()),
             QString::fromStdString(Selector::parse(".a.b").toString()));
}

void SelectorTests::testBracketsAndQuotedKeys()
{
    const Selector quoted = Selector::parse(".\"key.with.dots\"");
    QCOMPARE(quoted.segments().size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(quoted.segments()[0].key), QStringLiteral("key.with.dots"));

    const Selector bracket = Selector::parse(".map[\"a b\"][12]");
    QCOMPARE(bracket.segments().size(), static_cast<std::size_t>(3));
    QCOMPARE(QString::fromStdString(bracket.segments()[1].key), QStringLiteral("a b"));
    QCOMPARE(bracket.segments()[2].index, static_cast<std::size_t>(12));

    const Selector escaped = Selector::parse(".\"say \\\"hi\\\"\"");
    QCOMPARE(QString::fromStdString(escaped.segments()[0].key), QStringLiteral("say \"hi\""));
}

void SelectorTests::testToStringNormalizes()
{
    QCOMPARE(QString::fromStdString(Selector::parse("users[0].password").toString()),
             QStringLiteral(".users.0.password"));
    QCOMPARE(QString::fromStdString(Selector::parse("[\"a.b\"].*.**").toString()),
             QStringLiteral(".\"a.b\".*.**"));
}

void SelectorTests::testExactMatch()
{
    const Selector selector = Selector::parse(".users[0].password");
    QVERIFY(selector.matches(path({PathElement::keyed("users"),
                                   PathElement::indexed(0),
                                   PathElement::keyed("password")})));
    QVERIFY(!selector.matches(path({PathElement::keyed("users"),
                                    PathElement::indexed(1),
                                    PathElement::keyed("password")})));
    QVERIFY(!selector.matches(path({PathElement::keyed("users"), PathElement::indexed(0)})));
    // Index segments never match keys with the same text.
    QVERIFY(!Selector::parse("0").matches(path({PathElement::keyed("0")})));
}

void SelectorTests::testWildcardMatchesOneElement()
{
    const Selector selector = Selector::parse("*.id");
    QVERIFY(selector.matches(path({PathElement::keyed("a"), PathElement::keyed("id")})));
    QVERIFY(selector.matches(path({PathElement::indexed(3), PathElement::keyed("id")})));
    QVERIFY(!selector.matches(path({PathElement::keyed("id")})));
    QVERIFY(!selector.matches(path({PathElement::keyed("a"),
                                    PathElement::keyed("b"),
                                    PathElement::keyed("id")})));
}

void SelectorTests::testRecursiveWildcard()
{
    const Selector selector = Selector::parse("**.id");
    QVERIFY(selector.matches(path({PathElement::keyed("id")})));
    QVERIFY(selector.matches(path({PathElement::keyed("a"), PathElement::keyed("id")})));
    QVERIFY(selector.matches(path({PathElement::keyed("a"),
                                   PathElement::indexed(2),
                                   PathElement::keyed("b"),
                                   PathElement::keyed("id")})));
    QVERIFY(!selector.matches(path({PathElement::keyed("id"), PathElement::keyed("x")})));

    const Selector everything = Selector::parse("**");
    QVERIFY(everything.matches(path({})));
    QVERIFY(everything.matches(path({PathElement::indexed(0), PathElement::keyed("x")})));

    const Selector middle = Selector::parse("a.**.z");
    QVERIFY(middle.matches(path({PathElement::keyed("a"), PathElement::keyed("z")})));
    QVERIFY(middle.matches(path({PathElement::keyed("a"),
                                 PathElement::keyed("b"),
                                 PathElement::keyed("c"),
                                 PathElement::keyed("z")})));
    QVERIFY(!middle.matches(path({PathElement::keyed("b"), PathElement::keyed("z")})));
}

void SelectorTests::testEntryElementsOnlyMatchWildcards()
{
    const ContentPath entryPath = path({PathElement::entry(0)});
    QVERIFY(Selector::parse("*").matches(entryPath));
    QVERIFY(Selector::parse("**").matches(entryPath));
    QVERIFY(!Selector::parse("0").matches(entryPath));
    QVERIFY(!Selector::parse("[0]").matches(entryPath));
}

void SelectorTests::testParseErrors_data()
{
    QTest::addColumn<QString>("selector");
    QTest::addColumn<int>("position");
    QTest::addColumn<QString>("reason");

    QTest::newRow("empty") << QString() << 0 << QStringLiteral("empty selector");
    QTest::newRow("double-dot") << QStringLiteral("a..b") << 2 << QStringLiteral("empty segment");
    QTest::newRow("only-dot") << QStringLiteral(".") << 1 << QStringLiteral("empty segment");
    QTest::newRow("trailing-dot") << QStringLiteral("a.") << 1 << QStringLiteral("trailing separator");
    QTest::newRow("unterminated-quote") << QStringLiteral(".\"abc") << 1
                                        << QStringLiteral("unterminated quote");
    QTest::newRow("bad-escape") << QStringLiteral(".\"a\\nb\"") << 3
                                << QStringLiteral("invalid escape sequence");
    QTest::newRow("negative-index") << QStringLiteral("a[-1]") << 2
                                    << QStringLiteral("invalid integer '-1'");
    QTest::newRow("unterminated-bracket") << QStringLiteral("a[1") << 1
                                          << QStringLiteral("unterminated bracket");
    QTest::newRow("missing-separator") << QStringLiteral("\"a\"b") << 3
                                       << QStringLiteral("expected '.' but found 'b'");
    QTest::newRow("unexpected-character") << QStringLiteral("a.$") << 2
                                          << QStringLiteral("unexpected character '$'");
}

void SelectorTests::testParseErrors()
{
    QFETCH(QString, selector);
    QFETCH(int, position);
    QFETCH(QString, reason);

    bool thrown = false;
    try {
        Selector::parse(selector.toStdString());
    } catch (const SelectorParseError &error) {
        thrown = true;
        QCOMPARE(static_cast<int>(error.position()), position);
        QCOMPARE(QString::fromStdString(error.reason()), reason);
    }
    QVERIFY(thrown);
}

QTEST_MAIN(SelectorTests)
#include "test_selector.moc"
