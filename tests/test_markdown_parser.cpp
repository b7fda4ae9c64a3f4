#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "sync/markdown_parser.hpp"

class MarkdownParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testSingleItem();
    void testCheckedItem();
    void testMultipleItemsInOrder();
    void testMissingIdIsSkipped();
    void testIdMustPrecedeNextMarker();
    void testUppercaseMarkerIgnored();
    void testIdWithoutCheckboxIgnored();
    void testParseFile();
    void testMissingFile();
};

void MarkdownParserTests::testSingleItem()
{
    const auto intents = taskheader::parseMarkdown(
        "- [ ] **ENG-1**: Fix login *[In Progress]* <!-- id:abc -->\n");
    QCOMPARE(intents.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(intents.front().issueId), QStringLiteral("abc"));
    QCOMPARE(intents.front().completed, false);
}

void MarkdownParserTests::testCheckedItem()
{
    const auto intents = taskheader::parseMarkdown(
        "  - [x] edited title text <!-- id:9f1c-22aa -->");
    QCOMPARE(intents.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(intents.front().issueId), QStringLiteral("9f1c-22aa"));
    QCOMPARE(intents.front().completed, true);
}

void MarkdownParserTests::testMultipleItemsInOrder()
{
    const std::string text =
        "# My Issues\n"
        "\n"
        "## Started\n"
        "\n"
        "- [ ] **ENG-1**: One *[In Progress]* <!-- id:one -->\n"
        "- [x] **ENG-2**: Two *[In Progress]* <!-- id:two -->\n"
        "\n"
        "## Completed\n"
        "\n"
        "- [ ] **ENG-3**: Three *[Done]* <!-- id:three -->\n";

    const auto intents = taskheader::parseMarkdown(text);
    QCOMPARE(intents.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(intents[0].issueId), QStringLiteral("one"));
    QCOMPARE(intents[0].completed, false);
    QCOMPARE(QString::fromStdString(intents[1].issueId), QStringLiteral("two"));
    QCOMPARE(intents[1].completed, true);
    QCOMPARE(QString::fromStdString(intents[2].issueId), QStringLiteral("three"));
    QCOMPARE(intents[2].completed, false);
}

void MarkdownParserTests::testMissingIdIsSkipped()
{
    const auto intents = taskheader::parseMarkdown(
        "- [x] **ENG-1**: comment removed\n"
        "- [ ] **ENG-2**: kept <!-- id:kept -->\n");
    QCOMPARE(intents.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(intents.front().issueId), QStringLiteral("kept"));
}

void MarkdownParserTests::testIdMustPrecedeNextMarker()
{
    // Two items joined on one line: each marker claims only its own id.
    const auto joined = taskheader::parseMarkdown(
        "- [x] first <!-- id:a --> - [ ] second <!-- id:b -->");
    QCOMPARE(joined.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(joined[0].issueId), QStringLiteral("a"));
    QCOMPARE(joined[0].completed, true);
    QCOMPARE(QString::fromStdString(joined[1].issueId), QStringLiteral("b"));
    QCOMPARE(joined[1].completed, false);

    // A marker without an id must not borrow the following item's id.
    const auto borrowed = taskheader::parseMarkdown(
        "- [x] no id here - [ ] second <!-- id:b -->");
    QCOMPARE(borrowed.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(borrowed.front().issueId), QStringLiteral("b"));
    QCOMPARE(borrowed.front().completed, false);

    // Nor an id on the next line.
    const auto nextLine = taskheader::parseMarkdown("- [x] no id\n<!-- id:orphan -->\n");
    QVERIFY(nextLine.empty());
}

void MarkdownParserTests::testUppercaseMarkerIgnored()
{
    const auto intents = taskheader::parseMarkdown(
        "- [X] **ENG-1**: shouted <!-- id:upper -->\n"
        "* [x] **ENG-2**: star bullet <!-- id:star -->\n");
    QVERIFY(intents.empty());
}

void MarkdownParserTests::testIdWithoutCheckboxIgnored()
{
    const auto intents = taskheader::parseMarkdown("Plain text <!-- id:loose -->\n");
    QVERIFY(intents.empty());
}

void MarkdownParserTests::testParseFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.path() + "/my-issues.md";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("- [x] **ENG-7**: From disk *[Todo]* <!-- id:disk -->\n");
    file.close();

    const auto intents = taskheader::parseMarkdownFile(path.toStdString());
    QCOMPARE(intents.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(intents.front().issueId), QStringLiteral("disk"));
    QCOMPARE(intents.front().completed, true);
}

void MarkdownParserTests::testMissingFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const auto intents = taskheader::parseMarkdownFile(
        (tempDir.path() + "/does-not-exist.md").toStdString());
    QVERIFY(intents.empty());
}

QTEST_MAIN(MarkdownParserTests)
#include "test_markdown_parser.moc"
