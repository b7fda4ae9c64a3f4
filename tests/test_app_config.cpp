#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/app_config.hpp"

class AppConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDefaultPath();
    void testMissingFileKeepsDefaults();
    void testLoadNestedKeys();
    void testPartialFileUsesDefaults();
    void testOutOfRangeValuesClamped();
    void testMalformedFileResetsToDefaults();
    void testSaveThenLoad();
    void testSaveWritesNullIssue();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeConfig(const QByteArray &content) const;
};

void AppConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void AppConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString AppConfigTests::writeConfig(const QByteArray &content) const
{
    const QString path = m_tempDir.path() + "/config.json";
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Failed to open file:" << path << file.errorString();
        return QString();
    }
    file.write(content);
    file.close();
    return path;
}

void AppConfigTests::testDefaultPath()
{
    QCOMPARE(QString::fromStdString(taskheader::defaultConfigPath()),
             m_tempDir.path() + "/.taskheader_config.json");
}

void AppConfigTests::testMissingFileKeepsDefaults()
{
    taskheader::AppConfig cfg;
    std::string error;
    QVERIFY(taskheader::loadConfig((m_tempDir.path() + "/absent.json").toStdString(), cfg, &error));
    QVERIFY(error.empty());
    QCOMPARE(QString::fromStdString(cfg.hotkey), QStringLiteral("ctrl+w"));
    QCOMPARE(cfg.headerWidthPercent, 10);
    QCOMPARE(cfg.headerHeightPercent, 10);
    QCOMPARE(QString::fromStdString(cfg.headerPosition), QStringLiteral("top-middle"));
    QCOMPARE(cfg.transparencyPercent, 0);
    QCOMPARE(cfg.fontSize, 40);
    QVERIFY(!cfg.currentIssueId.has_value());
    QVERIFY(cfg.markdownAutoGenerate);
    QVERIFY(cfg.syncOnEdit);
    QCOMPARE(QString::fromStdString(cfg.markdownOutputDir), QStringLiteral("."));
    QCOMPARE(cfg.issueFetchLimit, 50);
}

void AppConfigTests::testLoadNestedKeys()
{
    const QString path = writeConfig(R"({
        "linear_api_key": "lin_api_123",
        "hotkey": "ctrl+shift+h",
        "current_issue_id": "issue-9",
        "font_size": 28,
        "window": {"width_percent": 30, "height_percent": 12, "position": "top-left",
                   "transparency_percent": 25},
        "markdown": {"auto_generate": false, "sync_on_edit": false,
                     "output_dir": "/tmp/issues", "fetch_limit": 20}
    })");

    taskheader::AppConfig cfg;
    QVERIFY(taskheader::loadConfig(path.toStdString(), cfg));
    QCOMPARE(QString::fromStdString(cfg.linearApiKey), QStringLiteral("lin_api_123"));
    QCOMPARE(QString::fromStdString(cfg.hotkey), QStringLiteral("ctrl+shift+h"));
    QCOMPARE(QString::fromStdString(cfg.currentIssueId.value_or("")), QStringLiteral("issue-9"));
    QCOMPARE(cfg.fontSize, 28);
    QCOMPARE(cfg.headerWidthPercent, 30);
    QCOMPARE(cfg.headerHeightPercent, 12);
    QCOMPARE(QString::fromStdString(cfg.headerPosition), QStringLiteral("top-left"));
    QCOMPARE(cfg.transparencyPercent, 25);
    QVERIFY(!cfg.markdownAutoGenerate);
    QVERIFY(!cfg.syncOnEdit);
    QCOMPARE(QString::fromStdString(cfg.markdownOutputDir), QStringLiteral("/tmp/issues"));
    QCOMPARE(cfg.issueFetchLimit, 20);
}

void AppConfigTests::testPartialFileUsesDefaults()
{
    const QString path = writeConfig(
        R"({"markdown": {"output_dir": "notes"}, "current_issue_id": null, "font_size": "big"})");

    taskheader::AppConfig cfg;
    cfg.currentIssueId = std::string("stale");
    QVERIFY(taskheader::loadConfig(path.toStdString(), cfg));
    QCOMPARE(QString::fromStdString(cfg.markdownOutputDir), QStringLiteral("notes"));
    QVERIFY(cfg.syncOnEdit);
    QVERIFY(!cfg.currentIssueId.has_value());
    QCOMPARE(cfg.fontSize, 40);
}

void AppConfigTests::testOutOfRangeValuesClamped()
{
    const QString path = writeConfig(
        R"({"window": {"width_percent": 250, "transparency_percent": -5},
            "markdown": {"fetch_limit": 0}})");

    taskheader::AppConfig cfg;
    QVERIFY(taskheader::loadConfig(path.toStdString(), cfg));
    QCOMPARE(cfg.headerWidthPercent, 100);
    QCOMPARE(cfg.transparencyPercent, 0);
    QCOMPARE(cfg.issueFetchLimit, 50);
}

void AppConfigTests::testMalformedFileResetsToDefaults()
{
    const QString path = writeConfig("{ this is not json");

    taskheader::AppConfig cfg;
    cfg.linearApiKey = "previous";
    std::string error;
    QVERIFY(!taskheader::loadConfig(path.toStdString(), cfg, &error));
    QVERIFY(!error.empty());
    QVERIFY(cfg.linearApiKey.empty());
    QCOMPARE(cfg.issueFetchLimit, 50);

    const QString arrayPath = writeConfig("[1, 2, 3]");
    QVERIFY(!taskheader::loadConfig(arrayPath.toStdString(), cfg, &error));
}

void AppConfigTests::testSaveThenLoad()
{
    taskheader::AppConfig cfg;
    cfg.linearApiKey = "lin_api_456";
    cfg.currentIssueId = std::string("issue-1");
    cfg.syncOnEdit = false;
    cfg.markdownOutputDir = "out";
    cfg.transparencyPercent = 40;

    const std::string path = (m_tempDir.path() + "/nested/dir/config.json").toStdString();
    std::string error;
    QVERIFY(taskheader::saveConfig(path, cfg, &error));

    taskheader::AppConfig loaded;
    QVERIFY(taskheader::loadConfig(path, loaded, &error));
    QCOMPARE(QString::fromStdString(loaded.linearApiKey), QStringLiteral("lin_api_456"));
    QCOMPARE(QString::fromStdString(loaded.currentIssueId.value_or("")), QStringLiteral("issue-1"));
    QVERIFY(!loaded.syncOnEdit);
    QCOMPARE(QString::fromStdString(loaded.markdownOutputDir), QStringLiteral("out"));
    QCOMPARE(loaded.transparencyPercent, 40);
}

void AppConfigTests::testSaveWritesNullIssue()
{
    taskheader::AppConfig cfg;
    const QString path = m_tempDir.path() + "/null-issue.json";
    QVERIFY(taskheader::saveConfig(path.toStdString(), cfg));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto root = nlohmann::json::parse(file.readAll().toStdString());
    QVERIFY(root.contains("current_issue_id"));
    QVERIFY(root["current_issue_id"].is_null());
    QCOMPARE(QString::fromStdString(root["window"].value("position", "")),
             QStringLiteral("top-middle"));
    QVERIFY(root["markdown"].value("sync_on_edit", false));
}

QTEST_MAIN(AppConfigTests)
#include "test_app_config.moc"
