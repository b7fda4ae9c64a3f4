#include "sync/markdown_sync.hpp"

#include <stdexcept>
#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "sync/markdown_parser.hpp"
#include "sync/markdown_renderer.hpp"
#include "sync/markdown_watcher.hpp"
#include "sync/reconciler.hpp"

namespace taskheader {

MarkdownSync::MarkdownSync(const AppConfig &config, IssueRepository *repository)
    : m_config(config)
    , m_repository(repository)
{
}

MarkdownSync::~MarkdownSync()
{
    stopWatching();
}

void MarkdownSync::setRepository(IssueRepository *repository)
{
    std::lock_guard<std::mutex> lock(m_syncMutex);
    m_repository = repository;
}

std::string MarkdownSync::myIssuesPath() const
{
    return QDir(QString::fromStdString(m_config.markdownOutputDir))
        .filePath(QStringLiteral("my-issues.md"))
        .toStdString();
}

std::string MarkdownSync::namedIssuesPath(const std::string &name) const
{
    const QString fileName = QStringLiteral("issues-%1.md")
        .arg(QString::fromStdString(sanitizeFileComponent(name)));
    return QDir(QString::fromStdString(m_config.markdownOutputDir))
        .filePath(fileName)
        .toStdString();
}

std::string MarkdownSync::generateMyIssuesMarkdown(const std::vector<Issue> &issues)
{
    return writeDocument(myIssuesPath(), "My Issues", issues, "All issues assigned to me");
}

std::string MarkdownSync::generateTeamIssuesMarkdown(const std::string &teamName,
                                                     const std::vector<Issue> &issues)
{
    return writeDocument(namedIssuesPath(teamName),
                         "Issues: " + teamName,
                         issues,
                         "All issues for team " + teamName);
}

std::string MarkdownSync::generateProjectIssuesMarkdown(const std::string &projectName,
                                                        const std::vector<Issue> &issues)
{
    return writeDocument(namedIssuesPath(projectName),
                         "Issues: " + projectName,
                         issues,
                         "All issues for project " + projectName);
}

std::string MarkdownSync::writeDocument(const std::string &path,
                                        const std::string &title,
                                        const std::vector<Issue> &issues,
                                        const std::string &description)
{
    const QByteArray content =
        QByteArray::fromStdString(renderIssuesMarkdown(title, issues, description));

    // Truncate in place rather than replace, so an active watch on this file
    // keeps its inode.
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw std::runtime_error("cannot write " + path + ": "
                                 + file.errorString().toStdString());
    }
    if (file.write(content) != content.size()) {
        throw std::runtime_error("short write to " + path + ": "
                                 + file.errorString().toStdString());
    }
    file.close();

    THLOG_INFO(QStringLiteral("MarkdownSync"),
               QStringLiteral("writeDocument"),
               QStringLiteral("markdown_generated"),
               QStringLiteral("user_request"),
               QStringLiteral("file_write"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"path", path}, {"issues", issues.size()}});
    return QFileInfo(QString::fromStdString(path)).absoluteFilePath().toStdString();
}

int MarkdownSync::syncMarkdownToRemote(const std::string &path)
{
    std::lock_guard<std::mutex> lock(m_syncMutex);

    if (!m_repository) {
        throw ConfigurationError("Linear client not configured");
    }

    const auto intents = parseMarkdownFile(path);
    THLOG_DEBUG(QStringLiteral("MarkdownSync"),
                QStringLiteral("syncMarkdownToRemote"),
                QStringLiteral("intents_parsed"),
                QStringLiteral("sync_requested"),
                QStringLiteral("regex_scan"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"path", path}, {"intents", intents.size()}});
    Reconciler reconciler(m_repository);
    return reconciler.reconcile(intents);
}

bool MarkdownSync::startWatching(const std::string &path,
                                 std::function<void(int count)> onSynced)
{
    if (!m_config.syncOnEdit) {
        THLOG_INFO(QStringLiteral("MarkdownSync"),
                   QStringLiteral("startWatching"),
                   QStringLiteral("watch_disabled"),
                   QStringLiteral("sync_on_edit_off"),
                   QStringLiteral("config"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path}});
        return false;
    }

    if (!m_watcher) {
        m_watcher = std::make_unique<MarkdownWatcher>(
            [this](const QString &file) { return syncMarkdownToRemote(file.toStdString()); });
    }
    return m_watcher->watch(QString::fromStdString(path), std::move(onSynced));
}

void MarkdownSync::stopWatching()
{
    if (m_watcher) {
        m_watcher->unwatch();
    }
}

bool MarkdownSync::isWatching() const
{
    return m_watcher && m_watcher->isWatching();
}

MarkdownWatcher *MarkdownSync::watcher() const
{
    return m_watcher.get();
}

} // namespace taskheader
