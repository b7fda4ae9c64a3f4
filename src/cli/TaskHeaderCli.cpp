#include "cli/TaskHeaderCli.hpp"

#include <iostream>

#include <QCoreApplication>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/taskheader_version.hpp"
#include "linear/linear_client.hpp"
#include "sync/markdown_sync.hpp"
#include "sync/markdown_watcher.hpp"

namespace taskheader {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  taskheader-sync generate mine [--limit N]\n"
        "  taskheader-sync generate team --team-id ID --name NAME [--limit N]\n"
        "  taskheader-sync generate project --project-id ID --name NAME [--limit N]\n"
        "  taskheader-sync sync --file PATH\n"
        "  taskheader-sync watch --file PATH\n"
        "  taskheader-sync create --team-id ID --title TITLE [--description TEXT]\n"
        "  taskheader-sync teams\n"
        "  taskheader-sync projects --team-id ID\n"
        "  taskheader-sync current [--set ISSUE_ID | --clear]\n"
        "Options:\n"
        "  --config PATH   config file (default ~/.taskheader_config.json)\n"
        "  --version       print version and exit\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::string issueSummary(const Issue &issue)
{
    std::string line = issue.identifier.empty() ? issue.id : issue.identifier;
    line += ": " + issue.title;
    if (issue.state.has_value() && !issue.state->name.empty()) {
        line += " [" + issue.state->name + "]";
    }
    return line;
}

} // namespace

TaskHeaderCli::TaskHeaderCli() = default;

TaskHeaderCli::TaskHeaderCli(IssueRepository *repository)
    : m_repository(repository)
{
}

TaskHeaderCli::~TaskHeaderCli() = default;

int TaskHeaderCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.contains(QStringLiteral("--version"))) {
        std::cout << "taskheader-sync " << TASKHEADER_VERSION << std::endl;
        return 0;
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    loadConfiguration(args);

    const QString command = args.at(1);
    THLOG_INFO(QStringLiteral("TaskHeaderCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});

    try {
        return dispatch(command, args);
    } catch (const ConfigurationError &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
    } catch (const RemoteCallError &ex) {
        std::cerr << "Remote call failed: " << ex.what() << std::endl;
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
    }
    return 1;
}

int TaskHeaderCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("generate")) {
        return runGenerate(args);
    }
    if (command == QStringLiteral("sync")) {
        return runSync(args);
    }
    if (command == QStringLiteral("watch")) {
        return runWatch(args);
    }
    if (command == QStringLiteral("create")) {
        return runCreate(args);
    }
    if (command == QStringLiteral("teams")) {
        return runTeams(args);
    }
    if (command == QStringLiteral("projects")) {
        return runProjects(args);
    }
    if (command == QStringLiteral("current")) {
        return runCurrent(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

void TaskHeaderCli::loadConfiguration(const QStringList &args)
{
    const QString configArg = getArgValue(args, QStringLiteral("--config"));
    m_configPath = configArg.isEmpty() ? defaultConfigPath() : configArg.toStdString();

    std::string error;
    if (!loadConfig(m_configPath, m_config, &error)) {
        std::cerr << "Warning: " << error << "; using defaults." << std::endl;
    }
}

IssueRepository &TaskHeaderCli::requireRepository()
{
    if (m_repository) {
        return *m_repository;
    }
    if (m_config.linearApiKey.empty()) {
        throw ConfigurationError("Linear API key not configured (set linear_api_key in "
                                 + m_configPath + ")");
    }
    m_ownedClient = std::make_unique<LinearClient>(m_config.linearApiKey);
    m_repository = m_ownedClient.get();
    return *m_repository;
}

int TaskHeaderCli::fetchLimit(const QStringList &args) const
{
    const QString value = getArgValue(args, QStringLiteral("--limit"));
    bool ok = false;
    const int limit = value.toInt(&ok);
    if (!ok || limit <= 0) {
        return m_config.issueFetchLimit;
    }
    return limit;
}

int TaskHeaderCli::runGenerate(const QStringList &args)
{
    // generate <mine|team|project>: fetch issues and write the checklist.
    const QString scope = args.size() > 2 ? args.at(2) : QString();
    const int limit = fetchLimit(args);

    std::string path;
    if (scope == QStringLiteral("mine")) {
        IssueRepository &repository = requireRepository();
        MarkdownSync sync(m_config, &repository);
        path = sync.generateMyIssuesMarkdown(repository.getMyIssues(limit));
    } else if (scope == QStringLiteral("team")) {
        const QString teamId = getArgValue(args, QStringLiteral("--team-id"));
        const QString name = getArgValue(args, QStringLiteral("--name"));
        if (teamId.isEmpty() || name.isEmpty()) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        IssueRepository &repository = requireRepository();
        MarkdownSync sync(m_config, &repository);
        path = sync.generateTeamIssuesMarkdown(
            name.toStdString(), repository.getTeamIssues(teamId.toStdString(), limit));
    } else if (scope == QStringLiteral("project")) {
        const QString projectId = getArgValue(args, QStringLiteral("--project-id"));
        const QString name = getArgValue(args, QStringLiteral("--name"));
        if (projectId.isEmpty() || name.isEmpty()) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        IssueRepository &repository = requireRepository();
        MarkdownSync sync(m_config, &repository);
        path = sync.generateProjectIssuesMarkdown(
            name.toStdString(), repository.getProjectIssues(projectId.toStdString(), limit));
    } else {
        std::cerr << usageText().toStdString();
        return 1;
    }

    std::cout << "Generated: " << path << std::endl;
    return 0;
}

int TaskHeaderCli::runSync(const QStringList &args)
{
    const QString file = getArgValue(args, QStringLiteral("--file"));
    if (file.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    logging::CorrelationScope scope(logging::newCorrelationId());
    MarkdownSync sync(m_config, &requireRepository());
    const int changed = sync.syncMarkdownToRemote(file.toStdString());
    std::cout << "Synced " << changed << " issue(s) to Linear" << std::endl;
    return 0;
}

int TaskHeaderCli::runWatch(const QStringList &args)
{
    // Runs the Qt event loop until the process is interrupted.
    const QString file = getArgValue(args, QStringLiteral("--file"));
    if (file.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!QCoreApplication::instance()) {
        std::cerr << "watch needs a running application object" << std::endl;
        return 1;
    }

    MarkdownSync sync(m_config, &requireRepository());
    if (!m_config.syncOnEdit) {
        std::cerr << "markdown.sync_on_edit is disabled; nothing to watch." << std::endl;
        return 1;
    }
    if (!sync.startWatching(file.toStdString())) {
        std::cerr << "Cannot watch " << file.toStdString() << std::endl;
        return 1;
    }

    QObject::connect(sync.watcher(), &MarkdownWatcher::synced, [](int count) {
        std::cout << "Synced " << count << " issue(s) to Linear" << std::endl;
    });
    QObject::connect(sync.watcher(), &MarkdownWatcher::syncFailed, [](const QString &message) {
        std::cerr << "Sync failed: " << message.toStdString() << std::endl;
    });

    std::cout << "Watching " << QFileInfo(file).absoluteFilePath().toStdString()
              << " (Ctrl+C to stop)" << std::endl;
    return QCoreApplication::exec();
}

int TaskHeaderCli::runCreate(const QStringList &args)
{
    const QString teamId = getArgValue(args, QStringLiteral("--team-id"));
    const QString title = getArgValue(args, QStringLiteral("--title"));
    const QString description = getArgValue(args, QStringLiteral("--description"));
    if (teamId.isEmpty() || title.trimmed().isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    IssueRepository &repository = requireRepository();
    const IssueMutationResult result = repository.createIssue(
        teamId.toStdString(), title.trimmed().toStdString(), description.toStdString());
    if (!result.success) {
        std::cerr << "Failed to create issue" << std::endl;
        return 1;
    }

    const std::string identifier = result.issue ? result.issue->identifier : std::string();
    std::cout << "Created issue: " << (identifier.empty() ? "Unknown" : identifier) << std::endl;

    // Keep an existing my-issues.md current; never create one unasked.
    MarkdownSync sync(m_config, &repository);
    if (m_config.markdownAutoGenerate
        && QFileInfo::exists(QString::fromStdString(sync.myIssuesPath()))) {
        const std::string path =
            sync.generateMyIssuesMarkdown(repository.getMyIssues(m_config.issueFetchLimit));
        std::cout << "Regenerated: " << path << std::endl;
    }
    return 0;
}

int TaskHeaderCli::runTeams(const QStringList &args)
{
    Q_UNUSED(args)
    const auto teams = requireRepository().getTeams();
    std::cout << nlohmann::json(teams).dump(2) << std::endl;
    return 0;
}

int TaskHeaderCli::runProjects(const QStringList &args)
{
    const QString teamId = getArgValue(args, QStringLiteral("--team-id"));
    if (teamId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const auto projects = requireRepository().getTeamProjects(teamId.toStdString());
    std::cout << nlohmann::json(projects).dump(2) << std::endl;
    return 0;
}

int TaskHeaderCli::runCurrent(const QStringList &args)
{
    // current: the issue shown in the sticky header.
    if (args.contains(QStringLiteral("--clear"))) {
        m_config.currentIssueId.reset();
    } else {
        const QString issueId = getArgValue(args, QStringLiteral("--set"));
        if (issueId.isEmpty()) {
            if (!m_config.currentIssueId.has_value()) {
                std::cout << "No current issue" << std::endl;
            } else if (m_config.linearApiKey.empty() && !m_repository) {
                std::cout << *m_config.currentIssueId << std::endl;
            } else {
                std::cout << issueSummary(requireRepository().getIssue(*m_config.currentIssueId))
                          << std::endl;
            }
            return 0;
        }

        const Issue issue = requireRepository().getIssue(issueId.toStdString());
        m_config.currentIssueId = issue.id.empty() ? issueId.toStdString() : issue.id;
        std::cout << issueSummary(issue) << std::endl;
    }

    std::string error;
    if (!saveConfig(m_configPath, m_config, &error)) {
        std::cerr << "Failed to save config: " << error << std::endl;
        return 1;
    }
    return 0;
}

} // namespace taskheader
