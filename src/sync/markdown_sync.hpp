#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/app_config.hpp"
#include "common/models.hpp"
#include "linear/issue_repository.hpp"

namespace taskheader {

class MarkdownWatcher;

/**
 * MarkdownSync owns the markdown side of the application:
 * - generating my-issues.md / issues-{name}.md under markdown.output_dir
 * - one-shot file -> remote syncs
 * - watching a generated file and syncing on every save
 *
 * Syncs are serialized: a manual sync and a watcher-triggered sync never run
 * at the same time. The repository is not owned and may be null until the
 * user configures an API key.
 */
class MarkdownSync {
public:
    MarkdownSync(const AppConfig &config, IssueRepository *repository);
    ~MarkdownSync();

    MarkdownSync(const MarkdownSync &) = delete;
    MarkdownSync &operator=(const MarkdownSync &) = delete;

    void setRepository(IssueRepository *repository);

    // Each returns the written path; throws std::runtime_error when the file
    // cannot be written.
    std::string generateMyIssuesMarkdown(const std::vector<Issue> &issues);
    std::string generateTeamIssuesMarkdown(const std::string &teamName,
                                           const std::vector<Issue> &issues);
    std::string generateProjectIssuesMarkdown(const std::string &projectName,
                                              const std::vector<Issue> &issues);

    std::string myIssuesPath() const;
    std::string namedIssuesPath(const std::string &name) const;

    // Parse the file and reconcile it against the remote. Returns the number
    // of issues transitioned; throws ConfigurationError without a repository.
    int syncMarkdownToRemote(const std::string &path);

    // No-op returning false when markdown.sync_on_edit is off.
    bool startWatching(const std::string &path,
                       std::function<void(int count)> onSynced = {});
    void stopWatching();
    bool isWatching() const;

    // Exposed so callers can connect to the watcher's Qt signals.
    MarkdownWatcher *watcher() const;

private:
    std::string writeDocument(const std::string &path,
                              const std::string &title,
                              const std::vector<Issue> &issues,
                              const std::string &description);

    AppConfig m_config;
    IssueRepository *m_repository;
    std::mutex m_syncMutex;
    std::unique_ptr<MarkdownWatcher> m_watcher;
};

} // namespace taskheader
