#pragma once

#include <string>
#include <vector>

#include <QByteArray>
#include <QString>

#include <nlohmann/json.hpp>

#include "linear/issue_repository.hpp"

namespace taskheader {

/**
 * LinearClient implements IssueRepository against Linear's GraphQL API.
 *
 * Calls are synchronous: each request runs a private QEventLoop until the
 * reply finishes or the timeout fires, so the client can be used from any
 * thread that may block (the watcher's worker thread, the CLI).
 */
class LinearClient : public IssueRepository {
public:
    static constexpr const char *kDefaultEndpoint = "https://api.linear.app/graphql";
    static constexpr int kDefaultTimeoutMs = 30000;

    explicit LinearClient(std::string apiKey,
                          QString endpoint = QString::fromLatin1(kDefaultEndpoint),
                          int timeoutMs = kDefaultTimeoutMs);
    ~LinearClient() override;

    Issue getIssue(const std::string &issueId) override;
    std::vector<WorkflowState> getWorkflowStates(const std::string &teamId) override;
    IssueMutationResult updateIssueState(const std::string &issueId,
                                         const std::string &stateId) override;

    std::vector<Issue> getMyIssues(int limit) override;
    std::vector<Issue> getTeamIssues(const std::string &teamId, int limit) override;
    std::vector<Issue> getProjectIssues(const std::string &projectId, int limit) override;

    IssueMutationResult createIssue(const std::string &teamId,
                                    const std::string &title,
                                    const std::string &description) override;

    UserRef getViewer() override;
    std::vector<TeamRef> getTeams() override;
    std::vector<ProjectRef> getTeamProjects(const std::string &teamId) override;

    // {"query": ..., "variables": ...}; variables omitted when empty.
    static QByteArray buildRequestBody(const std::string &query,
                                       const nlohmann::json &variables);

    // Returns the "data" object or throws RemoteCallError for a non-200
    // status, an unparseable body or a GraphQL "errors" member.
    static nlohmann::json decodeResponse(int httpStatus, const QByteArray &body);

private:
    nlohmann::json executeQuery(const char *operation,
                                const std::string &query,
                                const nlohmann::json &variables = nlohmann::json::object());

    std::string m_apiKey;
    QString m_endpoint;
    int m_timeoutMs;
};

} // namespace taskheader
