#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace taskheader {

/**
 * IssueRepository is the capability interface the sync core talks to.
 *
 * Every method may throw RemoteCallError; implementations own their own
 * per-call timeout. The production implementation is LinearClient; tests
 * substitute an in-memory fake.
 */
class IssueRepository {
public:
    virtual ~IssueRepository() = default;

    virtual Issue getIssue(const std::string &issueId) = 0;
    // Ordered as the remote returns them.
    virtual std::vector<WorkflowState> getWorkflowStates(const std::string &teamId) = 0;
    virtual IssueMutationResult updateIssueState(const std::string &issueId,
                                                 const std::string &stateId) = 0;

    virtual std::vector<Issue> getMyIssues(int limit) = 0;
    virtual std::vector<Issue> getTeamIssues(const std::string &teamId, int limit) = 0;
    virtual std::vector<Issue> getProjectIssues(const std::string &projectId, int limit) = 0;

    virtual IssueMutationResult createIssue(const std::string &teamId,
                                            const std::string &title,
                                            const std::string &description) = 0;

    virtual UserRef getViewer() = 0;
    virtual std::vector<TeamRef> getTeams() = 0;
    virtual std::vector<ProjectRef> getTeamProjects(const std::string &teamId) = 0;
};

} // namespace taskheader
