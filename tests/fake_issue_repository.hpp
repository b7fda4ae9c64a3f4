#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "common/errors.hpp"
#include "linear/issue_repository.hpp"

// In-memory IssueRepository for tests. Records every state update and can be
// told to fail selected calls.
class FakeIssueRepository : public taskheader::IssueRepository
{
public:
    struct Update {
        std::string issueId;
        std::string stateId;
    };

    void addTeam(const std::string &teamId, std::vector<taskheader::WorkflowState> states)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_states[teamId] = std::move(states);
    }

    void addIssue(const taskheader::Issue &issue)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_issues[issue.id] = issue;
        m_order.push_back(issue.id);
    }

    void failUpdatesFor(const std::string &issueId)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failingUpdates.insert(issueId);
    }

    void rejectUpdatesFor(const std::string &issueId)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_rejectedUpdates.insert(issueId);
    }

    std::vector<Update> updates() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_updates;
    }

    int getIssueCalls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_getIssueCalls;
    }

    taskheader::Issue issue(const std::string &issueId) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_issues.at(issueId);
    }

    taskheader::Issue getIssue(const std::string &issueId) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_getIssueCalls;
        auto it = m_issues.find(issueId);
        if (it == m_issues.end()) {
            throw taskheader::RemoteCallError("Linear API error: issue not found");
        }
        return it->second;
    }

    std::vector<taskheader::WorkflowState> getWorkflowStates(const std::string &teamId) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_states.find(teamId);
        if (it == m_states.end()) {
            return {};
        }
        return it->second;
    }

    taskheader::IssueMutationResult updateIssueState(const std::string &issueId,
                                                     const std::string &stateId) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failingUpdates.count(issueId) > 0) {
            throw taskheader::RemoteCallError("Linear API request failed: 500 - boom", 500);
        }
        taskheader::IssueMutationResult result;
        if (m_rejectedUpdates.count(issueId) > 0) {
            return result;
        }

        m_updates.push_back(Update{issueId, stateId});
        auto &issue = m_issues.at(issueId);
        for (const auto &state : m_states[issue.team ? issue.team->id : std::string()]) {
            if (state.id == stateId) {
                issue.state = state;
            }
        }
        result.success = true;
        result.issue = issue;
        return result;
    }

    std::vector<taskheader::Issue> getMyIssues(int limit) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<taskheader::Issue> issues;
        for (const auto &id : m_order) {
            if (static_cast<int>(issues.size()) >= limit) {
                break;
            }
            issues.push_back(m_issues.at(id));
        }
        return issues;
    }

    std::vector<taskheader::Issue> getTeamIssues(const std::string &teamId, int limit) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<taskheader::Issue> issues;
        for (const auto &id : m_order) {
            const auto &issue = m_issues.at(id);
            if (static_cast<int>(issues.size()) < limit && issue.team
                && issue.team->id == teamId) {
                issues.push_back(issue);
            }
        }
        return issues;
    }

    std::vector<taskheader::Issue> getProjectIssues(const std::string &projectId,
                                                    int limit) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<taskheader::Issue> issues;
        for (const auto &id : m_order) {
            const auto &issue = m_issues.at(id);
            if (static_cast<int>(issues.size()) < limit && issue.project
                && issue.project->id == projectId) {
                issues.push_back(issue);
            }
        }
        return issues;
    }

    taskheader::IssueMutationResult createIssue(const std::string &teamId,
                                                const std::string &title,
                                                const std::string &description) override
    {
        taskheader::Issue issue;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            issue.id = "created-" + std::to_string(++m_created);
            issue.identifier = "NEW-" + std::to_string(m_created);
            issue.title = title;
            issue.description = description;
            issue.team = taskheader::TeamRef{teamId, "Team", "NEW", ""};
            auto it = m_states.find(teamId);
            if (it != m_states.end() && !it->second.empty()) {
                issue.state = it->second.front();
            }
        }
        addIssue(issue);

        taskheader::IssueMutationResult result;
        result.success = true;
        result.issue = issue;
        return result;
    }

    taskheader::UserRef getViewer() override
    {
        return taskheader::UserRef{"user-1", "Test User", "test@example.com"};
    }

    std::vector<taskheader::TeamRef> getTeams() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<taskheader::TeamRef> teams;
        for (const auto &entry : m_states) {
            teams.push_back(taskheader::TeamRef{entry.first, "Team " + entry.first, "T", ""});
        }
        return teams;
    }

    std::vector<taskheader::ProjectRef> getTeamProjects(const std::string &teamId) override
    {
        taskheader::ProjectRef project;
        project.id = teamId + "-project";
        project.name = "Roadmap";
        project.state = "started";
        project.progress = 0.5;
        return {project};
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, taskheader::Issue> m_issues;
    std::vector<std::string> m_order;
    std::map<std::string, std::vector<taskheader::WorkflowState>> m_states;
    std::set<std::string> m_failingUpdates;
    std::set<std::string> m_rejectedUpdates;
    std::vector<Update> m_updates;
    int m_getIssueCalls = 0;
    int m_created = 0;
};

namespace testdata {

inline taskheader::WorkflowState state(const std::string &id,
                                       const std::string &name,
                                       std::optional<taskheader::StateCategory> type)
{
    taskheader::WorkflowState s;
    s.id = id;
    s.name = name;
    s.type = type;
    return s;
}

// Backlog, Todo, In Progress, Done, Canceled for one team.
inline std::vector<taskheader::WorkflowState> standardStates(const std::string &prefix)
{
    using taskheader::StateCategory;
    return {
        state(prefix + "-backlog", "Backlog", StateCategory::Backlog),
        state(prefix + "-todo", "Todo", StateCategory::Unstarted),
        state(prefix + "-progress", "In Progress", StateCategory::Started),
        state(prefix + "-done", "Done", StateCategory::Completed),
        state(prefix + "-canceled", "Canceled", StateCategory::Canceled),
    };
}

inline taskheader::Issue issue(const std::string &id,
                               const std::string &identifier,
                               const std::string &title,
                               std::optional<taskheader::WorkflowState> state,
                               const std::string &teamId = "team-1")
{
    taskheader::Issue i;
    i.id = id;
    i.identifier = identifier;
    i.title = title;
    i.state = std::move(state);
    if (!teamId.empty()) {
        i.team = taskheader::TeamRef{teamId, "Core", "ENG", ""};
    }
    return i;
}

} // namespace testdata
