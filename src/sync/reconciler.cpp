#include "sync/reconciler.hpp"

#include <exception>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace taskheader {

std::optional<WorkflowState> firstStateOfCategory(const std::vector<WorkflowState> &states,
                                                  StateCategory category)
{
    for (const auto &state : states) {
        if (state.type.has_value() && *state.type == category) {
            return state;
        }
    }
    return std::nullopt;
}

Reconciler::Reconciler(IssueRepository *repository)
    : m_repository(repository)
{
}

int Reconciler::reconcile(const std::vector<SyncIntent> &intents)
{
    if (!m_repository) {
        throw ConfigurationError("Linear client not configured");
    }

    int changed = 0;
    int skipped = 0;
    for (const auto &intent : intents) {
        try {
            switch (reconcileIssue(intent)) {
            case Outcome::Transitioned:
                ++changed;
                break;
            case Outcome::Skipped:
                ++skipped;
                break;
            case Outcome::InSync:
                break;
            }
        } catch (const std::exception &ex) {
            ++skipped;
            THLOG_WARN(QStringLiteral("Reconciler"),
                       QStringLiteral("reconcile"),
                       QStringLiteral("issue_sync_failed"),
                       QStringLiteral("remote_call_failed"),
                       QStringLiteral("skip_issue"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"issueId", intent.issueId},
                                      {"error", ex.what()}});
        }
    }

    THLOG_INFO(QStringLiteral("Reconciler"),
               QStringLiteral("reconcile"),
               QStringLiteral("reconcile_finished"),
               QStringLiteral("markdown_edit"),
               QStringLiteral("graphql"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"intents", intents.size()},
                              {"changed", changed},
                              {"skipped", skipped}});
    return changed;
}

Reconciler::Outcome Reconciler::reconcileIssue(const SyncIntent &intent)
{
    const Issue issue = m_repository->getIssue(intent.issueId);
    const bool isCompleted = issue.state.has_value() && isClosedCategory(issue.state->type);

    if (intent.completed == isCompleted) {
        return Outcome::InSync;
    }

    if (!issue.team.has_value() || issue.team->id.empty()) {
        THLOG_WARN(QStringLiteral("Reconciler"),
                   QStringLiteral("reconcileIssue"),
                   QStringLiteral("missing_team"),
                   QStringLiteral("issue_has_no_team_reference"),
                   QStringLiteral("skip_issue"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"issueId", intent.issueId},
                                  {"identifier", issue.identifier}});
        return Outcome::Skipped;
    }

    // Checked boxes close into Completed, never Canceled; unchecked boxes
    // reopen into Unstarted.
    const StateCategory target = intent.completed
        ? StateCategory::Completed
        : StateCategory::Unstarted;
    const auto states = m_repository->getWorkflowStates(issue.team->id);
    const auto targetState = firstStateOfCategory(states, target);
    if (!targetState.has_value()) {
        THLOG_INFO(QStringLiteral("Reconciler"),
                   QStringLiteral("reconcileIssue"),
                   QStringLiteral("no_target_state"),
                   QStringLiteral("team_workflow_lacks_category"),
                   QStringLiteral("skip_issue"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"issueId", intent.issueId},
                                  {"teamId", issue.team->id},
                                  {"category", toCategoryString(target)}});
        return Outcome::Skipped;
    }

    const IssueMutationResult result =
        m_repository->updateIssueState(intent.issueId, targetState->id);
    if (!result.success) {
        throw RemoteCallError("issueUpdate rejected for " + intent.issueId);
    }

    THLOG_INFO(QStringLiteral("Reconciler"),
               QStringLiteral("reconcileIssue"),
               QStringLiteral("issue_transitioned"),
               QStringLiteral("checkbox_changed"),
               QStringLiteral("issue_update"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"issueId", intent.issueId},
                              {"identifier", issue.identifier},
                              {"stateId", targetState->id},
                              {"stateName", targetState->name}});
    return Outcome::Transitioned;
}

} // namespace taskheader
