#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "linear/issue_repository.hpp"

namespace taskheader {

// First state of the given category in remote list order. When a team has
// several states of one category the remote's ordering decides.
std::optional<WorkflowState> firstStateOfCategory(const std::vector<WorkflowState> &states,
                                                  StateCategory category);

/**
 * Reconciler applies checkbox intents to the remote tracker.
 *
 * For each intent it fetches the issue's current state and, when the
 * checkbox disagrees with it, moves the issue to the team's first Completed
 * state (checked) or first Unstarted state (unchecked). Nothing is cached
 * between calls: every reconcile() reads fresh remote state.
 */
class Reconciler {
public:
    explicit Reconciler(IssueRepository *repository);

    // Returns the number of issues the remote confirmed as transitioned.
    // Throws ConfigurationError when no repository is attached; failures of a
    // single issue are logged and skipped.
    int reconcile(const std::vector<SyncIntent> &intents);

private:
    enum class Outcome {
        InSync,
        Transitioned,
        Skipped
    };

    Outcome reconcileIssue(const SyncIntent &intent);

    IssueRepository *m_repository;
};

} // namespace taskheader
