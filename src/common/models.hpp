#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace taskheader {

struct UserRef {
    std::string id;
    std::string name;
    std::string email;
};

struct TeamRef {
    std::string id;
    std::string name;
    std::string key;
    std::string description;
};

struct ProjectRef {
    std::string id;
    std::string name;
    std::string description;
    std::string state;
    double progress = 0.0;
};

struct WorkflowState {
    std::string id;
    std::string name;
    // Empty when the remote reported a category this build does not know.
    std::optional<StateCategory> type;
    std::string color;
    double position = 0.0;
};

// Read-only snapshot of a remote issue. The id is the join key for every
// sync operation; the identifier is for display only.
struct Issue {
    std::string id;
    std::string identifier;
    std::string title;
    std::string description;
    int priority = 0;

    std::optional<UserRef> assignee;
    std::optional<TeamRef> team;
    std::optional<ProjectRef> project;
    std::optional<WorkflowState> state;

    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
};

struct IssueMutationResult {
    bool success = false;
    std::optional<Issue> issue;
};

// Desired completion for one issue, as read from a checkbox.
struct SyncIntent {
    std::string issueId;
    bool completed = false;
};

} // namespace taskheader
