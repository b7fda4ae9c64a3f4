#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace taskheader {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Accepts both "2024-05-01T10:00:00Z" and Linear's "2024-05-01T10:00:00.123Z".
// Fractional seconds are dropped.
inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toCategoryString(StateCategory category)
{
    switch (category) {
    case StateCategory::Backlog:
        return "backlog";
    case StateCategory::Unstarted:
        return "unstarted";
    case StateCategory::Started:
        return "started";
    case StateCategory::Completed:
        return "completed";
    case StateCategory::Canceled:
        return "canceled";
    }
    return "unstarted";
}

inline std::optional<StateCategory> parseCategoryString(const std::string &value)
{
    if (value == "backlog") {
        return StateCategory::Backlog;
    }
    if (value == "unstarted") {
        return StateCategory::Unstarted;
    }
    if (value == "started") {
        return StateCategory::Started;
    }
    if (value == "completed") {
        return StateCategory::Completed;
    }
    if (value == "canceled") {
        return StateCategory::Canceled;
    }
    return std::nullopt;
}

namespace detail {

inline std::string stringField(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

inline bool hasObject(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    return it != j.end() && it->is_object();
}

} // namespace detail

inline void to_json(nlohmann::json &j, const UserRef &user)
{
    j = nlohmann::json{{"id", user.id}, {"name", user.name}, {"email", user.email}};
}

inline void from_json(const nlohmann::json &j, UserRef &user)
{
    user.id = detail::stringField(j, "id");
    user.name = detail::stringField(j, "name");
    user.email = detail::stringField(j, "email");
}

inline void to_json(nlohmann::json &j, const TeamRef &team)
{
    j = nlohmann::json{
        {"id", team.id},
        {"name", team.name},
        {"key", team.key},
        {"description", team.description}
    };
}

inline void from_json(const nlohmann::json &j, TeamRef &team)
{
    team.id = detail::stringField(j, "id");
    team.name = detail::stringField(j, "name");
    team.key = detail::stringField(j, "key");
    team.description = detail::stringField(j, "description");
}

inline void to_json(nlohmann::json &j, const ProjectRef &project)
{
    j = nlohmann::json{
        {"id", project.id},
        {"name", project.name},
        {"description", project.description},
        {"state", project.state},
        {"progress", project.progress}
    };
}

inline void from_json(const nlohmann::json &j, ProjectRef &project)
{
    project.id = detail::stringField(j, "id");
    project.name = detail::stringField(j, "name");
    project.description = detail::stringField(j, "description");
    project.state = detail::stringField(j, "state");
    if (j.contains("progress") && j.at("progress").is_number()) {
        project.progress = j.at("progress").get<double>();
    } else {
        project.progress = 0.0;
    }
}

inline void to_json(nlohmann::json &j, const WorkflowState &state)
{
    j = nlohmann::json{
        {"id", state.id},
        {"name", state.name},
        {"color", state.color},
        {"position", state.position}
    };
    if (state.type.has_value()) {
        j["type"] = toCategoryString(*state.type);
    } else {
        j["type"] = nullptr;
    }
}

inline void from_json(const nlohmann::json &j, WorkflowState &state)
{
    state.id = detail::stringField(j, "id");
    state.name = detail::stringField(j, "name");
    state.type = parseCategoryString(detail::stringField(j, "type"));
    state.color = detail::stringField(j, "color");
    if (j.contains("position") && j.at("position").is_number()) {
        state.position = j.at("position").get<double>();
    } else {
        state.position = 0.0;
    }
}

inline void to_json(nlohmann::json &j, const Issue &issue)
{
    j = nlohmann::json{
        {"id", issue.id},
        {"identifier", issue.identifier},
        {"title", issue.title},
        {"description", issue.description},
        {"priority", issue.priority},
        {"createdAt", toIso8601Utc(issue.createdAt)},
        {"updatedAt", toIso8601Utc(issue.updatedAt)}
    };
    j["assignee"] = issue.assignee ? nlohmann::json(*issue.assignee) : nlohmann::json();
    j["team"] = issue.team ? nlohmann::json(*issue.team) : nlohmann::json();
    j["project"] = issue.project ? nlohmann::json(*issue.project) : nlohmann::json();
    j["state"] = issue.state ? nlohmann::json(*issue.state) : nlohmann::json();
}

// GraphQL returns null for unset relations; those become empty optionals.
inline void from_json(const nlohmann::json &j, Issue &issue)
{
    issue.id = detail::stringField(j, "id");
    issue.identifier = detail::stringField(j, "identifier");
    issue.title = detail::stringField(j, "title");
    issue.description = detail::stringField(j, "description");
    if (j.contains("priority") && j.at("priority").is_number()) {
        issue.priority = static_cast<int>(j.at("priority").get<double>());
    } else {
        issue.priority = 0;
    }

    if (detail::hasObject(j, "assignee")) {
        issue.assignee = j.at("assignee").get<UserRef>();
    } else {
        issue.assignee.reset();
    }
    if (detail::hasObject(j, "team")) {
        issue.team = j.at("team").get<TeamRef>();
    } else {
        issue.team.reset();
    }
    if (detail::hasObject(j, "project")) {
        issue.project = j.at("project").get<ProjectRef>();
    } else {
        issue.project.reset();
    }
    if (detail::hasObject(j, "state")) {
        issue.state = j.at("state").get<WorkflowState>();
    } else {
        issue.state.reset();
    }

    issue.createdAt = fromIso8601Utc(detail::stringField(j, "createdAt"));
    issue.updatedAt = fromIso8601Utc(detail::stringField(j, "updatedAt"));
}

inline void from_json(const nlohmann::json &j, IssueMutationResult &result)
{
    result.success = j.contains("success") && j.at("success").is_boolean()
        && j.at("success").get<bool>();
    if (detail::hasObject(j, "issue")) {
        result.issue = j.at("issue").get<Issue>();
    } else {
        result.issue.reset();
    }
}

inline void to_json(nlohmann::json &j, const SyncIntent &intent)
{
    j = nlohmann::json{{"id", intent.issueId}, {"completed", intent.completed}};
}

} // namespace taskheader
