#include "linear/linear_client.hpp"

#include <memory>
#include <utility>

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace taskheader {

namespace {

constexpr int kMaxErrorBodyChars = 512;

const char *const kIssueFields = R"(
    id
    identifier
    title
    description
    priority
    state { id name type }
    assignee { id name }
    team { id name key }
    project { id name }
    createdAt
    updatedAt
)";

const char *const kViewerQuery = R"(
query {
    viewer { id name email }
})";

const char *const kTeamsQuery = R"(
query {
    teams { nodes { id name key description } }
})";

const char *const kTeamProjectsQuery = R"(
query ($teamId: String!) {
    team(id: $teamId) {
        projects { nodes { id name description state progress } }
    }
})";

const char *const kWorkflowStatesQuery = R"(
query ($teamId: String!) {
    team(id: $teamId) {
        states { nodes { id name type color position } }
    }
})";

const char *const kUpdateIssueStateMutation = R"(
mutation ($issueId: String!, $stateId: String!) {
    issueUpdate(id: $issueId, input: { stateId: $stateId }) {
        success
        issue { id identifier title state { id name type } }
    }
})";

const char *const kCreateIssueMutation = R"(
mutation ($teamId: String!, $title: String!, $description: String) {
    issueCreate(input: { teamId: $teamId, title: $title, description: $description }) {
        success
        issue { id identifier title description state { id name type } }
    }
})";

std::string issueQuery()
{
    return std::string("query ($issueId: String!) {\n    issue(id: $issueId) {")
        + kIssueFields + "    }\n}";
}

std::string myIssuesQuery()
{
    return std::string(
               "query ($first: Int!) {\n"
               "    viewer {\n"
               "        assignedIssues(first: $first, orderBy: updatedAt) {\n"
               "            nodes {")
        + kIssueFields + "            }\n        }\n    }\n}";
}

std::string teamIssuesQuery()
{
    return std::string(
               "query ($teamId: String!, $first: Int!) {\n"
               "    team(id: $teamId) {\n"
               "        issues(first: $first, orderBy: updatedAt) {\n"
               "            nodes {")
        + kIssueFields + "            }\n        }\n    }\n}";
}

std::string projectIssuesQuery()
{
    return std::string(
               "query ($projectId: String!, $first: Int!) {\n"
               "    project(id: $projectId) {\n"
               "        issues(first: $first, orderBy: updatedAt) {\n"
               "            nodes {")
        + kIssueFields + "            }\n        }\n    }\n}";
}

// Walks nested objects; a missing or null step yields null.
const nlohmann::json &walk(const nlohmann::json &root,
                           std::initializer_list<const char *> path)
{
    static const nlohmann::json kNull;
    const nlohmann::json *current = &root;
    for (const char *key : path) {
        if (!current->is_object()) {
            return kNull;
        }
        auto it = current->find(key);
        if (it == current->end()) {
            return kNull;
        }
        current = &*it;
    }
    return *current;
}

template <typename T>
std::vector<T> nodesAt(const nlohmann::json &data,
                       std::initializer_list<const char *> path)
{
    std::vector<T> items;
    const nlohmann::json &nodes = walk(data, path);
    if (!nodes.is_array()) {
        return items;
    }
    items.reserve(nodes.size());
    for (const auto &node : nodes) {
        if (node.is_object()) {
            items.push_back(node.get<T>());
        }
    }
    return items;
}

std::string truncated(const QByteArray &body)
{
    if (body.size() <= kMaxErrorBodyChars) {
        return body.toStdString();
    }
    return body.left(kMaxErrorBodyChars).toStdString() + "...";
}

} // namespace

LinearClient::LinearClient(std::string apiKey, QString endpoint, int timeoutMs)
    : m_apiKey(std::move(apiKey))
    , m_endpoint(std::move(endpoint))
    , m_timeoutMs(timeoutMs)
{
}

LinearClient::~LinearClient() = default;

QByteArray LinearClient::buildRequestBody(const std::string &query,
                                          const nlohmann::json &variables)
{
    nlohmann::json payload = {{"query", query}};
    if (variables.is_object() && !variables.empty()) {
        payload["variables"] = variables;
    }
    return QByteArray::fromStdString(payload.dump());
}

nlohmann::json LinearClient::decodeResponse(int httpStatus, const QByteArray &body)
{
    if (httpStatus != 200) {
        throw RemoteCallError("Linear API request failed: "
                                  + std::to_string(httpStatus) + " - " + truncated(body),
                              httpStatus);
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(body.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        throw RemoteCallError("Linear API returned invalid JSON", httpStatus);
    }

    if (!root.is_object()) {
        throw RemoteCallError("Linear API returned a non-object response", httpStatus);
    }

    auto errors = root.find("errors");
    if (errors != root.end() && !errors->is_null()) {
        throw RemoteCallError("Linear API error: " + errors->dump(), httpStatus);
    }

    auto data = root.find("data");
    if (data == root.end() || !data->is_object()) {
        return nlohmann::json::object();
    }
    return *data;
}

nlohmann::json LinearClient::executeQuery(const char *operation,
                                          const std::string &query,
                                          const nlohmann::json &variables)
{
    QNetworkAccessManager manager;
    QNetworkRequest request{QUrl(m_endpoint)};
    request.setHeader(QNetworkRequest::ContentTypeHeader,
                      QStringLiteral("application/json"));
    request.setRawHeader("Authorization", QByteArray::fromStdString(m_apiKey));

    THLOG_DEBUG(QStringLiteral("LinearClient"),
                QStringLiteral("executeQuery"),
                QStringLiteral("graphql_request"),
                QStringLiteral("remote_call"),
                QStringLiteral("https_post"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"operation", operation},
                               {"endpoint", m_endpoint.toStdString()}});

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&loop, &timedOut]() {
        timedOut = true;
        loop.quit();
    });

    std::unique_ptr<QNetworkReply> reply(
        manager.post(request, buildRequestBody(query, variables)));
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    timer.start(m_timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }
    timer.stop();

    if (timedOut) {
        reply->abort();
        THLOG_WARN(QStringLiteral("LinearClient"),
                   QStringLiteral("executeQuery"),
                   QStringLiteral("graphql_timeout"),
                   QStringLiteral("remote_call"),
                   QStringLiteral("https_post"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"operation", operation},
                                  {"timeoutMs", m_timeoutMs}});
        throw RemoteCallError("Linear API request timed out after "
                              + std::to_string(m_timeoutMs) + " ms");
    }

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const QByteArray body = reply->readAll();
    if (!status.isValid()) {
        throw RemoteCallError("Linear API request failed: "
                              + reply->errorString().toStdString());
    }

    return decodeResponse(status.toInt(), body);
}

Issue LinearClient::getIssue(const std::string &issueId)
{
    const nlohmann::json data =
        executeQuery("issue", issueQuery(), nlohmann::json{{"issueId", issueId}});
    const nlohmann::json &node = walk(data, {"issue"});
    if (!node.is_object()) {
        throw RemoteCallError("Linear API returned no issue for id " + issueId);
    }
    return node.get<Issue>();
}

std::vector<WorkflowState> LinearClient::getWorkflowStates(const std::string &teamId)
{
    const nlohmann::json data = executeQuery(
        "workflowStates", kWorkflowStatesQuery, nlohmann::json{{"teamId", teamId}});
    return nodesAt<WorkflowState>(data, {"team", "states", "nodes"});
}

IssueMutationResult LinearClient::updateIssueState(const std::string &issueId,
                                                   const std::string &stateId)
{
    const nlohmann::json data = executeQuery(
        "issueUpdate", kUpdateIssueStateMutation,
        nlohmann::json{{"issueId", issueId}, {"stateId", stateId}});
    const nlohmann::json &result = walk(data, {"issueUpdate"});
    if (!result.is_object()) {
        return IssueMutationResult{};
    }
    return result.get<IssueMutationResult>();
}

std::vector<Issue> LinearClient::getMyIssues(int limit)
{
    const nlohmann::json data =
        executeQuery("assignedIssues", myIssuesQuery(), nlohmann::json{{"first", limit}});
    return nodesAt<Issue>(data, {"viewer", "assignedIssues", "nodes"});
}

std::vector<Issue> LinearClient::getTeamIssues(const std::string &teamId, int limit)
{
    const nlohmann::json data = executeQuery(
        "teamIssues", teamIssuesQuery(),
        nlohmann::json{{"teamId", teamId}, {"first", limit}});
    return nodesAt<Issue>(data, {"team", "issues", "nodes"});
}

std::vector<Issue> LinearClient::getProjectIssues(const std::string &projectId, int limit)
{
    const nlohmann::json data = executeQuery(
        "projectIssues", projectIssuesQuery(),
        nlohmann::json{{"projectId", projectId}, {"first", limit}});
    return nodesAt<Issue>(data, {"project", "issues", "nodes"});
}

IssueMutationResult LinearClient::createIssue(const std::string &teamId,
                                              const std::string &title,
                                              const std::string &description)
{
    const nlohmann::json data = executeQuery(
        "issueCreate", kCreateIssueMutation,
        nlohmann::json{{"teamId", teamId},
                       {"title", title},
                       {"description", description}});
    const nlohmann::json &result = walk(data, {"issueCreate"});
    if (!result.is_object()) {
        return IssueMutationResult{};
    }
    return result.get<IssueMutationResult>();
}

UserRef LinearClient::getViewer()
{
    const nlohmann::json data = executeQuery("viewer", kViewerQuery);
    const nlohmann::json &viewer = walk(data, {"viewer"});
    if (!viewer.is_object()) {
        return UserRef{};
    }
    return viewer.get<UserRef>();
}

std::vector<TeamRef> LinearClient::getTeams()
{
    const nlohmann::json data = executeQuery("teams", kTeamsQuery);
    return nodesAt<TeamRef>(data, {"teams", "nodes"});
}

std::vector<ProjectRef> LinearClient::getTeamProjects(const std::string &teamId)
{
    const nlohmann::json data = executeQuery(
        "teamProjects", kTeamProjectsQuery, nlohmann::json{{"teamId", teamId}});
    return nodesAt<ProjectRef>(data, {"team", "projects", "nodes"});
}

} // namespace taskheader
