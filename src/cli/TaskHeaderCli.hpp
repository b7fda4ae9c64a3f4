#pragma once

#include <memory>
#include <string>

#include <QString>
#include <QStringList>

#include "common/app_config.hpp"
#include "linear/issue_repository.hpp"

namespace taskheader {

class LinearClient;

class TaskHeaderCli
{
public:
    TaskHeaderCli();
    // Uses the given repository instead of building a LinearClient from the
    // configured API key. Not owned.
    explicit TaskHeaderCli(IssueRepository *repository);
    ~TaskHeaderCli();

    // returns exit code
    int run(int argc, char *argv[]);

private:
    int dispatch(const QString &command, const QStringList &args);

    int runGenerate(const QStringList &args);
    int runSync(const QStringList &args);
    int runWatch(const QStringList &args);
    int runCreate(const QStringList &args);
    int runTeams(const QStringList &args);
    int runProjects(const QStringList &args);
    int runCurrent(const QStringList &args);

    void loadConfiguration(const QStringList &args);
    IssueRepository &requireRepository();
    int fetchLimit(const QStringList &args) const;

    AppConfig m_config;
    std::string m_configPath;
    IssueRepository *m_repository = nullptr;
    std::unique_ptr<LinearClient> m_ownedClient;
};

} // namespace taskheader
