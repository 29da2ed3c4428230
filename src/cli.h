#pragma once

#include <QJsonObject>
#include <QStringList>
#include <QTextStream>

#include <functional>
#include <memory>

#include "config.h"
#include "models.h"

class IssueSource;

// Command dispatch for the jiractl binary. Output goes to the given streams so
// the whole command surface can run against an in-memory IssueSource.
class Cli
{
public:
    using SourceFactory = std::function<std::unique_ptr<IssueSource>(const JiraConfig&)>;

    Cli(AppContext ctx, SourceFactory makeSource, QTextStream& out, QTextStream& err);

    // args excludes the program name. Returns the process exit code.
    int run(QStringList args);

    static QString version();

private:
    int fail(const JiraError& error);

    int runAuth(const QStringList& args);
    int runAuthLogin(const QStringList& args);
    int runAuthStatus(const QStringList& args);
    int runAuthLogout(const QStringList& args);

    int runIssues(const QStringList& args);
    int runIssuesList(const QString& command, const QStringList& args);
    int runIssuesView(const QStringList& args);
    int runIssuesTransition(const QStringList& args);
    int runIssuesAssign(const QStringList& args);
    int runIssuesComment(const QStringList& args);

    void printRootHelp();
    void printAuthHelp();
    void printIssuesHelp();

    void printJson(const QJsonObject& obj);
    void printIssueList(const IssueListView& list, const QString& heading, const QString& emptyText);

    AppContext m_ctx;
    SourceFactory m_makeSource;
    QTextStream& m_out;
    QTextStream& m_err;
};
