#pragma once

#include <QString>
#include <optional>

#include "error.h"
#include "models.h"

class IssueSource;

// The issue commands, independent of argument parsing and output format.
class IssueService
{
public:
    static constexpr int kDefaultLimit = 50;
    static constexpr int kDefaultCommentLimit = 20;

    IssueService(IssueSource* source, const QString& server);

    std::optional<IssueListView> mine(int limit, const QString& status, JiraError* error = nullptr);
    std::optional<IssueListView> search(const QString& jql, int limit, JiraError* error = nullptr);
    std::optional<IssueDetailView> view(const QString& issueKey, int commentLimit, JiraError* error = nullptr);
    std::optional<TransitionResult> transition(const QString& issueKey, const QString& status,
                                               JiraError* error = nullptr);
    // Empty email assigns the issue to its reporter.
    std::optional<AssignResult> assign(const QString& issueKey, const QString& email, JiraError* error = nullptr);
    std::optional<CommentResult> comment(const QString& issueKey, const QString& body, JiraError* error = nullptr);

    static QString myIssuesJql(const QString& status);
    static QString normalizeKey(const QString& issueKey);

private:
    std::optional<IssueListView> runSearch(const QString& jql, int limit, JiraError* error);

    IssueSource* m_source;
    QString m_server;
};
