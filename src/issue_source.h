#pragma once

#include <QList>
#include <QString>
#include <optional>

#include "error.h"
#include "models.h"

// Everything the commands need from the Jira server. JiraClient talks HTTP;
// tests substitute an in-memory source. Failures are reported through *error.
class IssueSource
{
public:
    virtual ~IssueSource() = default;

    virtual std::optional<JiraUser> myself(JiraError* error) = 0;

    virtual std::optional<SearchPage> fetchPage(const QString& jql, int maxResults, const QString& nextPageToken,
                                                JiraError* error) = 0;
    virtual std::optional<JiraIssue> fetchIssue(const QString& issueKey, JiraError* error) = 0;
    // Newest first.
    virtual std::optional<QList<JiraComment>> fetchComments(const QString& issueKey, int limit, JiraError* error) = 0;
    virtual std::optional<QList<JiraTransition>> fetchTransitions(const QString& issueKey, JiraError* error) = 0;
    virtual std::optional<QList<JiraUser>> searchUsers(const QString& query, JiraError* error) = 0;

    virtual bool applyTransition(const QString& issueKey, const QString& transitionId, JiraError* error) = 0;
    virtual bool assignIssue(const QString& issueKey, const QString& accountId, JiraError* error) = 0;
    virtual bool addComment(const QString& issueKey, const QString& plainText, JiraError* error) = 0;
};
