#pragma once

#include <QList>
#include <QString>
#include <optional>

#include "models.h"

class ViewProjector
{
public:
    static IssueView issueToView(const JiraIssue& issue, const QString& server);
    static QList<IssueView> issuesToViews(const QList<JiraIssue>& issues, const QString& server);
    static IssueListView listView(const PageResult& result, const QString& server);
    static CommentView commentToView(const JiraComment& comment);
    static IssueDetailView issueToDetailView(const JiraIssue& issue, const QString& server,
                                             const QList<JiraComment>& comments);

    static QString browseUrl(const QString& server, const QString& issueKey);

    // Email first, display name as fallback.
    static QString userEmail(const std::optional<JiraUser>& user);
    // Display name first, email as fallback.
    static QString userDisplayName(const std::optional<JiraUser>& user);

    // Jira timestamps ("2024-03-05T14:07:09.123+0000") to "yyyy-MM-dd". Never
    // fails: unparsable input degrades to its first 10 characters, or is
    // returned as-is when shorter.
    static QString formatDate(const QString& timestamp);
};
