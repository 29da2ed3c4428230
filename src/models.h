#pragma once

#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

struct JiraUser
{
    QString accountId;
    QString emailAddress;
    QString displayName;
    bool active{false};
};

struct JiraIssueFields
{
    QString summary;
    QJsonValue description; // ADF document, plain string or null
    QString status;
    QString issueType;
    QString priority;
    std::optional<JiraUser> assignee;
    std::optional<JiraUser> reporter;
    QString created;
    QString updated;
    QStringList labels;
    QStringList components;
};

struct JiraIssue
{
    QString key;
    QString self;
    JiraIssueFields fields;
};

struct JiraComment
{
    QString id;
    std::optional<JiraUser> author;
    QJsonValue body;
    QString created;
    QString updated;
};

struct JiraTransition
{
    QString id;
    QString name;
    QString targetStatusName;
};

// One page of /search/jql.
struct SearchPage
{
    QList<JiraIssue> issues;
    int total{0};
    QString nextPageToken;
};

// Accumulated result of a paginated search, trimmed to the requested limit.
struct PageResult
{
    QList<JiraIssue> issues;
    int total{0};
    bool hasMore{false};
};

// Compact views

struct IssueView
{
    QString key;
    QString summary;
    QString status;
    QString type;
    QString priority;
    QString assignee;
    QString created;
    QString updated;
    QString url;
};

struct IssueListView
{
    QString server;
    int count{0};
    int total{0};
    bool hasMore{false};
    QList<IssueView> issues;
};

struct CommentView
{
    QString author;
    QString body;
    QString created;
};

struct IssueDetailView
{
    IssueView issue;
    QString description;
    QList<CommentView> comments;
};

struct TransitionResult
{
    QString key;
    QString status;
    QString matchedBy;
    QString warning;
    QString url;
};

struct AssignResult
{
    QString key;
    QString assignee;
    QString assigneeName;
    QString url;
};

struct CommentResult
{
    QString key;
    QString comment;
    QString url;
};
