#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "models.h"

class JiraJson
{
public:
    // Decoding. Missing or mistyped fields become empty values.
    static JiraUser userFromJson(const QJsonObject& o);
    static JiraIssue issueFromJson(const QJsonObject& o);
    static JiraComment commentFromJson(const QJsonObject& o);
    static JiraTransition transitionFromJson(const QJsonObject& o);
    static SearchPage searchPageFromJson(const QJsonObject& root);
    static QList<JiraComment> commentsFromJson(const QJsonObject& root);
    static QList<JiraTransition> transitionsFromJson(const QJsonObject& root);

    // Output shapes.
    static QJsonObject toJson(const IssueView& v);
    static QJsonObject toJson(const IssueListView& v);
    static QJsonObject toJson(const IssueDetailView& v);
    static QJsonObject toJson(const CommentView& v);
    static QJsonObject toJson(const TransitionResult& v);
    static QJsonObject toJson(const AssignResult& v);
    static QJsonObject toJson(const CommentResult& v);

    // Request bodies.
    static QJsonObject transitionRequest(const QString& transitionId);
    static QJsonObject assignRequest(const QString& accountId);
    static QJsonObject commentRequest(const QString& plainText);

    // "jira api error (<statusLine>): ..." built from a Jira error body
    // {errorMessages:[...], errors:{...}}, falling back to the raw body text.
    static QString apiErrorMessage(const QString& statusLine, const QByteArray& body);
};
