#pragma once

#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QJsonDocument>
#include <QJsonObject>

#include "issue_source.h"

// Jira Cloud REST v3 over QtNetwork. Every call blocks on a local event loop
// until the reply finishes or the transfer timeout fires.
class JiraClient : public QObject, public IssueSource
{
    Q_OBJECT
public:
    static constexpr int kTimeoutMs = 30000;

    explicit JiraClient(QObject* parent = nullptr);

    void configure(const QString& server, const QString& email, const QString& apiToken);

    std::optional<JiraUser> myself(JiraError* error) override;

    std::optional<SearchPage> fetchPage(const QString& jql, int maxResults, const QString& nextPageToken,
                                        JiraError* error) override;
    std::optional<JiraIssue> fetchIssue(const QString& issueKey, JiraError* error) override;
    std::optional<QList<JiraComment>> fetchComments(const QString& issueKey, int limit, JiraError* error) override;
    std::optional<QList<JiraTransition>> fetchTransitions(const QString& issueKey, JiraError* error) override;
    std::optional<QList<JiraUser>> searchUsers(const QString& query, JiraError* error) override;

    bool applyTransition(const QString& issueKey, const QString& transitionId, JiraError* error) override;
    bool assignIssue(const QString& issueKey, const QString& accountId, JiraError* error) override;
    bool addComment(const QString& issueKey, const QString& plainText, JiraError* error) override;

private:
    QNetworkRequest makeRequest(const QUrl& url) const;
    QByteArray authHeader() const;
    bool isAuthError(const QNetworkReply* reply, QNetworkReply::NetworkError err) const;

    // Waits for reply, takes ownership and maps failures onto *error.
    // expectedStatus == 0 accepts any 2xx.
    std::optional<QByteArray> finish(QNetworkReply* reply, const QString& context, int expectedStatus,
                                     JiraError* error);
    std::optional<QJsonDocument> getJson(const QUrl& url, const QString& context, JiraError* error);

    QString m_server;
    QString m_email;
    QString m_apiToken;

    QString m_basePlatform;

    QNetworkAccessManager m_net;
};
