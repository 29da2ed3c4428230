#include "jira_client.h"

#include "config.h"
#include "jira_json.h"
#include "logging.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonParseError>
#include <QUrlQuery>

static const QString kSearchFields =
    QStringLiteral("summary,status,issuetype,priority,assignee,reporter,created,updated,labels,components");
static const QString kIssueFields =
    QStringLiteral("summary,description,status,issuetype,priority,assignee,reporter,created,updated,labels,components");

static QString enc(const QString& s)
{
    return QString::fromUtf8(QUrl::toPercentEncoding(s));
}

JiraClient::JiraClient(QObject* parent)
    : QObject(parent)
{
}

void JiraClient::configure(const QString& server, const QString& email, const QString& apiToken)
{
    m_server = ConfigService::trimTrailingSlash(server);
    m_email = email;
    m_apiToken = apiToken;
    m_basePlatform = m_server + "/rest/api/3";
}

QByteArray JiraClient::authHeader() const
{
    const QByteArray userPass = (m_email + ":" + m_apiToken).toUtf8();
    return "Basic " + userPass.toBase64();
}

QNetworkRequest JiraClient::makeRequest(const QUrl& url) const
{
    QNetworkRequest req(url);
    req.setRawHeader("Authorization", authHeader());
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setRawHeader("Accept", "application/json");
    req.setTransferTimeout(kTimeoutMs);
    return req;
}

bool JiraClient::isAuthError(const QNetworkReply* reply, QNetworkReply::NetworkError err) const
{
    if (!reply) return false;
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    return err == QNetworkReply::AuthenticationRequiredError
        || err == QNetworkReply::ContentAccessDenied
        || status == 401
        || status == 403;
}

std::optional<QByteArray> JiraClient::finish(QNetworkReply* reply, const QString& context, int expectedStatus,
                                             JiraError* error)
{
    if (!reply->isFinished())
    {
        QEventLoop loop;
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const auto data = reply->readAll();
    const auto err = reply->error();
    const auto errStr = reply->errorString();
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const auto reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
    const bool authError = isAuthError(reply, err);
    reply->deleteLater();

    qCDebug(lcHttp) << context << "->" << status << reason << data.size() << "bytes";

    const auto statusLine = reason.isEmpty() ? QString::number(status) : QStringLiteral("%1 %2").arg(status).arg(reason);

    if (authError)
    {
        ErrorService::fail(error, JiraError::Kind::Auth, context,
                           QStringLiteral("%1; run: jiractl auth login --server URL --email EMAIL")
                               .arg(JiraJson::apiErrorMessage(statusLine, data)));
        return std::nullopt;
    }

    if (status == 0)
    {
        const auto message = err == QNetworkReply::OperationCanceledError
            ? QStringLiteral("request timed out after %1s").arg(kTimeoutMs / 1000)
            : errStr;
        ErrorService::fail(error, JiraError::Kind::Transport, context,
                           QStringLiteral("jira api request failed: %1").arg(message));
        return std::nullopt;
    }

    const bool ok = expectedStatus == 0 ? (status >= 200 && status < 300) : status == expectedStatus;
    if (!ok)
    {
        const auto kind = status == 404 ? JiraError::Kind::NotFound : JiraError::Kind::Transport;
        ErrorService::fail(error, kind, context, JiraJson::apiErrorMessage(statusLine, data));
        return std::nullopt;
    }

    return data;
}

std::optional<QJsonDocument> JiraClient::getJson(const QUrl& url, const QString& context, JiraError* error)
{
    qCDebug(lcHttp) << "GET" << url.toString(QUrl::RemoveQuery);
    const auto data = finish(m_net.get(makeRequest(url)), context, 0, error);
    if (!data.has_value())
        return std::nullopt;

    QJsonParseError parseError;
    const auto doc = QJsonDocument::fromJson(*data, &parseError);
    if (parseError.error != QJsonParseError::NoError)
    {
        ErrorService::fail(error, JiraError::Kind::Decode, context,
                           QStringLiteral("failed to parse %1 response: %2").arg(context, parseError.errorString()));
        return std::nullopt;
    }
    return doc;
}

std::optional<JiraUser> JiraClient::myself(JiraError* error)
{
    const auto doc = getJson(QUrl(m_basePlatform + "/myself"), "Myself", error);
    if (!doc.has_value())
        return std::nullopt;
    if (!doc->isObject())
    {
        ErrorService::fail(error, JiraError::Kind::Decode, "Myself", "Unexpected JSON (expected object)");
        return std::nullopt;
    }
    return JiraJson::userFromJson(doc->object());
}

std::optional<SearchPage> JiraClient::fetchPage(const QString& jql, int maxResults, const QString& nextPageToken,
                                                JiraError* error)
{
    QUrl url(m_basePlatform + "/search/jql");
    QUrlQuery q;
    q.addQueryItem("jql", jql);
    q.addQueryItem("maxResults", QString::number(maxResults));
    q.addQueryItem("fields", kSearchFields);
    if (!nextPageToken.isEmpty())
        q.addQueryItem("nextPageToken", nextPageToken);
    url.setQuery(q);

    const auto doc = getJson(url, "SearchIssues", error);
    if (!doc.has_value())
        return std::nullopt;
    if (!doc->isObject())
    {
        ErrorService::fail(error, JiraError::Kind::Decode, "SearchIssues", "Unexpected JSON (expected object)");
        return std::nullopt;
    }
    return JiraJson::searchPageFromJson(doc->object());
}

std::optional<JiraIssue> JiraClient::fetchIssue(const QString& issueKey, JiraError* error)
{
    QUrl url(m_basePlatform + "/issue/" + enc(issueKey));
    QUrlQuery q;
    q.addQueryItem("fields", kIssueFields);
    url.setQuery(q);

    const auto doc = getJson(url, "GetIssue", error);
    if (!doc.has_value())
        return std::nullopt;
    if (!doc->isObject())
    {
        ErrorService::fail(error, JiraError::Kind::Decode, "GetIssue", "Unexpected JSON (expected object)");
        return std::nullopt;
    }
    return JiraJson::issueFromJson(doc->object());
}

std::optional<QList<JiraComment>> JiraClient::fetchComments(const QString& issueKey, int limit, JiraError* error)
{
    QUrl url(m_basePlatform + "/issue/" + enc(issueKey) + "/comment");
    QUrlQuery q;
    q.addQueryItem("orderBy", "-created");
    q.addQueryItem("maxResults", QString::number(limit));
    url.setQuery(q);

    const auto doc = getJson(url, "GetIssueComments", error);
    if (!doc.has_value())
        return std::nullopt;
    if (!doc->isObject())
    {
        ErrorService::fail(error, JiraError::Kind::Decode, "GetIssueComments", "Unexpected JSON (expected object)");
        return std::nullopt;
    }
    return JiraJson::commentsFromJson(doc->object());
}

std::optional<QList<JiraTransition>> JiraClient::fetchTransitions(const QString& issueKey, JiraError* error)
{
    const QUrl url(m_basePlatform + "/issue/" + enc(issueKey) + "/transitions");
    const auto doc = getJson(url, "GetTransitions", error);
    if (!doc.has_value())
        return std::nullopt;
    if (!doc->isObject())
    {
        ErrorService::fail(error, JiraError::Kind::Decode, "GetTransitions", "Unexpected JSON (expected object)");
        return std::nullopt;
    }
    return JiraJson::transitionsFromJson(doc->object());
}

std::optional<QList<JiraUser>> JiraClient::searchUsers(const QString& query, JiraError* error)
{
    QUrl url(m_basePlatform + "/user/search");
    QUrlQuery q;
    q.addQueryItem("query", query);
    url.setQuery(q);

    const auto doc = getJson(url, "SearchUsers", error);
    if (!doc.has_value())
        return std::nullopt;
    if (!doc->isArray())
    {
        ErrorService::fail(error, JiraError::Kind::Decode, "SearchUsers", "Unexpected JSON (expected array)");
        return std::nullopt;
    }

    QList<JiraUser> users;
    for (const auto& v : doc->array())
        users.append(JiraJson::userFromJson(v.toObject()));
    return users;
}

bool JiraClient::applyTransition(const QString& issueKey, const QString& transitionId, JiraError* error)
{
    const QUrl url(m_basePlatform + "/issue/" + enc(issueKey) + "/transitions");
    const auto payload = QJsonDocument(JiraJson::transitionRequest(transitionId)).toJson(QJsonDocument::Compact);

    qCDebug(lcHttp) << "POST" << url.toString() << "transition" << transitionId;
    QNetworkReply* reply = m_net.post(makeRequest(url), payload);
    return finish(reply, "TransitionIssue", 204, error).has_value();
}

bool JiraClient::assignIssue(const QString& issueKey, const QString& accountId, JiraError* error)
{
    const QUrl url(m_basePlatform + "/issue/" + enc(issueKey) + "/assignee");
    const auto payload = QJsonDocument(JiraJson::assignRequest(accountId)).toJson(QJsonDocument::Compact);

    qCDebug(lcHttp) << "PUT" << url.toString();
    QNetworkReply* reply = m_net.put(makeRequest(url), payload);
    return finish(reply, "AssignIssue", 204, error).has_value();
}

bool JiraClient::addComment(const QString& issueKey, const QString& plainText, JiraError* error)
{
    const QUrl url(m_basePlatform + "/issue/" + enc(issueKey) + "/comment");
    const auto payload = QJsonDocument(JiraJson::commentRequest(plainText)).toJson(QJsonDocument::Compact);

    qCDebug(lcHttp) << "POST" << url.toString();
    QNetworkReply* reply = m_net.post(makeRequest(url), payload);
    return finish(reply, "AddComment", 201, error).has_value();
}
