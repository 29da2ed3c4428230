#include "jira_json.h"

#include "adf.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

static QString nameOf(const QJsonValue& v)
{
    return v.toObject().value("name").toString();
}

static std::optional<JiraUser> optionalUser(const QJsonValue& v)
{
    if (!v.isObject()) return std::nullopt;
    return JiraJson::userFromJson(v.toObject());
}

JiraUser JiraJson::userFromJson(const QJsonObject& o)
{
    JiraUser u;
    u.accountId = o.value("accountId").toString();
    u.emailAddress = o.value("emailAddress").toString();
    u.displayName = o.value("displayName").toString();
    u.active = o.value("active").toBool();
    return u;
}

JiraIssue JiraJson::issueFromJson(const QJsonObject& o)
{
    JiraIssue issue;
    issue.key = o.value("key").toString();
    issue.self = o.value("self").toString();

    const auto fields = o.value("fields").toObject();
    auto& f = issue.fields;
    f.summary = fields.value("summary").toString();
    f.description = fields.value("description");
    if (f.description.isUndefined())
        f.description = QJsonValue(QJsonValue::Null);
    f.status = nameOf(fields.value("status"));
    f.issueType = nameOf(fields.value("issuetype"));
    f.priority = nameOf(fields.value("priority"));
    f.assignee = optionalUser(fields.value("assignee"));
    f.reporter = optionalUser(fields.value("reporter"));
    f.created = fields.value("created").toString();
    f.updated = fields.value("updated").toString();

    for (const auto& v : fields.value("labels").toArray())
    {
        if (v.isString()) f.labels.append(v.toString());
    }
    for (const auto& v : fields.value("components").toArray())
    {
        const auto name = nameOf(v);
        if (!name.isEmpty()) f.components.append(name);
    }
    return issue;
}

JiraComment JiraJson::commentFromJson(const QJsonObject& o)
{
    JiraComment c;
    c.id = o.value("id").toString();
    c.author = optionalUser(o.value("author"));
    c.body = o.value("body");
    if (c.body.isUndefined())
        c.body = QJsonValue(QJsonValue::Null);
    c.created = o.value("created").toString();
    c.updated = o.value("updated").toString();
    return c;
}

JiraTransition JiraJson::transitionFromJson(const QJsonObject& o)
{
    JiraTransition t;
    t.id = o.value("id").toString();
    t.name = o.value("name").toString();
    t.targetStatusName = nameOf(o.value("to"));
    return t;
}

SearchPage JiraJson::searchPageFromJson(const QJsonObject& root)
{
    SearchPage page;
    page.total = root.value("total").toInt();
    page.nextPageToken = root.value("nextPageToken").toString();
    for (const auto& v : root.value("issues").toArray())
        page.issues.append(issueFromJson(v.toObject()));
    return page;
}

QList<JiraComment> JiraJson::commentsFromJson(const QJsonObject& root)
{
    QList<JiraComment> list;
    for (const auto& v : root.value("comments").toArray())
        list.append(commentFromJson(v.toObject()));
    return list;
}

QList<JiraTransition> JiraJson::transitionsFromJson(const QJsonObject& root)
{
    QList<JiraTransition> list;
    for (const auto& v : root.value("transitions").toArray())
        list.append(transitionFromJson(v.toObject()));
    return list;
}

QJsonObject JiraJson::toJson(const IssueView& v)
{
    QJsonObject o;
    o.insert("key", v.key);
    o.insert("summary", v.summary);
    o.insert("status", v.status);
    o.insert("type", v.type);
    o.insert("priority", v.priority);
    o.insert("assignee", v.assignee);
    o.insert("created", v.created);
    o.insert("updated", v.updated);
    o.insert("url", v.url);
    return o;
}

QJsonObject JiraJson::toJson(const IssueListView& v)
{
    QJsonArray issues;
    for (const auto& i : v.issues)
        issues.append(toJson(i));

    QJsonObject o;
    o.insert("server", v.server);
    o.insert("count", v.count);
    o.insert("total", v.total);
    o.insert("has_more", v.hasMore);
    o.insert("issues", issues);
    return o;
}

QJsonObject JiraJson::toJson(const CommentView& v)
{
    QJsonObject o;
    o.insert("author", v.author);
    o.insert("body", v.body);
    o.insert("created", v.created);
    return o;
}

QJsonObject JiraJson::toJson(const IssueDetailView& v)
{
    auto o = toJson(v.issue);
    o.insert("description", v.description);
    if (!v.comments.isEmpty())
    {
        QJsonArray comments;
        for (const auto& c : v.comments)
            comments.append(toJson(c));
        o.insert("comments", comments);
    }
    return o;
}

QJsonObject JiraJson::toJson(const TransitionResult& v)
{
    QJsonObject o;
    o.insert("key", v.key);
    o.insert("status", v.status);
    if (!v.matchedBy.isEmpty()) o.insert("matched_by", v.matchedBy);
    if (!v.warning.isEmpty()) o.insert("warning", v.warning);
    o.insert("url", v.url);
    return o;
}

QJsonObject JiraJson::toJson(const AssignResult& v)
{
    QJsonObject o;
    o.insert("key", v.key);
    o.insert("assignee", v.assignee);
    o.insert("assignee_name", v.assigneeName);
    o.insert("url", v.url);
    return o;
}

QJsonObject JiraJson::toJson(const CommentResult& v)
{
    QJsonObject o;
    o.insert("key", v.key);
    o.insert("comment", v.comment);
    o.insert("url", v.url);
    return o;
}

QJsonObject JiraJson::transitionRequest(const QString& transitionId)
{
    QJsonObject transition;
    transition.insert("id", transitionId);

    QJsonObject payload;
    payload.insert("transition", transition);
    return payload;
}

QJsonObject JiraJson::assignRequest(const QString& accountId)
{
    QJsonObject payload;
    payload.insert("accountId", accountId);
    return payload;
}

QJsonObject JiraJson::commentRequest(const QString& plainText)
{
    QJsonObject payload;
    payload.insert("body", Adf::buildDocument(plainText));
    return payload;
}

QString JiraJson::apiErrorMessage(const QString& statusLine, const QByteArray& body)
{
    QJsonParseError parseError;
    const auto doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error == QJsonParseError::NoError && doc.isObject())
    {
        const auto root = doc.object();
        QStringList msgs;
        for (const auto& v : root.value("errorMessages").toArray())
            msgs.append(v.toString());

        // QJsonObject iterates keys in sorted order, which keeps the message stable.
        const auto errors = root.value("errors").toObject();
        for (auto it = errors.begin(); it != errors.end(); ++it)
            msgs.append(QStringLiteral("%1: %2").arg(it.key(), it.value().toString()));

        if (!msgs.isEmpty())
            return QStringLiteral("jira api error (%1): %2").arg(statusLine, msgs.join("; "));
    }

    auto trimmed = QString::fromUtf8(body).trimmed();
    if (trimmed.isEmpty())
        trimmed = statusLine;
    return QStringLiteral("jira api error (%1): %2").arg(statusLine, trimmed);
}
