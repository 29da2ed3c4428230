#include "view_projector.h"

#include "adf.h"

#include <QDate>
#include <QRegularExpression>
#include <QTime>

namespace
{
// Millisecond precision, e.g. 2024-03-05T14:07:09.123+0000
const QRegularExpression& millisPattern()
{
    static const QRegularExpression re(
        QStringLiteral(R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})\.\d{3}([+-])(\d{2})(\d{2})$)"));
    return re;
}

// Optional fractional seconds of any precision, e.g. 2024-03-05T14:07:09+0000
const QRegularExpression& fractionalPattern()
{
    static const QRegularExpression re(
        QStringLiteral(R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.\d{1,9})?([+-])(\d{2})(\d{2})$)"));
    return re;
}

std::optional<QDate> parseTimestamp(const QString& s, const QRegularExpression& re)
{
    const auto m = re.match(s);
    if (!m.hasMatch()) return std::nullopt;

    const QDate date(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt());
    const QTime time(m.captured(4).toInt(), m.captured(5).toInt(), m.captured(6).toInt());
    const int offsetHours = m.captured(8).toInt();
    const int offsetMinutes = m.captured(9).toInt();
    if (!date.isValid() || !time.isValid() || offsetHours > 23 || offsetMinutes > 59)
        return std::nullopt;
    return date;
}
}

QString ViewProjector::formatDate(const QString& timestamp)
{
    if (timestamp.isEmpty()) return QString();

    auto date = parseTimestamp(timestamp, millisPattern());
    if (!date.has_value())
        date = parseTimestamp(timestamp, fractionalPattern());
    if (date.has_value())
        return date->toString(QStringLiteral("yyyy-MM-dd"));

    if (timestamp.size() >= 10)
        return timestamp.left(10);
    return timestamp;
}

QString ViewProjector::browseUrl(const QString& server, const QString& issueKey)
{
    return server + "/browse/" + issueKey;
}

QString ViewProjector::userEmail(const std::optional<JiraUser>& user)
{
    if (!user.has_value()) return QString();
    if (!user->emailAddress.isEmpty()) return user->emailAddress;
    return user->displayName;
}

QString ViewProjector::userDisplayName(const std::optional<JiraUser>& user)
{
    if (!user.has_value()) return QString();
    if (!user->displayName.isEmpty()) return user->displayName;
    return user->emailAddress;
}

IssueView ViewProjector::issueToView(const JiraIssue& issue, const QString& server)
{
    IssueView v;
    v.key = issue.key;
    v.summary = issue.fields.summary;
    v.status = issue.fields.status;
    v.type = issue.fields.issueType;
    v.priority = issue.fields.priority;
    v.assignee = userEmail(issue.fields.assignee);
    v.created = formatDate(issue.fields.created);
    v.updated = formatDate(issue.fields.updated);
    v.url = browseUrl(server, issue.key);
    return v;
}

QList<IssueView> ViewProjector::issuesToViews(const QList<JiraIssue>& issues, const QString& server)
{
    QList<IssueView> views;
    views.reserve(issues.size());
    for (const auto& issue : issues)
        views.append(issueToView(issue, server));
    return views;
}

IssueListView ViewProjector::listView(const PageResult& result, const QString& server)
{
    IssueListView out;
    out.server = server;
    out.issues = issuesToViews(result.issues, server);
    out.count = static_cast<int>(out.issues.size());
    out.total = result.total;
    out.hasMore = result.hasMore;
    return out;
}

CommentView ViewProjector::commentToView(const JiraComment& comment)
{
    CommentView v;
    v.author = userDisplayName(comment.author);
    v.body = Adf::toPlainText(comment.body);
    v.created = formatDate(comment.created);
    return v;
}

IssueDetailView ViewProjector::issueToDetailView(const JiraIssue& issue, const QString& server,
                                                 const QList<JiraComment>& comments)
{
    IssueDetailView dv;
    dv.issue = issueToView(issue, server);
    dv.description = Adf::toPlainText(issue.fields.description);
    for (const auto& c : comments)
        dv.comments.append(commentToView(c));
    return dv;
}
