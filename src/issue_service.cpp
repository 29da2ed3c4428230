#include "issue_service.h"

#include "issue_source.h"
#include "logging.h"
#include "page_accumulator.h"
#include "transition_matcher.h"
#include "view_projector.h"

IssueService::IssueService(IssueSource* source, const QString& server)
    : m_source(source), m_server(server)
{
    Q_ASSERT(m_source);
}

QString IssueService::myIssuesJql(const QString& status)
{
    if (status.isEmpty())
        return QStringLiteral("assignee = currentUser() ORDER BY updated DESC");

    QString quoted = status;
    quoted.replace('\\', QStringLiteral("\\\\")).replace('"', QStringLiteral("\\\""));
    return QStringLiteral("assignee = currentUser() AND status = \"%1\" ORDER BY updated DESC").arg(quoted);
}

QString IssueService::normalizeKey(const QString& issueKey)
{
    return issueKey.trimmed().toUpper();
}

std::optional<IssueListView> IssueService::runSearch(const QString& jql, int limit, JiraError* error)
{
    if (limit <= 0)
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "SearchIssues", "--limit must be greater than 0");
        return std::nullopt;
    }

    const PageAccumulator pages(*m_source);
    const auto result = pages.fetch(jql, limit, error);
    if (!result.has_value())
        return std::nullopt;

    return ViewProjector::listView(*result, m_server);
}

std::optional<IssueListView> IssueService::mine(int limit, const QString& status, JiraError* error)
{
    return runSearch(myIssuesJql(status.trimmed()), limit, error);
}

std::optional<IssueListView> IssueService::search(const QString& jql, int limit, JiraError* error)
{
    if (jql.trimmed().isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "SearchIssues",
                           "--jql is required (e.g. --jql \"project = PROJ\")");
        return std::nullopt;
    }
    return runSearch(jql, limit, error);
}

std::optional<IssueDetailView> IssueService::view(const QString& issueKey, int commentLimit, JiraError* error)
{
    const auto key = normalizeKey(issueKey);
    if (key.isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "ViewIssue",
                           "issue key is required (e.g. jiractl issues view PROJ-123)");
        return std::nullopt;
    }
    if (commentLimit <= 0)
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "ViewIssue", "--comment-limit must be greater than 0");
        return std::nullopt;
    }

    const auto issue = m_source->fetchIssue(key, error);
    if (!issue.has_value())
        return std::nullopt;

    const auto comments = m_source->fetchComments(key, commentLimit, error);
    if (!comments.has_value())
        return std::nullopt;

    return ViewProjector::issueToDetailView(*issue, m_server, *comments);
}

std::optional<TransitionResult> IssueService::transition(const QString& issueKey, const QString& status,
                                                         JiraError* error)
{
    const auto key = normalizeKey(issueKey);
    if (key.isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "TransitionIssue",
                           "issue key is required (e.g. jiractl issues transition PROJ-123 --status \"In Progress\")");
        return std::nullopt;
    }
    if (status.trimmed().isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::EmptyQuery, "TransitionIssue",
                           "--status is required (e.g. --status \"In Progress\")");
        return std::nullopt;
    }

    const auto transitions = m_source->fetchTransitions(key, error);
    if (!transitions.has_value())
        return std::nullopt;

    const auto match = matchTransition(*transitions, status, error);
    if (!match.has_value())
        return std::nullopt;

    qCDebug(lcMatch) << key << "status" << status << "->" << match->selected.name << "(id" << match->selected.id
                     << "by" << matchTierName(match->matchedBy) << ")";

    if (!m_source->applyTransition(key, match->selected.id, error))
        return std::nullopt;

    TransitionResult result;
    result.key = key;
    result.status = match->selected.name;
    result.matchedBy = matchTierName(match->matchedBy);
    result.warning = match->ambiguityWarning;
    result.url = ViewProjector::browseUrl(m_server, key);
    return result;
}

std::optional<AssignResult> IssueService::assign(const QString& issueKey, const QString& email, JiraError* error)
{
    const auto key = normalizeKey(issueKey);
    if (key.isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "AssignIssue",
                           "issue key is required (e.g. jiractl issues assign PROJ-123)");
        return std::nullopt;
    }

    JiraUser assignee;
    const auto query = email.trimmed();
    if (query.isEmpty())
    {
        const auto issue = m_source->fetchIssue(key, error);
        if (!issue.has_value())
            return std::nullopt;

        const auto& reporter = issue->fields.reporter;
        if (!reporter.has_value() || reporter->accountId.isEmpty())
        {
            ErrorService::fail(error, JiraError::Kind::NotFound, "AssignIssue",
                               "issue has no reporter; use --email to specify an assignee");
            return std::nullopt;
        }
        assignee = *reporter;
    }
    else
    {
        const auto users = m_source->searchUsers(query, error);
        if (!users.has_value())
            return std::nullopt;
        if (users->isEmpty())
        {
            ErrorService::fail(error, JiraError::Kind::NotFound, "AssignIssue",
                               QStringLiteral("no user found for \"%1\"").arg(query));
            return std::nullopt;
        }
        assignee = users->first();
    }

    if (!m_source->assignIssue(key, assignee.accountId, error))
        return std::nullopt;

    AssignResult result;
    result.key = key;
    result.assignee = assignee.emailAddress;
    result.assigneeName = assignee.displayName;
    result.url = ViewProjector::browseUrl(m_server, key);
    return result;
}

std::optional<CommentResult> IssueService::comment(const QString& issueKey, const QString& body, JiraError* error)
{
    const auto key = normalizeKey(issueKey);
    if (key.isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "AddComment",
                           "issue key is required (e.g. jiractl issues comment PROJ-123 --body \"text\")");
        return std::nullopt;
    }
    if (body.trimmed().isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::Usage, "AddComment", "--body is required");
        return std::nullopt;
    }

    if (!m_source->addComment(key, body, error))
        return std::nullopt;

    CommentResult result;
    result.key = key;
    result.comment = body;
    result.url = ViewProjector::browseUrl(m_server, key);
    return result;
}
