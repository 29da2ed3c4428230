#include "page_accumulator.h"

#include "issue_source.h"
#include "logging.h"

#include <algorithm>

PageAccumulator::PageAccumulator(FetchPage fetchPage)
    : m_fetchPage(std::move(fetchPage))
{
}

PageAccumulator::PageAccumulator(IssueSource& source)
    : m_fetchPage([&source](const QString& jql, int maxResults, const QString& token, JiraError* error) {
          return source.fetchPage(jql, maxResults, token, error);
      })
{
}

std::optional<PageResult> PageAccumulator::fetch(const QString& jql, int limit, JiraError* error) const
{
    QList<JiraIssue> all;
    QString nextPageToken;
    int total = 0;

    while (all.size() < limit)
    {
        const int maxResults = std::min(limit - static_cast<int>(all.size()), kMaxPageSize);

        JiraError pageError;
        const auto page = m_fetchPage(jql, maxResults, nextPageToken, &pageError);
        if (!page.has_value())
        {
            qCDebug(lcPaging) << "page fetch failed after" << all.size() << "issues:" << pageError.message;
            if (error) *error = pageError;
            return std::nullopt;
        }

        total = page->total;
        all.append(page->issues);
        nextPageToken = page->nextPageToken;

        qCDebug(lcPaging) << "page:" << page->issues.size() << "issues, total" << total
                          << "next token" << (nextPageToken.isEmpty() ? QStringLiteral("<none>") : nextPageToken);

        if (page->issues.isEmpty() || nextPageToken.isEmpty())
            break;
    }

    if (all.size() > limit)
    {
        qCDebug(lcPaging) << "dropping" << all.size() - limit << "issues past the limit";
        all.erase(all.begin() + limit, all.end());
    }

    PageResult result;
    result.issues = all;
    result.total = total;
    // Counted after truncation so dropped issues still report more.
    const int returned = static_cast<int>(result.issues.size());
    result.hasMore = !nextPageToken.isEmpty() || returned < total;

    if (nextPageToken.isEmpty() && returned < total)
        qCDebug(lcPaging) << "server reported total" << total << "but no continuation token after" << returned;

    return result;
}
