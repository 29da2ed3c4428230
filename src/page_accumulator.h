#pragma once

#include <QString>
#include <functional>
#include <optional>

#include "error.h"
#include "models.h"

class IssueSource;

// Drives nextPageToken pagination of /search/jql until the requested number
// of issues is collected or the server runs out.
class PageAccumulator
{
public:
    using FetchPage = std::function<std::optional<SearchPage>(const QString& jql, int maxResults,
                                                              const QString& nextPageToken, JiraError* error)>;

    // Upper bound for maxResults on a single request.
    static constexpr int kMaxPageSize = 100;

    explicit PageAccumulator(FetchPage fetchPage);
    explicit PageAccumulator(IssueSource& source);

    // Any page failure discards what was collected so far.
    std::optional<PageResult> fetch(const QString& jql, int limit, JiraError* error = nullptr) const;

private:
    FetchPage m_fetchPage;
};
