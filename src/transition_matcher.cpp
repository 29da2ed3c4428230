#include "transition_matcher.h"

#include "logging.h"

#include <QStringList>

#include <algorithm>

namespace
{
struct ScoredTransition
{
    JiraTransition transition;
    qsizetype index;
};

JiraTransition pickBest(const QList<JiraTransition>& candidates)
{
    if (candidates.size() == 1)
        return candidates.first();

    auto sorted = candidates;
    std::stable_sort(sorted.begin(), sorted.end(), [](const JiraTransition& a, const JiraTransition& b) {
        if (a.name.size() != b.name.size())
            return a.name.size() < b.name.size();
        const auto la = a.name.toLower();
        const auto lb = b.name.toLower();
        if (la != lb)
            return la < lb;
        return a.id < b.id;
    });
    return sorted.first();
}

QString ambiguityWarning(const QString& query, const QList<JiraTransition>& candidates, const JiraTransition& selected)
{
    if (candidates.size() <= 1)
        return QString();

    QStringList names;
    for (const auto& t : candidates)
        names.append(t.name);
    return QStringLiteral("status \"%1\" matched multiple transitions (%2); using \"%3\"")
        .arg(query, names.join(", "), selected.name);
}

MatchOutcome outcome(const QString& query, const QList<JiraTransition>& candidates, MatchTier tier)
{
    MatchOutcome out;
    out.selected = pickBest(candidates);
    out.matchedBy = tier;
    out.ambiguityWarning = ambiguityWarning(query, candidates, out.selected);
    return out;
}
}

QString matchTierName(MatchTier tier)
{
    switch (tier)
    {
    case MatchTier::Exact: return QStringLiteral("exact");
    case MatchTier::Prefix: return QStringLiteral("prefix");
    case MatchTier::Contains: return QStringLiteral("contains");
    }
    return QString();
}

std::optional<MatchOutcome> matchTransition(const QList<JiraTransition>& transitions, const QString& status,
                                            JiraError* error)
{
    const auto query = status.trimmed();
    if (query.isEmpty())
    {
        ErrorService::fail(error, JiraError::Kind::EmptyQuery, "MatchTransition", "--status is required");
        return std::nullopt;
    }

    const auto queryLower = query.toLower();

    QList<JiraTransition> exact;
    QList<JiraTransition> prefix;
    QList<ScoredTransition> contains;

    for (const auto& t : transitions)
    {
        const auto nameLower = t.name.toLower();
        if (nameLower == queryLower)
            exact.append(t);
        else if (nameLower.startsWith(queryLower))
            prefix.append(t);
        else if (const auto index = nameLower.indexOf(queryLower); index >= 0)
            contains.append(ScoredTransition{t, index});
    }

    if (!exact.isEmpty())
        return outcome(query, exact, MatchTier::Exact);

    if (!prefix.isEmpty())
        return outcome(query, prefix, MatchTier::Prefix);

    if (!contains.isEmpty())
    {
        std::stable_sort(contains.begin(), contains.end(), [](const ScoredTransition& a, const ScoredTransition& b) {
            if (a.index != b.index)
                return a.index < b.index;
            const auto la = a.transition.name.toLower();
            const auto lb = b.transition.name.toLower();
            if (la != lb)
                return la < lb;
            return a.transition.name.size() < b.transition.name.size();
        });

        QList<JiraTransition> candidates;
        candidates.reserve(contains.size());
        for (const auto& c : contains)
            candidates.append(c.transition);
        return outcome(query, candidates, MatchTier::Contains);
    }

    QStringList available;
    for (const auto& t : transitions)
        available.append(t.name);

    qCDebug(lcMatch) << "no transition matches" << query << "among" << available;
    ErrorService::fail(error, JiraError::Kind::NoMatch, "MatchTransition",
                       QStringLiteral("no transition matching \"%1\"; available transitions: %2")
                           .arg(query, available.join(", ")));
    return std::nullopt;
}
