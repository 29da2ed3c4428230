#pragma once

#include <QList>
#include <QString>
#include <optional>

#include "error.h"
#include "models.h"

enum class MatchTier
{
    Exact,
    Prefix,
    Contains,
};

QString matchTierName(MatchTier tier);

struct MatchOutcome
{
    JiraTransition selected;
    MatchTier matchedBy{MatchTier::Exact};
    // Empty unless the winning tier had more than one candidate.
    QString ambiguityWarning;
};

// Resolves a free-text status name against the transitions available on an
// issue. Tiers are tried in order (exact, prefix, contains; all
// case-insensitive) and the first non-empty tier wins. Ties are broken by
// name length, then lowercase name, then id, so the same input always selects
// the same transition.
//
// Fails with EmptyQuery for a blank status and NoMatch (listing every
// available name) when no tier matches. The input list is not modified.
std::optional<MatchOutcome> matchTransition(const QList<JiraTransition>& transitions, const QString& status,
                                            JiraError* error = nullptr);
