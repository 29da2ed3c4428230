#include <gtest/gtest.h>

#include "fake_issue_source.h"
#include "page_accumulator.h"

namespace {

QStringList keysOf(const PageResult& result)
{
    QStringList keys;
    for (const auto& i : result.issues)
        keys.append(i.key);
    return keys;
}

QStringList keyRange(const QString& prefix, int from, int count)
{
    QStringList keys;
    for (int i = from; i < from + count; ++i)
        keys.append(QStringLiteral("%1-%2").arg(prefix).arg(i));
    return keys;
}

} // namespace

TEST(PageAccumulatorTest, StopsAtLimitAndReportsPendingToken)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"PROJ-1", "PROJ-2"}, 5, "page-2"),
                    FakeIssueSource::page({}, 5)};

    JiraError error;
    const auto result = PageAccumulator(source).fetch("project = PROJ", 2, &error);
    ASSERT_TRUE(result.has_value()) << error.message.toStdString();

    EXPECT_EQ(keysOf(*result), QStringList({"PROJ-1", "PROJ-2"}));
    EXPECT_EQ(result->total, 5);
    EXPECT_TRUE(result->hasMore);
    ASSERT_EQ(source.pageCalls.size(), 1);
    EXPECT_EQ(source.pageCalls.first().maxResults, 2);
    EXPECT_TRUE(source.pageCalls.first().token.isEmpty());
}

TEST(PageAccumulatorTest, FollowsTokensUntilExhausted)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"A-1", "A-2"}, 3, "t2"),
                    FakeIssueSource::page({"A-3"}, 3)};

    const auto result = PageAccumulator(source).fetch("q", 10);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(keysOf(*result), QStringList({"A-1", "A-2", "A-3"}));
    EXPECT_EQ(result->total, 3);
    EXPECT_FALSE(result->hasMore);

    ASSERT_EQ(source.pageCalls.size(), 2);
    EXPECT_EQ(source.pageCalls.at(0).maxResults, 10);
    EXPECT_EQ(source.pageCalls.at(1).maxResults, 8);
    EXPECT_EQ(source.pageCalls.at(1).token, QStringLiteral("t2"));
    EXPECT_EQ(source.pageCalls.at(1).jql, QStringLiteral("q"));
}

TEST(PageAccumulatorTest, CapsEachRequestAtMaxPageSize)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page(keyRange("K", 0, 100), 400, "t2"),
                    FakeIssueSource::page(keyRange("K", 100, 100), 400, "t3"),
                    FakeIssueSource::page(keyRange("K", 200, 50), 400, "t4")};

    const auto result = PageAccumulator(source).fetch("q", 250);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(source.pageCalls.size(), 3);
    EXPECT_EQ(source.pageCalls.at(0).maxResults, PageAccumulator::kMaxPageSize);
    EXPECT_EQ(source.pageCalls.at(1).maxResults, PageAccumulator::kMaxPageSize);
    EXPECT_EQ(source.pageCalls.at(2).maxResults, 50);
    EXPECT_EQ(result->issues.size(), 250);
    EXPECT_TRUE(result->hasMore);
}

TEST(PageAccumulatorTest, TruncatesOvershootingPage)
{
    // Servers may return more than maxResults.
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"B-1", "B-2", "B-3", "B-4"}, 4)};

    const auto result = PageAccumulator(source).fetch("q", 3);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(keysOf(*result), QStringList({"B-1", "B-2", "B-3"}));
    EXPECT_EQ(result->total, 4);
    // B-4 was dropped, so more remain even without a token.
    EXPECT_TRUE(result->hasMore);
}

TEST(PageAccumulatorTest, OvershootAcrossPagesStillReportsMore)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"H-1", "H-2"}, 5, "t2"),
                    FakeIssueSource::page({"H-3", "H-4", "H-5"}, 5)};

    const auto result = PageAccumulator(source).fetch("q", 4);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(keysOf(*result), QStringList({"H-1", "H-2", "H-3", "H-4"}));
    EXPECT_EQ(source.pageCalls.at(1).maxResults, 2);
    EXPECT_TRUE(result->hasMore);
}

TEST(PageAccumulatorTest, ExactFitWithoutTokenHasNoMore)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"J-1", "J-2", "J-3"}, 3)};

    const auto result = PageAccumulator(source).fetch("q", 3);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->issues.size(), 3);
    EXPECT_FALSE(result->hasMore);
}

TEST(PageAccumulatorTest, LimitAboveTotalEndsWithoutMore)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"C-1", "C-2"}, 2)};

    const auto result = PageAccumulator(source).fetch("q", 50);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->issues.size(), 2);
    EXPECT_EQ(result->total, 2);
    EXPECT_FALSE(result->hasMore);
    EXPECT_EQ(source.pageCalls.size(), 1);
}

TEST(PageAccumulatorTest, ReportsMoreWhenTotalExceedsCountWithoutToken)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"D-1"}, 7)};

    const auto result = PageAccumulator(source).fetch("q", 5);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->issues.size(), 1);
    EXPECT_TRUE(result->hasMore);
}

TEST(PageAccumulatorTest, EmptyPageStopsEvenWithToken)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"E-1"}, 1, "t2"),
                    FakeIssueSource::page({}, 1, "t3"),
                    FakeIssueSource::page({"E-2"}, 1)};

    const auto result = PageAccumulator(source).fetch("q", 10);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(source.pageCalls.size(), 2);
    EXPECT_EQ(keysOf(*result), QStringList({"E-1"}));
    EXPECT_TRUE(result->hasMore);
}

TEST(PageAccumulatorTest, UsesLastReportedTotal)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"F-1"}, 9, "t2"),
                    FakeIssueSource::page({"F-2"}, 2)};

    const auto result = PageAccumulator(source).fetch("q", 10);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->total, 2);
    EXPECT_FALSE(result->hasMore);
}

TEST(PageAccumulatorTest, PageFailureDiscardsPartialResults)
{
    FakeIssueSource source;
    source.pages = {FakeIssueSource::page({"G-1", "G-2"}, 10, "t2")};
    source.failPageAt = 1;

    JiraError error;
    const auto result = PageAccumulator(source).fetch("q", 10, &error);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.kind, JiraError::Kind::Transport);
    EXPECT_TRUE(error.message.contains("boom"));
    EXPECT_EQ(source.pageCalls.size(), 2);
}

TEST(PageAccumulatorTest, NonPositiveLimitFetchesNothing)
{
    int calls = 0;
    const PageAccumulator pages([&calls](const QString&, int, const QString&, JiraError*) {
        ++calls;
        return std::optional<SearchPage>(SearchPage{});
    });

    const auto result = pages.fetch("q", 0);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->issues.isEmpty());
    EXPECT_FALSE(result->hasMore);
    EXPECT_EQ(calls, 0);
}
