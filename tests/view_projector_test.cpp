#include <gtest/gtest.h>

#include <QJsonDocument>
#include <QJsonObject>

#include "jira_json.h"
#include "view_projector.h"

namespace {

const QString kServer = QStringLiteral("https://example.atlassian.net");

JiraUser user(const QString& email, const QString& name)
{
    JiraUser u;
    u.accountId = QStringLiteral("acc-") + name;
    u.emailAddress = email;
    u.displayName = name;
    return u;
}

} // namespace

TEST(ViewProjectorTest, FormatsMillisecondTimestamps)
{
    EXPECT_EQ(ViewProjector::formatDate("2024-03-05T14:07:09.123+0000"), QStringLiteral("2024-03-05"));
    EXPECT_EQ(ViewProjector::formatDate("2023-12-31T23:59:59.000-0800"), QStringLiteral("2023-12-31"));
}

TEST(ViewProjectorTest, FormatsVariablePrecisionTimestamps)
{
    EXPECT_EQ(ViewProjector::formatDate("2024-03-05T14:07:09+0100"), QStringLiteral("2024-03-05"));
    EXPECT_EQ(ViewProjector::formatDate("2024-03-05T14:07:09.5+0100"), QStringLiteral("2024-03-05"));
    EXPECT_EQ(ViewProjector::formatDate("2024-03-05T14:07:09.123456+0100"), QStringLiteral("2024-03-05"));
}

TEST(ViewProjectorTest, MalformedDatesDegrade)
{
    EXPECT_EQ(ViewProjector::formatDate(""), QString());
    EXPECT_EQ(ViewProjector::formatDate("yesterday"), QStringLiteral("yesterday"));
    EXPECT_EQ(ViewProjector::formatDate("2024-03"), QStringLiteral("2024-03"));
    EXPECT_EQ(ViewProjector::formatDate("2024-03-05"), QStringLiteral("2024-03-05"));
    EXPECT_EQ(ViewProjector::formatDate("2024-03-05 14:07"), QStringLiteral("2024-03-05"));
    EXPECT_EQ(ViewProjector::formatDate("not a timestamp at all"), QStringLiteral("not a time"));
    // Well-formed but impossible calendar date.
    EXPECT_EQ(ViewProjector::formatDate("2024-02-30T10:00:00.000+0000"), QStringLiteral("2024-02-30"));
}

TEST(ViewProjectorTest, IssueViewPrefersEmailForAssignee)
{
    JiraIssue issue;
    issue.key = QStringLiteral("PROJ-7");
    issue.fields.summary = QStringLiteral("Fix login");
    issue.fields.status = QStringLiteral("In Progress");
    issue.fields.issueType = QStringLiteral("Bug");
    issue.fields.priority = QStringLiteral("High");
    issue.fields.assignee = user("dev@example.com", "Dev Person");
    issue.fields.created = QStringLiteral("2024-01-02T03:04:05.006+0000");
    issue.fields.updated = QStringLiteral("2024-01-03T03:04:05.006+0000");

    const auto v = ViewProjector::issueToView(issue, kServer);
    EXPECT_EQ(v.key, QStringLiteral("PROJ-7"));
    EXPECT_EQ(v.summary, QStringLiteral("Fix login"));
    EXPECT_EQ(v.status, QStringLiteral("In Progress"));
    EXPECT_EQ(v.type, QStringLiteral("Bug"));
    EXPECT_EQ(v.priority, QStringLiteral("High"));
    EXPECT_EQ(v.assignee, QStringLiteral("dev@example.com"));
    EXPECT_EQ(v.created, QStringLiteral("2024-01-02"));
    EXPECT_EQ(v.updated, QStringLiteral("2024-01-03"));
    EXPECT_EQ(v.url, QStringLiteral("https://example.atlassian.net/browse/PROJ-7"));
}

TEST(ViewProjectorTest, UserFallbacks)
{
    EXPECT_EQ(ViewProjector::userEmail(std::nullopt), QString());
    EXPECT_EQ(ViewProjector::userEmail(user("", "Hidden Email")), QStringLiteral("Hidden Email"));
    EXPECT_EQ(ViewProjector::userDisplayName(user("a@b.c", "")), QStringLiteral("a@b.c"));
    EXPECT_EQ(ViewProjector::userDisplayName(user("a@b.c", "Alice")), QStringLiteral("Alice"));
    EXPECT_EQ(ViewProjector::userDisplayName(std::nullopt), QString());
}

TEST(ViewProjectorTest, UnassignedIssueHasEmptyFields)
{
    JiraIssue issue;
    issue.key = QStringLiteral("PROJ-8");

    const auto v = ViewProjector::issueToView(issue, kServer);
    EXPECT_TRUE(v.assignee.isEmpty());
    EXPECT_TRUE(v.priority.isEmpty());
    EXPECT_TRUE(v.created.isEmpty());
}

TEST(ViewProjectorTest, DetailViewExtractsDescriptionAndComments)
{
    const auto raw = QJsonDocument::fromJson(R"({
        "key": "PROJ-9",
        "fields": {
            "summary": "Crash on save",
            "description": {"type":"doc","version":1,"content":[
                {"type":"paragraph","content":[{"type":"text","text":"Steps"}]},
                {"type":"paragraph","content":[{"type":"text","text":"Save twice"}]}]},
            "status": {"name": "Open"},
            "created": "2024-05-01T09:00:00.000+0200"
        }
    })").object();

    JiraComment c;
    c.author = user("qa@example.com", "QA");
    c.body = QJsonValue(QStringLiteral("Reproduced"));
    c.created = QStringLiteral("2024-05-02T10:00:00.000+0200");

    JiraComment anonymous;
    anonymous.body = QJsonDocument::fromJson(
        R"({"type":"doc","content":[{"type":"paragraph","content":[{"type":"text","text":"ADF body"}]}]})").object();
    anonymous.created = QStringLiteral("garbage");

    const auto dv = ViewProjector::issueToDetailView(JiraJson::issueFromJson(raw), kServer, {c, anonymous});
    EXPECT_EQ(dv.issue.key, QStringLiteral("PROJ-9"));
    EXPECT_EQ(dv.issue.status, QStringLiteral("Open"));
    EXPECT_EQ(dv.description, QStringLiteral("Steps\nSave twice"));
    ASSERT_EQ(dv.comments.size(), 2);
    EXPECT_EQ(dv.comments.at(0).author, QStringLiteral("QA"));
    EXPECT_EQ(dv.comments.at(0).body, QStringLiteral("Reproduced"));
    EXPECT_EQ(dv.comments.at(0).created, QStringLiteral("2024-05-02"));
    EXPECT_TRUE(dv.comments.at(1).author.isEmpty());
    EXPECT_EQ(dv.comments.at(1).body, QStringLiteral("ADF body"));
    EXPECT_EQ(dv.comments.at(1).created, QStringLiteral("garbage"));
}

TEST(ViewProjectorTest, ListViewCarriesPagingFacts)
{
    PageResult result;
    JiraIssue a;
    a.key = QStringLiteral("A-1");
    JiraIssue b;
    b.key = QStringLiteral("A-2");
    result.issues = {a, b};
    result.total = 12;
    result.hasMore = true;

    const auto list = ViewProjector::listView(result, kServer);
    EXPECT_EQ(list.server, kServer);
    EXPECT_EQ(list.count, 2);
    EXPECT_EQ(list.total, 12);
    EXPECT_TRUE(list.hasMore);
    ASSERT_EQ(list.issues.size(), 2);
    EXPECT_EQ(list.issues.at(1).url, kServer + "/browse/A-2");
}
