#include <gtest/gtest.h>

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "config.h"

namespace {

QProcessEnvironment env(const QList<QPair<QString, QString>>& vars)
{
    QProcessEnvironment e;
    for (const auto& v : vars)
        e.insert(v.first, v.second);
    return e;
}

} // namespace

TEST(ConfigTest, MissingFileLoadsEmpty)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    JiraError error;
    const auto cfg = ConfigService::load(dir.filePath("nope/config.json"), &error);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_FALSE(cfg->isComplete());
    EXPECT_FALSE(error.isError());
}

TEST(ConfigTest, SaveCreatesDirectoryAndRoundTrips)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("jiractl/config.json");

    const JiraConfig cfg{"https://example.atlassian.net", "me@example.com", "secret"};
    JiraError error;
    ASSERT_TRUE(ConfigService::save(cfg, path, &error)) << error.message.toStdString();

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const auto root = QJsonDocument::fromJson(f.readAll()).object();
    EXPECT_EQ(root.value("server").toString(), QStringLiteral("https://example.atlassian.net"));
    EXPECT_EQ(root.value("email").toString(), QStringLiteral("me@example.com"));
    EXPECT_EQ(root.value("api_token").toString(), QStringLiteral("secret"));

    const auto perms = QFileInfo(path).permissions();
    EXPECT_FALSE(perms.testFlag(QFileDevice::ReadOther));
    EXPECT_FALSE(perms.testFlag(QFileDevice::ReadGroup));

    const auto loaded = ConfigService::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->apiToken, QStringLiteral("secret"));
}

TEST(ConfigTest, CorruptFileIsAnError)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("config.json");
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("{not json");
    f.close();

    JiraError error;
    EXPECT_FALSE(ConfigService::load(path, &error).has_value());
    EXPECT_EQ(error.kind, JiraError::Kind::Config);
}

TEST(ConfigTest, EnvironmentOverridesStoredValues)
{
    const JiraConfig stored{"https://stored", "stored@example.com", "stored-token"};
    const auto cfg = ConfigService::applyEnvironment(
        stored, env({{"JIRACTL_SERVER", "https://env"}, {"JIRACTL_API_TOKEN", "env-token"}}));
    EXPECT_EQ(cfg.server, QStringLiteral("https://env"));
    EXPECT_EQ(cfg.email, QStringLiteral("stored@example.com"));
    EXPECT_EQ(cfg.apiToken, QStringLiteral("env-token"));
}

TEST(ConfigTest, ResolveRequiresAllValuesAndTrimsSlashes)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("config.json");

    JiraError error;
    EXPECT_FALSE(ConfigService::resolve(path, env({{"JIRACTL_SERVER", "https://x"}}), &error).has_value());
    EXPECT_EQ(error.kind, JiraError::Kind::Config);
    EXPECT_TRUE(error.message.startsWith("not authenticated"));

    const auto cfg = ConfigService::resolve(
        path,
        env({{"JIRACTL_SERVER", "https://x.atlassian.net//"}, {"JIRACTL_EMAIL", "e@x"}, {"JIRACTL_API_TOKEN", "t"}}));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->server, QStringLiteral("https://x.atlassian.net"));
}

TEST(ConfigTest, RemoveReportsWhetherAnythingWasDeleted)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("config.json");

    bool removed = true;
    EXPECT_TRUE(ConfigService::remove(path, &removed));
    EXPECT_FALSE(removed);

    ASSERT_TRUE(ConfigService::save(JiraConfig{"https://x", "e", "t"}, path));
    EXPECT_TRUE(ConfigService::remove(path, &removed));
    EXPECT_TRUE(removed);
    EXPECT_FALSE(QFile::exists(path));
}

TEST(ConfigTest, ContextReadsPrettyJsonFlag)
{
    EXPECT_TRUE(AppContext::fromEnvironment(env({{"JIRACTL_JSON_PRETTY", " 1 "}})).prettyJson);
    EXPECT_FALSE(AppContext::fromEnvironment(env({{"JIRACTL_JSON_PRETTY", "true"}})).prettyJson);
    EXPECT_FALSE(AppContext::fromEnvironment(env({})).prettyJson);
}
