#include "config.h"

#include "logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

static JiraConfig fromJson(const QJsonObject& root)
{
    JiraConfig cfg;
    cfg.server = root.value("server").toString();
    cfg.email = root.value("email").toString();
    cfg.apiToken = root.value("api_token").toString();
    return cfg;
}

static QJsonObject toJson(const JiraConfig& cfg)
{
    QJsonObject root;
    root.insert("server", cfg.server);
    root.insert("email", cfg.email);
    root.insert("api_token", cfg.apiToken);
    return root;
}

AppContext AppContext::fromEnvironment(const QProcessEnvironment& env)
{
    AppContext ctx;
    ctx.configPath = ConfigService::defaultPath();
    ctx.env = env;
    ctx.prettyJson = env.value(QStringLiteral("JIRACTL_JSON_PRETTY")).trimmed() == QLatin1String("1");
    return ctx;
}

QString ConfigService::trimTrailingSlash(QString s)
{
    while (s.endsWith('/')) s.chop(1);
    return s;
}

QString ConfigService::defaultPath()
{
    const auto root = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(root).filePath(QStringLiteral("jiractl/config.json"));
}

std::optional<JiraConfig> ConfigService::load(const QString& path, JiraError* error)
{
    QFile f(path);
    if (!f.exists())
    {
        qCDebug(lcConfig) << "no config at" << path;
        return JiraConfig{};
    }
    if (!f.open(QIODevice::ReadOnly))
    {
        ErrorService::fail(error, JiraError::Kind::Config, "LoadConfig",
                           QStringLiteral("cannot read %1: %2").arg(path, f.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        ErrorService::fail(error, JiraError::Kind::Config, "LoadConfig",
                           QStringLiteral("invalid config %1: %2").arg(path, parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool ConfigService::save(const JiraConfig& cfg, const QString& path, JiraError* error)
{
    const QFileInfo info(path);
    QDir dir = info.absoluteDir();
    if (!dir.exists())
    {
        if (!dir.mkpath(QStringLiteral(".")))
            return ErrorService::fail(error, JiraError::Kind::Config, "SaveConfig",
                                      QStringLiteral("cannot create %1").arg(dir.path()));
        if (!QFile::setPermissions(dir.path(), QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner))
            qCWarning(lcConfig) << "cannot restrict permissions of" << dir.path();
    }

    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly))
    {
        return ErrorService::fail(error, JiraError::Kind::Config, "SaveConfig",
                                  QStringLiteral("cannot write %1: %2").arg(path, out.errorString()));
    }

    const QJsonDocument doc(toJson(cfg));
    out.write(doc.toJson(QJsonDocument::Indented));
    if (!out.commit())
    {
        return ErrorService::fail(error, JiraError::Kind::Config, "SaveConfig",
                                  QStringLiteral("cannot write %1: %2").arg(path, out.errorString()));
    }

    // The file holds an API token.
    if (!QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner))
        qCWarning(lcConfig) << "cannot restrict permissions of" << path;
    qCDebug(lcConfig) << "saved config to" << path;
    return true;
}

bool ConfigService::remove(const QString& path, bool* removed, JiraError* error)
{
    if (removed) *removed = false;

    QFile f(path);
    if (!f.exists())
        return true;

    if (!f.remove())
    {
        return ErrorService::fail(error, JiraError::Kind::Config, "RemoveConfig",
                                  QStringLiteral("cannot remove %1: %2").arg(path, f.errorString()));
    }
    if (removed) *removed = true;
    return true;
}

JiraConfig ConfigService::applyEnvironment(JiraConfig cfg, const QProcessEnvironment& env)
{
    const auto server = env.value(QStringLiteral("JIRACTL_SERVER"));
    const auto email = env.value(QStringLiteral("JIRACTL_EMAIL"));
    const auto token = env.value(QStringLiteral("JIRACTL_API_TOKEN"));

    if (!server.isEmpty()) cfg.server = server;
    if (!email.isEmpty()) cfg.email = email;
    if (!token.isEmpty()) cfg.apiToken = token;
    return cfg;
}

std::optional<JiraConfig> ConfigService::resolve(const QString& path, const QProcessEnvironment& env,
                                                 JiraError* error)
{
    const auto stored = load(path, error);
    if (!stored.has_value())
        return std::nullopt;

    auto cfg = applyEnvironment(*stored, env);
    if (!cfg.isComplete())
    {
        ErrorService::fail(error, JiraError::Kind::Config, "ResolveConfig",
                           "not authenticated; run: jiractl auth login --server URL --email EMAIL");
        return std::nullopt;
    }

    cfg.server = trimTrailingSlash(cfg.server);
    return cfg;
}
