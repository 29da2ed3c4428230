#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <optional>

#include "error.h"

struct JiraConfig
{
    QString server;
    QString email;
    QString apiToken;

    bool isComplete() const { return !server.isEmpty() && !email.isEmpty() && !apiToken.isEmpty(); }
};

// Everything a command needs from the outside world, resolved once in main()
// and passed down explicitly.
struct AppContext
{
    QString configPath;
    QProcessEnvironment env;
    bool prettyJson{false};

    static AppContext fromEnvironment(const QProcessEnvironment& env);
};

class ConfigService
{
public:
    // <GenericConfigLocation>/jiractl/config.json
    static QString defaultPath();

    // A missing file yields an empty config; a corrupt one is an error.
    static std::optional<JiraConfig> load(const QString& path, JiraError* error = nullptr);
    static bool save(const JiraConfig& cfg, const QString& path, JiraError* error = nullptr);
    // *removed is false when there was no file to delete.
    static bool remove(const QString& path, bool* removed, JiraError* error = nullptr);

    // JIRACTL_SERVER / JIRACTL_EMAIL / JIRACTL_API_TOKEN override stored values.
    static JiraConfig applyEnvironment(JiraConfig cfg, const QProcessEnvironment& env);

    // Stored config + environment, validated for the authenticated commands.
    static std::optional<JiraConfig> resolve(const QString& path, const QProcessEnvironment& env,
                                             JiraError* error = nullptr);

    static QString trimTrailingSlash(QString s);
};
