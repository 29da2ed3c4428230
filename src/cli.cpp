#include "cli.h"

#include "error.h"
#include "issue_service.h"
#include "issue_source.h"
#include "jira_json.h"
#include "logging.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QJsonDocument>

#ifndef JIRACTL_VERSION
#define JIRACTL_VERSION "dev"
#endif

namespace
{
const QCommandLineOption kJsonOption(QStringLiteral("json"), QStringLiteral("print JSON"));

bool parseArgs(QCommandLineParser& parser, const QString& command, const QStringList& args, JiraError* error)
{
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    QStringList argv{QStringLiteral("jiractl ") + command};
    argv.append(args);
    if (!parser.parse(argv))
        return ErrorService::fail(error, JiraError::Kind::Usage, command, parser.errorText());
    return true;
}

bool parsePositive(const QString& value, const QString& flag, int* out, JiraError* error)
{
    bool ok = false;
    const int n = value.toInt(&ok);
    if (!ok)
        return ErrorService::fail(error, JiraError::Kind::Usage, flag,
                                  QStringLiteral("invalid value \"%1\" for %2").arg(value, flag));
    if (n <= 0)
        return ErrorService::fail(error, JiraError::Kind::Usage, flag,
                                  QStringLiteral("%1 must be greater than 0").arg(flag));
    *out = n;
    return true;
}

QString firstNonEmpty(const QStringList& values)
{
    for (const auto& v : values)
    {
        if (!v.trimmed().isEmpty())
            return v.trimmed();
    }
    return QString();
}

bool isHelp(const QString& arg)
{
    return arg == QLatin1String("help") || arg == QLatin1String("--help") || arg == QLatin1String("-h");
}
}

Cli::Cli(AppContext ctx, SourceFactory makeSource, QTextStream& out, QTextStream& err)
    : m_ctx(std::move(ctx)), m_makeSource(std::move(makeSource)), m_out(out), m_err(err)
{
}

QString Cli::version()
{
    return QStringLiteral(JIRACTL_VERSION);
}

int Cli::fail(const JiraError& error)
{
    qCDebug(lcCli) << error.context << "failed:" << ErrorService::kindName(error.kind);
    ErrorService::showError(error, m_err);
    return 1;
}

int Cli::run(QStringList args)
{
    if (args.removeAll(QStringLiteral("--verbose")) + args.removeAll(QStringLiteral("-verbose")) > 0)
        Logging::enableVerbose();

    if (args.isEmpty())
    {
        printRootHelp();
        return 0;
    }

    const auto command = args.takeFirst();
    if (command == QLatin1String("auth"))
        return runAuth(args);
    if (command == QLatin1String("issues"))
        return runIssues(args);
    if (command == QLatin1String("version") || command == QLatin1String("--version") || command == QLatin1String("-v"))
    {
        m_out << "jiractl " << version() << Qt::endl;
        return 0;
    }
    if (isHelp(command))
    {
        printRootHelp();
        return 0;
    }

    printRootHelp();
    return fail(JiraError{JiraError::Kind::Usage, "jiractl", QStringLiteral("unknown command \"%1\"").arg(command)});
}

void Cli::printRootHelp()
{
    m_out << "jiractl: Jira Cloud CLI for agents\n"
          << "\n"
          << "Commands:\n"
          << "  auth login    Authenticate with Jira Cloud\n"
          << "  auth status   Show current auth status\n"
          << "  auth logout   Remove stored credentials\n"
          << "  issues mine       List issues assigned to you\n"
          << "  issues view       View a single issue by key\n"
          << "  issues search     Search issues with JQL\n"
          << "  issues transition Change issue status\n"
          << "  issues assign     Reassign an issue\n"
          << "  issues comment    Add a comment to an issue\n"
          << "  version       Print version\n"
          << "  help          Show this help\n"
          << "\n"
          << "Use --json on data commands for agent-friendly output.\n"
          << "Use --verbose to log HTTP and paging details to stderr.\n";
    m_out.flush();
}

void Cli::printAuthHelp()
{
    m_out << "jiractl auth commands:\n"
          << "  auth login   --server URL --email EMAIL [--token TOKEN]\n"
          << "  auth status  [--json]\n"
          << "  auth logout\n";
    m_out.flush();
}

void Cli::printIssuesHelp()
{
    m_out << "jiractl issues commands:\n"
          << "  issues mine       [--limit N] [--status STATUS] [--json]\n"
          << "  issues view       ISSUE-KEY [--comment-limit N] [--json]\n"
          << "  issues search     --jql \"...\" [--limit N] [--json]\n"
          << "  issues transition ISSUE-KEY --status \"STATUS\" [--json]\n"
          << "  issues assign     ISSUE-KEY [--email EMAIL] [--json]\n"
          << "  issues comment    ISSUE-KEY --body \"TEXT\" [--json]\n";
    m_out.flush();
}

void Cli::printJson(const QJsonObject& obj)
{
    const auto format = m_ctx.prettyJson ? QJsonDocument::Indented : QJsonDocument::Compact;
    m_out << QString::fromUtf8(QJsonDocument(obj).toJson(format)).trimmed() << Qt::endl;
}

void Cli::printIssueList(const IssueListView& list, const QString& heading, const QString& emptyText)
{
    if (list.issues.isEmpty())
    {
        m_out << emptyText << Qt::endl;
        return;
    }

    if (list.total > list.count || list.hasMore)
        m_out << QStringLiteral("%1 (%2 of %3):").arg(heading).arg(list.count).arg(list.total) << '\n';
    else
        m_out << QStringLiteral("%1 (%2):").arg(heading).arg(list.count) << '\n';

    for (const auto& v : list.issues)
        m_out << QStringLiteral("- %1  [%2]  %3").arg(v.key, -12).arg(v.status, v.summary) << '\n';
    m_out.flush();
}

// auth

int Cli::runAuth(const QStringList& args)
{
    if (args.isEmpty())
    {
        printAuthHelp();
        return 0;
    }

    const auto sub = args.first();
    const auto rest = args.mid(1);
    if (sub == QLatin1String("login")) return runAuthLogin(rest);
    if (sub == QLatin1String("status")) return runAuthStatus(rest);
    if (sub == QLatin1String("logout")) return runAuthLogout(rest);
    if (isHelp(sub))
    {
        printAuthHelp();
        return 0;
    }

    printAuthHelp();
    return fail(JiraError{JiraError::Kind::Usage, "auth", QStringLiteral("unknown auth command \"%1\"").arg(sub)});
}

int Cli::runAuthLogin(const QStringList& args)
{
    QCommandLineParser parser;
    const QCommandLineOption serverOpt(QStringLiteral("server"),
                                       QStringLiteral("Jira Cloud server URL (e.g. https://company.atlassian.net)"),
                                       QStringLiteral("URL"));
    const QCommandLineOption emailOpt(QStringLiteral("email"), QStringLiteral("Jira account email"),
                                      QStringLiteral("EMAIL"));
    const QCommandLineOption tokenOpt(QStringLiteral("token"), QStringLiteral("Jira API token"),
                                      QStringLiteral("TOKEN"));
    parser.addOptions({serverOpt, emailOpt, tokenOpt});

    JiraError error;
    if (!parseArgs(parser, "auth login", args, &error))
        return fail(error);

    const auto& env = m_ctx.env;
    JiraConfig cfg;
    cfg.server = ConfigService::trimTrailingSlash(
        firstNonEmpty({parser.value(serverOpt), env.value(QStringLiteral("JIRACTL_SERVER"))}));
    if (cfg.server.isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "auth login", "--server is required (or set JIRACTL_SERVER)"});

    cfg.email = firstNonEmpty({parser.value(emailOpt), env.value(QStringLiteral("JIRACTL_EMAIL"))});
    if (cfg.email.isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "auth login", "--email is required (or set JIRACTL_EMAIL)"});

    cfg.apiToken = firstNonEmpty({parser.value(tokenOpt), env.value(QStringLiteral("JIRACTL_API_TOKEN"))});
    if (cfg.apiToken.isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "auth login", "--token is required (or set JIRACTL_API_TOKEN)"});

    // Verify the credentials before anything is written.
    auto source = m_makeSource(cfg);
    const auto user = source->myself(&error);
    if (!user.has_value())
    {
        error.message = QStringLiteral("auth verification failed: %1").arg(error.message);
        return fail(error);
    }

    if (!ConfigService::save(cfg, m_ctx.configPath, &error))
        return fail(error);

    m_out << QStringLiteral("Authenticated as %1 (%2) on %3").arg(user->displayName, cfg.email, cfg.server)
          << Qt::endl;
    return 0;
}

int Cli::runAuthStatus(const QStringList& args)
{
    QCommandLineParser parser;
    parser.addOption(kJsonOption);

    JiraError error;
    if (!parseArgs(parser, "auth status", args, &error))
        return fail(error);

    const auto cfg = ConfigService::resolve(m_ctx.configPath, m_ctx.env, &error);
    if (!cfg.has_value())
        return fail(error);

    if (parser.isSet(kJsonOption))
    {
        QJsonObject out;
        out.insert("authenticated", true);
        out.insert("server", cfg->server);
        out.insert("email", cfg->email);
        printJson(out);
        return 0;
    }

    m_out << "Authenticated: yes\n"
          << "Server:        " << cfg->server << '\n'
          << "Email:         " << cfg->email << Qt::endl;
    return 0;
}

int Cli::runAuthLogout(const QStringList& args)
{
    QCommandLineParser parser;
    JiraError error;
    if (!parseArgs(parser, "auth logout", args, &error))
        return fail(error);

    bool removed = false;
    if (!ConfigService::remove(m_ctx.configPath, &removed, &error))
        return fail(error);

    m_out << (removed ? "Logged out. Config removed." : "Already logged out.") << Qt::endl;
    return 0;
}

// issues

int Cli::runIssues(const QStringList& args)
{
    if (args.isEmpty())
    {
        printIssuesHelp();
        return 0;
    }

    const auto sub = args.first();
    const auto rest = args.mid(1);
    if (sub == QLatin1String("mine") || sub == QLatin1String("search")) return runIssuesList(sub, rest);
    if (sub == QLatin1String("view")) return runIssuesView(rest);
    if (sub == QLatin1String("transition")) return runIssuesTransition(rest);
    if (sub == QLatin1String("assign")) return runIssuesAssign(rest);
    if (sub == QLatin1String("comment")) return runIssuesComment(rest);
    if (isHelp(sub))
    {
        printIssuesHelp();
        return 0;
    }

    printIssuesHelp();
    return fail(JiraError{JiraError::Kind::Usage, "issues", QStringLiteral("unknown issues command \"%1\"").arg(sub)});
}

int Cli::runIssuesList(const QString& command, const QStringList& args)
{
    const bool mine = command == QLatin1String("mine");

    QCommandLineParser parser;
    const QCommandLineOption limitOpt(QStringLiteral("limit"), QStringLiteral("max issues to return"),
                                      QStringLiteral("N"), QString::number(IssueService::kDefaultLimit));
    const QCommandLineOption statusOpt(QStringLiteral("status"),
                                       QStringLiteral("filter by status (e.g. \"In Progress\")"),
                                       QStringLiteral("STATUS"));
    const QCommandLineOption jqlOpt(QStringLiteral("jql"), QStringLiteral("JQL query string"), QStringLiteral("JQL"));
    parser.addOption(limitOpt);
    parser.addOption(mine ? statusOpt : jqlOpt);
    parser.addOption(kJsonOption);

    JiraError error;
    if (!parseArgs(parser, "issues " + command, args, &error))
        return fail(error);

    if (!mine && parser.value(jqlOpt).isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "issues search",
                              "--jql is required (e.g. --jql \"project = PROJ\")"});

    int limit = 0;
    if (!parsePositive(parser.value(limitOpt), "--limit", &limit, &error))
        return fail(error);

    const auto cfg = ConfigService::resolve(m_ctx.configPath, m_ctx.env, &error);
    if (!cfg.has_value())
        return fail(error);

    auto source = m_makeSource(*cfg);
    IssueService service(source.get(), cfg->server);
    const auto list = mine ? service.mine(limit, parser.value(statusOpt), &error)
                           : service.search(parser.value(jqlOpt), limit, &error);
    if (!list.has_value())
        return fail(error);

    if (parser.isSet(kJsonOption))
    {
        printJson(JiraJson::toJson(*list));
        return 0;
    }

    if (mine)
        printIssueList(*list, QStringLiteral("Assigned issues"), QStringLiteral("No issues assigned to you."));
    else
        printIssueList(*list, QStringLiteral("Issues"), QStringLiteral("No issues found."));
    return 0;
}

int Cli::runIssuesView(const QStringList& args)
{
    QCommandLineParser parser;
    const QCommandLineOption commentLimitOpt(QStringLiteral("comment-limit"),
                                             QStringLiteral("max comments to return"), QStringLiteral("N"),
                                             QString::number(IssueService::kDefaultCommentLimit));
    parser.addOption(commentLimitOpt);
    parser.addOption(kJsonOption);

    JiraError error;
    if (!parseArgs(parser, "issues view", args, &error))
        return fail(error);

    int commentLimit = 0;
    if (!parsePositive(parser.value(commentLimitOpt), "--comment-limit", &commentLimit, &error))
        return fail(error);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "issues view",
                              "issue key is required (e.g. jiractl issues view PROJ-123)"});

    const auto cfg = ConfigService::resolve(m_ctx.configPath, m_ctx.env, &error);
    if (!cfg.has_value())
        return fail(error);

    auto source = m_makeSource(*cfg);
    IssueService service(source.get(), cfg->server);
    const auto view = service.view(positional.first(), commentLimit, &error);
    if (!view.has_value())
        return fail(error);

    if (parser.isSet(kJsonOption))
    {
        printJson(JiraJson::toJson(*view));
        return 0;
    }

    const auto& v = view->issue;
    m_out << "Key:         " << v.key << '\n'
          << "Summary:     " << v.summary << '\n'
          << "Status:      " << v.status << '\n'
          << "Type:        " << v.type << '\n'
          << "Priority:    " << v.priority << '\n'
          << "Assignee:    " << v.assignee << '\n'
          << "Created:     " << v.created << '\n'
          << "Updated:     " << v.updated << '\n'
          << "URL:         " << v.url << '\n';
    if (!view->description.isEmpty())
        m_out << "\nDescription:\n" << view->description << '\n';
    if (!view->comments.isEmpty())
    {
        m_out << "\nComments (" << view->comments.size() << "):\n";
        for (const auto& c : view->comments)
            m_out << "\n  " << c.author << " (" << c.created << "):\n  " << c.body << '\n';
    }
    m_out.flush();
    return 0;
}

int Cli::runIssuesTransition(const QStringList& args)
{
    QCommandLineParser parser;
    const QCommandLineOption statusOpt(QStringLiteral("status"), QStringLiteral("target status name (required)"),
                                       QStringLiteral("STATUS"));
    parser.addOption(statusOpt);
    parser.addOption(kJsonOption);

    JiraError error;
    if (!parseArgs(parser, "issues transition", args, &error))
        return fail(error);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "issues transition",
                              "issue key is required (e.g. jiractl issues transition PROJ-123 --status \"In Progress\")"});
    if (parser.value(statusOpt).trimmed().isEmpty())
        return fail(JiraError{JiraError::Kind::EmptyQuery, "issues transition",
                              "--status is required (e.g. --status \"In Progress\")"});

    const auto cfg = ConfigService::resolve(m_ctx.configPath, m_ctx.env, &error);
    if (!cfg.has_value())
        return fail(error);

    auto source = m_makeSource(*cfg);
    IssueService service(source.get(), cfg->server);
    const auto result = service.transition(positional.first(), parser.value(statusOpt), &error);
    if (!result.has_value())
        return fail(error);

    if (parser.isSet(kJsonOption))
    {
        printJson(JiraJson::toJson(*result));
        return 0;
    }

    if (!result->warning.isEmpty())
        ErrorService::showWarning(result->warning, m_err);
    m_out << result->key << " transitioned to " << result->status << Qt::endl;
    return 0;
}

int Cli::runIssuesAssign(const QStringList& args)
{
    QCommandLineParser parser;
    const QCommandLineOption emailOpt(QStringLiteral("email"), QStringLiteral("assignee email (defaults to reporter)"),
                                      QStringLiteral("EMAIL"));
    parser.addOption(emailOpt);
    parser.addOption(kJsonOption);

    JiraError error;
    if (!parseArgs(parser, "issues assign", args, &error))
        return fail(error);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "issues assign",
                              "issue key is required (e.g. jiractl issues assign PROJ-123)"});

    const auto cfg = ConfigService::resolve(m_ctx.configPath, m_ctx.env, &error);
    if (!cfg.has_value())
        return fail(error);

    auto source = m_makeSource(*cfg);
    IssueService service(source.get(), cfg->server);
    const auto result = service.assign(positional.first(), parser.value(emailOpt), &error);
    if (!result.has_value())
        return fail(error);

    if (parser.isSet(kJsonOption))
    {
        printJson(JiraJson::toJson(*result));
        return 0;
    }

    if (!result->assigneeName.isEmpty() && !result->assignee.isEmpty())
        m_out << result->key << " assigned to " << result->assigneeName << " (" << result->assignee << ")" << Qt::endl;
    else if (!result->assigneeName.isEmpty())
        m_out << result->key << " assigned to " << result->assigneeName << Qt::endl;
    else
        m_out << result->key << " assigned to " << result->assignee << Qt::endl;
    return 0;
}

int Cli::runIssuesComment(const QStringList& args)
{
    QCommandLineParser parser;
    const QCommandLineOption bodyOpt(QStringLiteral("body"), QStringLiteral("comment text (required)"),
                                     QStringLiteral("TEXT"));
    parser.addOption(bodyOpt);
    parser.addOption(kJsonOption);

    JiraError error;
    if (!parseArgs(parser, "issues comment", args, &error))
        return fail(error);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "issues comment",
                              "issue key is required (e.g. jiractl issues comment PROJ-123 --body \"text\")"});
    if (parser.value(bodyOpt).isEmpty())
        return fail(JiraError{JiraError::Kind::Usage, "issues comment", "--body is required"});

    const auto cfg = ConfigService::resolve(m_ctx.configPath, m_ctx.env, &error);
    if (!cfg.has_value())
        return fail(error);

    auto source = m_makeSource(*cfg);
    IssueService service(source.get(), cfg->server);
    const auto result = service.comment(positional.first(), parser.value(bodyOpt), &error);
    if (!result.has_value())
        return fail(error);

    if (parser.isSet(kJsonOption))
    {
        printJson(JiraJson::toJson(*result));
        return 0;
    }

    m_out << "Comment added to " << result->key << Qt::endl;
    return 0;
}
