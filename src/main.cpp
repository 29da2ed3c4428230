#include "cli.h"
#include "config.h"
#include "jira_client.h"

#include <QCoreApplication>
#include <QProcessEnvironment>
#include <QTextStream>

#include <cstdio>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName("jiractl");
    QCoreApplication::setApplicationVersion(Cli::version());

    QTextStream out(stdout);
    QTextStream err(stderr);

    Cli cli(AppContext::fromEnvironment(QProcessEnvironment::systemEnvironment()),
            [](const JiraConfig& cfg) {
                auto client = std::make_unique<JiraClient>();
                client->configure(cfg.server, cfg.email, cfg.apiToken);
                return std::unique_ptr<IssueSource>(std::move(client));
            },
            out, err);

    return cli.run(QCoreApplication::arguments().mid(1));
}
