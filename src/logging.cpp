#include "logging.h"

Q_LOGGING_CATEGORY(lcHttp, "jiractl.http", QtWarningMsg)
Q_LOGGING_CATEGORY(lcPaging, "jiractl.paging", QtWarningMsg)
Q_LOGGING_CATEGORY(lcMatch, "jiractl.match", QtWarningMsg)
Q_LOGGING_CATEGORY(lcConfig, "jiractl.config", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCli, "jiractl.cli", QtWarningMsg)

void Logging::enableVerbose()
{
    QLoggingCategory::setFilterRules(QStringLiteral("jiractl.*.debug=true\njiractl.*.info=true"));
}
