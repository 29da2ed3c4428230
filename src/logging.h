#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcHttp)
Q_DECLARE_LOGGING_CATEGORY(lcPaging)
Q_DECLARE_LOGGING_CATEGORY(lcMatch)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

class Logging
{
public:
    // Turns on debug output for every jiractl.* category.
    static void enableVerbose();
};
