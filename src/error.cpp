#include "error.h"

#include <QTextStream>

bool ErrorService::fail(JiraError* error, JiraError::Kind kind, const QString& context, const QString& message)
{
    if (error)
    {
        error->kind = kind;
        error->context = context;
        error->message = message;
    }
    return false;
}

QString ErrorService::kindName(JiraError::Kind kind)
{
    switch (kind)
    {
    case JiraError::Kind::None: return QStringLiteral("none");
    case JiraError::Kind::Transport: return QStringLiteral("transport");
    case JiraError::Kind::Auth: return QStringLiteral("auth");
    case JiraError::Kind::Decode: return QStringLiteral("decode");
    case JiraError::Kind::EmptyQuery: return QStringLiteral("empty-query");
    case JiraError::Kind::NoMatch: return QStringLiteral("no-match");
    case JiraError::Kind::NotFound: return QStringLiteral("not-found");
    case JiraError::Kind::Config: return QStringLiteral("config");
    case JiraError::Kind::Usage: return QStringLiteral("usage");
    }
    return QStringLiteral("unknown");
}

void ErrorService::showError(const JiraError& error, QTextStream& err)
{
    err << "error: " << error.message << Qt::endl;
}

void ErrorService::showWarning(const QString& message, QTextStream& err)
{
    err << "warning: " << message << Qt::endl;
}
