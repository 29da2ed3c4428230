#pragma once

#include <QString>

class QTextStream;

struct JiraError
{
    enum class Kind
    {
        None,
        Transport,
        Auth,
        Decode,
        EmptyQuery,
        NoMatch,
        NotFound,
        Config,
        Usage,
    };

    Kind kind{Kind::None};
    QString context;
    QString message;

    bool isError() const { return kind != Kind::None; }
};

class ErrorService
{
public:
    // Fills *error when error is non-null. Always returns false so callers can
    // write `return ErrorService::fail(...)`.
    static bool fail(JiraError* error, JiraError::Kind kind, const QString& context, const QString& message);

    static QString kindName(JiraError::Kind kind);

    // "error: <message>" / "warning: <message>", one line each.
    static void showError(const JiraError& error, QTextStream& err);
    static void showWarning(const QString& message, QTextStream& err);
};
