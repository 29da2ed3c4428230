#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <optional>

// Atlassian Document Format node. Unknown node types map to Kind::Other so
// newer schema additions still contribute their text.
struct AdfNode
{
    enum class Kind
    {
        Doc,
        Paragraph,
        Heading,
        BulletList,
        OrderedList,
        ListItem,
        Blockquote,
        CodeBlock,
        MediaSingle,
        Rule,
        Text,
        HardBreak,
        Other,
    };

    Kind kind{Kind::Other};
    QString type;
    std::optional<QString> text;
    QList<AdfNode> children;

    // Non-object values produce an empty Other node.
    static AdfNode fromJson(const QJsonValue& value);
    static Kind kindFromType(const QString& type);

    bool isBlock() const;
};

class Adf
{
public:
    // Plain-text rendering of a description or comment body. Accepts null, a
    // plain string (returned verbatim) or an ADF object. Never fails.
    static QString toPlainText(const QJsonValue& adf);
    static QString toPlainText(const AdfNode& root);

    // Jira wants ADF for description/comments: one paragraph per input line.
    static QJsonObject buildDocument(const QString& plainText);
};
