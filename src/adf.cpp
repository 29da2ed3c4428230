#include "adf.h"

#include <QHash>
#include <QJsonArray>

AdfNode::Kind AdfNode::kindFromType(const QString& type)
{
    static const QHash<QString, Kind> kinds = {
        {QStringLiteral("doc"), Kind::Doc},
        {QStringLiteral("paragraph"), Kind::Paragraph},
        {QStringLiteral("heading"), Kind::Heading},
        {QStringLiteral("bulletList"), Kind::BulletList},
        {QStringLiteral("orderedList"), Kind::OrderedList},
        {QStringLiteral("listItem"), Kind::ListItem},
        {QStringLiteral("blockquote"), Kind::Blockquote},
        {QStringLiteral("codeBlock"), Kind::CodeBlock},
        {QStringLiteral("mediaSingle"), Kind::MediaSingle},
        {QStringLiteral("rule"), Kind::Rule},
        {QStringLiteral("text"), Kind::Text},
        {QStringLiteral("hardBreak"), Kind::HardBreak},
    };
    return kinds.value(type, Kind::Other);
}

AdfNode AdfNode::fromJson(const QJsonValue& value)
{
    AdfNode node;
    if (!value.isObject()) return node;

    const auto o = value.toObject();
    const auto type = o.value("type");
    if (type.isString())
    {
        node.type = type.toString();
        node.kind = kindFromType(node.type);
    }

    const auto text = o.value("text");
    if (text.isString())
        node.text = text.toString();

    const auto content = o.value("content");
    if (content.isArray())
    {
        for (const auto& child : content.toArray())
        {
            // Non-object children carry nothing we can render.
            if (!child.isObject()) continue;
            node.children.append(fromJson(child));
        }
    }
    return node;
}

bool AdfNode::isBlock() const
{
    switch (kind)
    {
    case Kind::Paragraph:
    case Kind::Heading:
    case Kind::BulletList:
    case Kind::OrderedList:
    case Kind::Blockquote:
    case Kind::CodeBlock:
    case Kind::MediaSingle:
    case Kind::Rule:
        return true;
    default:
        return false;
    }
}

static void extract(const AdfNode& node, QString& out)
{
    if (node.text.has_value())
        out += *node.text;

    if (node.kind == AdfNode::Kind::HardBreak)
        out += '\n';

    const auto count = node.children.size();
    for (qsizetype i = 0; i < count; ++i)
    {
        const auto& child = node.children.at(i);
        extract(child, out);
        if (child.isBlock() && i < count - 1)
            out += '\n';
    }

    // One visual line per list item, however deep the nesting.
    if (node.kind == AdfNode::Kind::ListItem)
        out += '\n';
}

QString Adf::toPlainText(const AdfNode& root)
{
    QString out;
    extract(root, out);
    return out.trimmed();
}

QString Adf::toPlainText(const QJsonValue& adf)
{
    if (adf.isNull() || adf.isUndefined()) return QString();
    if (adf.isString()) return adf.toString();
    if (!adf.isObject()) return QString();
    return toPlainText(AdfNode::fromJson(adf));
}

QJsonObject Adf::buildDocument(const QString& plainText)
{
    const auto parts = plainText.split('\n');

    QJsonArray content;
    for (const auto& p : parts)
    {
        QJsonObject textNode;
        textNode.insert("type", "text");
        textNode.insert("text", p);

        QJsonArray paraContent;
        // Jira rejects empty text nodes.
        if (!p.isEmpty())
            paraContent.append(textNode);

        QJsonObject paragraph;
        paragraph.insert("type", "paragraph");
        paragraph.insert("content", paraContent);

        content.append(paragraph);
    }

    QJsonObject doc;
    doc.insert("type", "doc");
    doc.insert("version", 1);
    doc.insert("content", content);
    return doc;
}
