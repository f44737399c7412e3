/*
 * indenter.cpp — Re-derive indentation from braces and block-level tags
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "indenter.h"
#include "textlines.h"

Indenter::Indenter()
{
    buildPatterns(defaultBlockTags());
}

Indenter::Indenter(const QStringList &blockTags, int indentWidth)
    : m_indentWidth(indentWidth)
{
    buildPatterns(blockTags);
}

QStringList Indenter::defaultBlockTags()
{
    return {
        QStringLiteral("div"), QStringLiteral("section"), QStringLiteral("main"),
        QStringLiteral("header"), QStringLiteral("footer"), QStringLiteral("article"),
        QStringLiteral("nav"), QStringLiteral("ul"), QStringLiteral("ol"),
        QStringLiteral("li"), QStringLiteral("table"), QStringLiteral("tbody"),
        QStringLiteral("thead"), QStringLiteral("tr"), QStringLiteral("td"),
        QStringLiteral("th"),
    };
}

void Indenter::buildPatterns(const QStringList &blockTags)
{
    QStringList escaped;
    escaped.reserve(blockTags.size());
    for (const QString &tag : blockTags)
        escaped.append(QRegularExpression::escape(tag));
    const QString names = escaped.join(QLatin1Char('|'));

    m_openTagRx = QRegularExpression(QStringLiteral(R"(<\s*(%1)(\s|>))").arg(names),
                                     QRegularExpression::CaseInsensitiveOption);
    m_closeTagRx = QRegularExpression(QStringLiteral(R"(</\s*(%1)\s*>)").arg(names),
                                      QRegularExpression::CaseInsensitiveOption);
}

QString Indenter::reindent(const QString &text) const
{
    static const QRegularExpression selfClosedRx(QStringLiteral(R"(<[^>]+/>\s*$)"));

    QStringList lines = TextLines::split(text);
    // A trailing newline is re-added below, not emitted as an extra line
    if (lines.size() > 1 && lines.last().isEmpty())
        lines.removeLast();

    QString result;
    result.reserve(text.size() + 1024);
    int level = 0;

    for (const QString &raw : lines) {
        const QString trimmed = TextLines::leftTrimmed(raw);

        if (trimmed.contains(QLatin1Char('}')))
            level = qMax(0, level - 1);
        if (m_closeTagRx.match(trimmed).hasMatch())
            level = qMax(0, level - 1);

        // Whitespace-only lines are written empty
        if (!trimmed.trimmed().isEmpty()) {
            result += QString(level * m_indentWidth, QLatin1Char(' '));
            result += trimmed;
        }
        result += QLatin1Char('\n');

        if (trimmed.contains(QLatin1Char('{')))
            ++level;
        if (m_openTagRx.match(trimmed).hasMatch() && !selfClosedRx.match(trimmed).hasMatch())
            ++level;
    }

    return result;
}
