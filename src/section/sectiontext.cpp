/*
 * sectiontext.cpp — Text normalisation used when comparing layout sections
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectiontext.h"
#include "textlines.h"

#include <QRegularExpression>
#include <QStringList>

namespace SectionText {

Span findWhitespaceInsensitive(const QString &hay, const QString &snippet, int from)
{
    static const QRegularExpression wsRx(QStringLiteral(R"(\s+)"));

    Span span;
    const QString snip = TextLines::normalizeNewlines(snippet);
    if (snip.isEmpty())
        return span;

    // Leading/trailing whitespace keeps an (empty) part, so it still
    // requires whitespace in the hay
    const QStringList parts = snip.split(wsRx);
    QStringList escaped;
    escaped.reserve(parts.size());
    for (const QString &part : parts)
        escaped.append(QRegularExpression::escape(part));

    const QRegularExpression rx(escaped.join(QStringLiteral(R"(\s+)")));
    const QRegularExpressionMatch match = rx.match(TextLines::normalizeNewlines(hay), from);
    if (match.hasMatch()) {
        span.start = match.capturedStart();
        span.end = match.capturedEnd();
    }
    return span;
}

QString stripRegionWrappers(const QString &text)
{
    static const QRegularExpression regionRx(
        QStringLiteral(R"(<!--\s*REGION:\s*\w+\.(Start|End)\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);

    QString result = text;
    result.remove(regionRx);
    return result;
}

// Index of the first line after a comment block opened on line `first`
// and closed by `terminator`, or -1 when it is never closed
static int skipCommentBlock(const QStringList &lines, int first, QLatin1String terminator)
{
    for (int j = first; j < lines.size(); ++j) {
        if (lines[j].contains(terminator))
            return j + 1;
    }
    return -1;
}

static int skipBlankLines(const QStringList &lines, int i)
{
    while (i < lines.size() && lines[i].trimmed().isEmpty())
        ++i;
    return i;
}

QString stripLeadingNoise(const QString &text)
{
    QString s = TextLines::normalizeNewlines(text);
    if (s.startsWith(QChar(0xFEFF)))
        s.remove(0, 1);

    const QStringList lines = s.split(QLatin1Char('\n'));
    int i = skipBlankLines(lines, 0);

    while (i < lines.size()) {
        const QString line = TextLines::leftTrimmed(lines[i]);
        int next = -1;
        if (line.startsWith(QLatin1String("<!--")))
            next = skipCommentBlock(lines, i, QLatin1String("-->"));
        else if (line.startsWith(QLatin1String("@*")))
            next = skipCommentBlock(lines, i, QLatin1String("*@"));

        if (next < 0)
            break;
        i = skipBlankLines(lines, next);
    }

    return lines.mid(i).join(QLatin1Char('\n'));
}

QString normalizeWhitespace(const QString &text)
{
    return text.simplified();
}

} // namespace SectionText
