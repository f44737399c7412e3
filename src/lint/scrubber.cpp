/*
 * scrubber.cpp — Derive audit views from a Razor template
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "scrubber.h"

#include <QList>
#include <QRegularExpression>

namespace Scrubber {

// Newlines contained in text[start, start+length)
static QString newlinesIn(const QString &text, int start, int length)
{
    const int count = QStringView(text).mid(start, length).count(QLatin1Char('\n'));
    return QString(count, QLatin1Char('\n'));
}

// Blank every match of rx, scanning left to right
static QString blankMatches(const QString &text, const QRegularExpression &rx)
{
    QString result;
    result.reserve(text.size());

    int copied = 0;
    auto it = rx.globalMatch(text);
    while (it.hasNext()) {
        auto match = it.next();
        const int start = match.capturedStart();
        const int len = match.capturedLength();
        result += QStringView(text).mid(copied, start - copied);
        result += newlinesIn(text, start, len);
        copied = start + len;
    }

    if (copied == 0)
        return text;
    result += QStringView(text).mid(copied);
    return result;
}

// Position of the close delimiter matching each open delimiter, or -1.
static QList<int> matchDelimiters(const QString &text, QChar open, QChar close)
{
    QList<int> matches(text.size(), -1);
    QList<int> pending;
    for (int i = 0; i < text.size(); ++i) {
        if (text[i] == open)
            pending.append(i);
        else if (text[i] == close && !pending.isEmpty())
            matches[pending.takeLast()] = i;
    }
    return matches;
}

// Blank constructs that begin with opener (whose last character is the
// open delimiter) and extend to the matching close delimiter.  An opener
// without a matching closer is kept.
static QString blankBalanced(const QString &text, const QRegularExpression &opener,
                             QChar open, QChar close)
{
    QList<int> matches;
    QString result;
    result.reserve(text.size());

    int copied = 0;
    int searchFrom = 0;
    while (searchFrom < text.size()) {
        QRegularExpressionMatch match = opener.match(text, searchFrom);
        if (!match.hasMatch())
            break;
        if (matches.isEmpty())
            matches = matchDelimiters(text, open, close);

        const int start = match.capturedStart();
        const int closeAt = matches[match.capturedEnd() - 1];
        if (closeAt < 0) {
            // Unterminated: leave it and keep looking after the opener
            searchFrom = match.capturedEnd();
            continue;
        }

        const int end = closeAt + 1;
        result += QStringView(text).mid(copied, start - copied);
        result += newlinesIn(text, start, end - start);
        copied = end;
        searchFrom = end;
    }

    if (copied == 0)
        return text;
    result += QStringView(text).mid(copied);
    return result;
}

// Blank "//" comments to the end of their line.  A "//" inside a "..."
// or '...' run on the same line (a URL in a string or attribute) is not
// a comment.
static QString blankLineComments(const QString &text)
{
    QString result = text;
    QChar quote;
    bool changed = false;

    for (int i = 0; i < result.size(); ++i) {
        const QChar ch = result[i];
        if (ch == QLatin1Char('\n')) {
            quote = QChar();
            continue;
        }
        if (!quote.isNull()) {
            if (ch == QLatin1Char('\\') && i + 1 < result.size() && result[i + 1] != QLatin1Char('\n'))
                ++i;
            else if (ch == quote)
                quote = QChar();
            continue;
        }
        if (ch == QLatin1Char('"') || ch == QLatin1Char('\'')) {
            quote = ch;
            continue;
        }
        if (ch == QLatin1Char('/') && i + 1 < result.size() && result[i + 1] == QLatin1Char('/')) {
            int end = result.indexOf(QLatin1Char('\n'), i);
            if (end < 0)
                end = result.size();
            result.remove(i, end - i);
            changed = true;
        }
    }

    return changed ? result : text;
}

QString blank(const QString &text, int start, int length)
{
    if (start < 0 || length <= 0 || start >= text.size())
        return text;
    length = qMin(length, int(text.size()) - start);

    QString result = text.left(start);
    result += newlinesIn(text, start, length);
    result += QStringView(text).mid(start + length);
    return result;
}

QString stripRazorComments(const QString &text)
{
    static const QRegularExpression razorCommentRx(
        QStringLiteral(R"(@\*.*?\*@)"),
        QRegularExpression::DotMatchesEverythingOption);
    return blankMatches(text, razorCommentRx);
}

QString stripComments(const QString &text)
{
    static const QRegularExpression htmlCommentRx(
        QStringLiteral(R"(<!--.*?-->)"),
        QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression blockCommentRx(
        QStringLiteral(R"(/\*.*?\*/)"),
        QRegularExpression::DotMatchesEverythingOption);

    QString scrubbed = stripRazorComments(text);
    scrubbed = blankMatches(scrubbed, htmlCommentRx);
    scrubbed = blankMatches(scrubbed, blockCommentRx);
    scrubbed = blankLineComments(scrubbed);
    return scrubbed;
}

QString stripCodeBlocks(const QString &text)
{
    // @code { ... } first, otherwise the identifier pass would eat "@code"
    // and leave the block body behind as markup.
    static const QRegularExpression codeBlockRx(QStringLiteral(R"(@code\s*\{)"));
    static const QRegularExpression inlineBlockRx(QStringLiteral(R"(@\{)"));

    QString scrubbed = blankBalanced(text, codeBlockRx, QLatin1Char('{'), QLatin1Char('}'));
    return blankBalanced(scrubbed, inlineBlockRx, QLatin1Char('{'), QLatin1Char('}'));
}

QString stripExpressions(const QString &text)
{
    static const QRegularExpression exprRx(QStringLiteral(R"(@\()"));
    return blankBalanced(text, exprRx, QLatin1Char('('), QLatin1Char(')'));
}

QString stripIdentifiers(const QString &text)
{
    static const QRegularExpression identRx(
        QStringLiteral(R"(@[A-Za-z_][A-Za-z0-9_]*(?:\.[A-Za-z_][A-Za-z0-9_]*)*)"));
    return blankMatches(text, identRx);
}

QString stripForMarkup(const QString &text)
{
    QString scrubbed = stripRazorComments(text);
    scrubbed = stripCodeBlocks(scrubbed);
    scrubbed = stripExpressions(scrubbed);
    return stripIdentifiers(scrubbed);
}

} // namespace Scrubber
