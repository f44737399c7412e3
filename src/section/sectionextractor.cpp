/*
 * sectionextractor.cpp — Cut a layout section out of a monolithic template
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectionextractor.h"
#include "bracefixer.h"
#include "headervalidator.h"
#include "sectiontext.h"
#include "textlines.h"

#include <QRegularExpression>

namespace SectionExtractor {

static Result failure(const SectionSpec &spec, const QString &message)
{
    Result result;
    result.valid = false;
    result.errorMessage = QStringLiteral("%1: %2").arg(spec.name, message);
    return result;
}

// Trim surplus '}' from the end of the text, at most `count` of them
static QString trimTrailingClosers(const QString &text, int count, int &trimmed)
{
    QString t = TextLines::rightTrimmed(text);
    trimmed = 0;
    while (trimmed < count && t.endsWith(QLatin1Char('}'))) {
        t = TextLines::rightTrimmed(t.chopped(1));
        ++trimmed;
    }
    return t;
}

static Result checkBraces(Result result, const SectionSpec &spec, const BraceAuditor &auditor)
{
    const BraceAuditResult audit = auditor.auditDocument(result.text);
    const int depth = audit.finalDepth;
    if (depth == 0)
        return result;

    if (depth > 0) {
        if (!spec.autofixBraces) {
            return failure(spec, QStringLiteral("brace mismatch (final depth=%1). "
                                                "Enable autofixBraces to append missing '}'")
                                     .arg(depth));
        }
        BraceAuditResult after;
        const FixResult fix = BraceFixer(auditor).fix(result.text, &after);
        if (after.finalDepth != 0) {
            return failure(spec, QStringLiteral("brace auto-fix failed (final depth=%1)")
                                     .arg(after.finalDepth));
        }
        result.text = fix.text;
        result.notes.append(QStringLiteral("appended %1 closing brace(s)").arg(depth));
        return result;
    }

    int trimmed = 0;
    const QString t = trimTrailingClosers(result.text, -depth, trimmed);
    if (trimmed == -depth && auditor.auditDocument(t).finalDepth == 0) {
        result.text = t;
        result.notes.append(QStringLiteral("trimmed %1 surplus closing brace(s)").arg(trimmed));
        return result;
    }
    return failure(spec, QStringLiteral("brace mismatch (final depth=%1). "
                                        "Surplus closers not only at EOF").arg(depth));
}

Result extract(const QString &monolith, const SectionSpec &spec, const BraceAuditor &auditor)
{
    const QString text = TextLines::normalizeNewlines(monolith);

    SectionText::Span start;
    for (const QString &anchor : spec.startAnchors) {
        start = SectionText::findWhitespaceInsensitive(text, anchor);
        if (start.isValid())
            break;
    }
    if (!start.isValid())
        return failure(spec, QStringLiteral("start not found"));

    const SectionText::Span endAnchor =
        SectionText::findWhitespaceInsensitive(text, spec.endAnchor, start.start);
    if (!endAnchor.isValid())
        return failure(spec, QStringLiteral("end anchor not found"));

    int end = -1;
    for (const QString &pattern : spec.closingPatterns) {
        const QRegularExpression rx(pattern, QRegularExpression::DotMatchesEverythingOption);
        const QRegularExpressionMatch match = rx.match(text, endAnchor.end);
        if (match.hasMatch()) {
            end = match.capturedEnd();
            break;
        }
    }
    if (end < 0)
        return failure(spec, QStringLiteral("closing structure not found"));

    Result result;
    result.text = text.mid(start.start, end - start.start);

    if (!HeaderValidator::startsWithIfBlock(result.text))
        return failure(spec, QStringLiteral("start does not match '@if (...) {'"));

    return checkBraces(result, spec, auditor);
}

} // namespace SectionExtractor
