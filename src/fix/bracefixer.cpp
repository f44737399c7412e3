/*
 * bracefixer.cpp — Repair a code-block brace imbalance
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "bracefixer.h"
#include "scrubber.h"
#include "textlines.h"

BraceFixer::BraceFixer(const BraceAuditor &auditor)
    : m_auditor(auditor)
{
}

FixResult BraceFixer::fix(const QString &text, BraceAuditResult *afterAudit) const
{
    FixResult result;
    const QString normalized = TextLines::normalizeNewlines(text);
    const BraceAuditResult before = m_auditor.auditDocument(normalized);

    QString fixed = normalized;
    if (before.finalDepth > 0)
        fixed = appendClosers(normalized, before.finalDepth, result.actions);
    else if (before.finalDepth < 0)
        fixed = removeClosers(normalized, -before.finalDepth, result.actions);

    result.changed = (fixed != normalized);
    result.text = result.changed ? fixed : text;

    if (afterAudit)
        *afterAudit = result.changed ? m_auditor.auditDocument(fixed) : before;
    return result;
}

QString BraceFixer::appendClosers(const QString &text, int count, QStringList &actions) const
{
    QString fixed = TextLines::rightTrimmed(text);
    for (int i = 0; i < count; ++i) {
        if (!fixed.isEmpty())
            fixed += QLatin1Char('\n');
        fixed += QLatin1Char('}');
    }
    fixed += QLatin1Char('\n');

    actions.append(QStringLiteral("append %1 closing brace(s) at EOF").arg(count));
    return fixed;
}

QString BraceFixer::removeClosers(const QString &text, int count, QStringList &actions) const
{
    QStringList lines = text.split(QLatin1Char('\n'));
    // Same line numbering as the raw text: the code view is newline-preserving
    const QStringList codeLines = Scrubber::stripComments(text).split(QLatin1Char('\n'));

    int removed = 0;
    for (int i = lines.size() - 1; i >= 0 && removed < count; --i) {
        if (i >= codeLines.size() || !m_auditor.classifier().isCode(codeLines[i]))
            continue;

        const QString trimmed = lines[i].trimmed();
        if (trimmed == QLatin1String("}") || trimmed == QLatin1String("};")) {
            lines.removeAt(i);
            actions.append(QStringLiteral("remove bare closer at line %1").arg(i + 1));
            ++removed;
            continue;
        }

        const QString right = TextLines::rightTrimmed(lines[i]);
        if (right.endsWith(QLatin1Char('}'))) {
            // Only the trailing-most brace is taken, whatever else the line holds
            lines[i] = TextLines::rightTrimmed(right.chopped(1));
            actions.append(QStringLiteral("strip trailing '}' from line %1").arg(i + 1));
            ++removed;
        }
    }

    if (removed < count) {
        actions.append(QStringLiteral("removed %1 of %2 surplus closing brace(s); no more candidates")
                           .arg(removed).arg(count));
    }

    return lines.join(QLatin1Char('\n'));
}
