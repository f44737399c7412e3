/*
 * braceauditor.cpp — Track Razor code-block brace depth line by line
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "braceauditor.h"
#include "scrubber.h"
#include "textlines.h"

BraceAuditor::BraceAuditor(const LineClassifier &classifier)
    : m_classifier(classifier)
{
}

BraceAuditResult BraceAuditor::audit(const QString &codeView) const
{
    BraceAuditResult result;
    int depth = 0;

    const QStringList lines = TextLines::split(codeView);
    for (int i = 0; i < lines.size(); ++i) {
        const QString &line = lines[i];
        if (!m_classifier.isCode(line))
            continue;

        const int before = depth;
        for (QChar ch : line) {
            if (ch == QLatin1Char('{'))
                ++depth;
            else if (ch == QLatin1Char('}'))
                --depth;
        }

        result.steps.append({i + 1, before, depth});
        if (depth < 0) {
            result.errors.append(
                QStringLiteral("Line %1: extra closing '}' detected. depth %2 -> %3")
                    .arg(i + 1).arg(before).arg(depth));
        }
    }

    if (depth != 0) {
        result.errors.append(
            QStringLiteral("Brace imbalance: final depth=%1 (0 expected)").arg(depth));
    }

    result.finalDepth = depth;
    return result;
}

BraceAuditResult BraceAuditor::auditDocument(const QString &text) const
{
    return audit(Scrubber::stripComments(TextLines::normalizeNewlines(text)));
}
