/*
 * lineclassifier.cpp — Decide whether a template line carries brace structure
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "lineclassifier.h"
#include "textlines.h"

LineClassifier::LineClassifier()
    : m_keywords(defaultControlKeywords())
{
}

LineClassifier::LineClassifier(const QStringList &controlKeywords)
    : m_keywords(controlKeywords)
{
}

QStringList LineClassifier::defaultControlKeywords()
{
    // "@for " keeps its trailing space so it does not match "@format..."
    return {
        QStringLiteral("@if"),
        QStringLiteral("@foreach"),
        QStringLiteral("@for "),
        QStringLiteral("@while"),
        QStringLiteral("@switch"),
        QStringLiteral("@code"),
    };
}

LineKind LineClassifier::classify(const QString &line) const
{
    const QString trimmed = TextLines::leftTrimmed(line);
    if (trimmed.isEmpty())
        return LineKind::Blank;

    const QChar first = trimmed.at(0);
    if (first == QLatin1Char('@') || first == QLatin1Char('{') || first == QLatin1Char('}'))
        return LineKind::Code;

    for (const QString &keyword : m_keywords) {
        if (trimmed.contains(keyword))
            return LineKind::Code;
    }

    return LineKind::Markup;
}
