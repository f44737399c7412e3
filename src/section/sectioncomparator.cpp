/*
 * sectioncomparator.cpp — Compare an extracted section with its split file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectioncomparator.h"
#include "linediff.h"
#include "sectiontext.h"
#include "textlines.h"

namespace SectionComparator {

Comparison compare(const QString &expected, const QString &actual,
                   const QString &actualLabel)
{
    const QString exp = SectionText::stripLeadingNoise(expected);
    const QString got = SectionText::stripLeadingNoise(
        SectionText::stripRegionWrappers(TextLines::normalizeNewlines(actual)));

    Comparison comparison;
    comparison.equal = SectionText::normalizeWhitespace(exp)
                       == SectionText::normalizeWhitespace(got);
    if (!comparison.equal) {
        comparison.diff = LineDiff::unified(exp.split(QLatin1Char('\n')),
                                            got.split(QLatin1Char('\n')),
                                            QStringLiteral("expected"), actualLabel);
    }
    return comparison;
}

} // namespace SectionComparator
