/*
 * sectiontext.h — Text normalisation used when comparing layout sections
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_SECTIONTEXT_H
#define RAZORLINT_SECTIONTEXT_H

#include <QString>

namespace SectionText {

struct Span {
    int start = -1;
    int end = -1;

    bool isValid() const { return start >= 0; }
};

// Find snippet in hay at or after `from`, where any whitespace run in the
// snippet matches any non-empty whitespace run in hay.
Span findWhitespaceInsensitive(const QString &hay, const QString &snippet, int from = 0);

// Remove <!-- REGION: Name.Start --> / <!-- REGION: Name.End --> markers.
QString stripRegionWrappers(const QString &text);

// Drop a BOM, leading blank lines and leading <!-- --> / @* *@ blocks.
// Works on whole lines: a comment block removes every line up to the one
// holding its terminator.
QString stripLeadingNoise(const QString &text);

// Collapse every whitespace run to a single space and trim the ends.
QString normalizeWhitespace(const QString &text);

} // namespace SectionText

#endif // RAZORLINT_SECTIONTEXT_H
