/*
 * sectioncomparator.h — Compare an extracted section with its split file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_SECTIONCOMPARATOR_H
#define RAZORLINT_SECTIONCOMPARATOR_H

#include <QString>

namespace SectionComparator {

struct Comparison {
    bool equal = false;
    QString diff;   // unified diff of the noise-stripped texts, empty when equal
};

// REGION markers are removed from `actual` only; leading noise is removed
// from both sides.  The texts are equal when they match after collapsing
// whitespace.
Comparison compare(const QString &expected, const QString &actual,
                   const QString &actualLabel);

} // namespace SectionComparator

#endif // RAZORLINT_SECTIONCOMPARATOR_H
