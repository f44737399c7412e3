/*
 * headervalidator.h — Check that a section opens with "@if (...) {"
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_HEADERVALIDATOR_H
#define RAZORLINT_HEADERVALIDATOR_H

#include <QString>

namespace HeaderValidator {

// Offset of the first character after a leading BOM, whitespace and any
// run of <!-- --> (including <!-- REGION: Name.Start --> markers) and
// @* *@ comment blocks.
int skipBoilerplate(const QString &text);

// True when the text after the boilerplate matches @if\s*\([^)]*\)\s*\{.
// The condition may not contain a literal ')'.
bool startsWithIfBlock(const QString &text);

} // namespace HeaderValidator

#endif // RAZORLINT_HEADERVALIDATOR_H
