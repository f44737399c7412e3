/*
 * scrubber.h — Derive audit views from a Razor template
 *
 * Two views are produced from the same raw document:
 *   code view    comments removed, directives and code kept
 *                (input of the brace auditor)
 *   markup view  Razor comments, code blocks, @(...) expressions and
 *                @Identifier references removed, tags kept
 *                (input of the tag auditor)
 *
 * Removed spans are replaced by the newlines they contained, so line N
 * of a view is always line N of the document.  Unterminated constructs
 * are left untouched.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_SCRUBBER_H
#define RAZORLINT_SCRUBBER_H

#include <QString>

namespace Scrubber {

// Replace text[start, start+length) with the newlines it contains.
QString blank(const QString &text, int start, int length);

// Remove <!-- -->, @* *@, /* */ and // comments.
QString stripComments(const QString &text);

// Remove @* *@ comments, @code { } and @{ } blocks, @( ) expressions
// and bare @Identifier[.Identifier]* references.
QString stripForMarkup(const QString &text);

// Building blocks, exposed for the section tools and tests.
QString stripRazorComments(const QString &text);
QString stripCodeBlocks(const QString &text);
QString stripExpressions(const QString &text);
QString stripIdentifiers(const QString &text);

} // namespace Scrubber

#endif // RAZORLINT_SCRUBBER_H
