/*
 * sectionextractor.h — Cut a layout section out of a monolithic template
 *
 * A section starts at the first start anchor found, runs past its end
 * anchor and finishes at the first closing-structure pattern that matches
 * after that anchor.  The cut text must open with "@if (...) {" and have
 * balanced braces; missing closers may be appended (autofixBraces) and
 * surplus closers are trimmed when they all sit at the very end.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_SECTIONEXTRACTOR_H
#define RAZORLINT_SECTIONEXTRACTOR_H

#include <QString>
#include <QStringList>

#include "braceauditor.h"
#include "lintconfig.h"

namespace SectionExtractor {

struct Result {
    QString text;            // the extracted (and possibly brace-fixed) section
    bool valid = true;
    QString errorMessage;    // non-empty if invalid
    QStringList notes;       // fixes applied along the way
};

Result extract(const QString &monolith, const SectionSpec &spec,
               const BraceAuditor &auditor = BraceAuditor());

} // namespace SectionExtractor

#endif // RAZORLINT_SECTIONEXTRACTOR_H
