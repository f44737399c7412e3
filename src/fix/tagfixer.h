/*
 * tagfixer.h — Repair unbalanced markup tags
 *
 * Re-tokenizes the markup view with its own stack:
 *  - a closing tag met with an empty stack is deleted, but only when it
 *    sits alone on its line (a stray closer sharing a line with other
 *    content is left for the user)
 *  - every element still open at end of file gets its closing tag
 *    appended, innermost first
 *
 * Running the fixer on its own output changes nothing.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_TAGFIXER_H
#define RAZORLINT_TAGFIXER_H

#include <QString>

#include "fixresult.h"
#include "tagauditor.h"

class TagFixer
{
public:
    TagFixer() = default;
    explicit TagFixer(const TagAuditor &auditor);

    // The post-fix audit is stored in *afterAudit when given.
    FixResult fix(const QString &text, TagAuditResult *afterAudit = nullptr) const;

private:
    TagAuditor m_auditor;
};

#endif // RAZORLINT_TAGFIXER_H
