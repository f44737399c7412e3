/*
 * bracefixer.h — Repair a code-block brace imbalance
 *
 * Missing closers are appended at end of file, one "}" per line.
 * Surplus closers are removed walking backwards from the end: a line
 * that is only "}" or "};" is deleted, otherwise the last '}' of a code
 * line ending in '}' is stripped.  Each line gives up at most one brace.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_BRACEFIXER_H
#define RAZORLINT_BRACEFIXER_H

#include <QString>

#include "braceauditor.h"
#include "fixresult.h"

class BraceFixer
{
public:
    BraceFixer() = default;
    explicit BraceFixer(const BraceAuditor &auditor);

    // Fix text and re-audit it.  The post-fix audit is stored in
    // *afterAudit when given; callers judge success by its error list.
    FixResult fix(const QString &text, BraceAuditResult *afterAudit = nullptr) const;

private:
    QString appendClosers(const QString &text, int count, QStringList &actions) const;
    QString removeClosers(const QString &text, int count, QStringList &actions) const;

    BraceAuditor m_auditor;
};

#endif // RAZORLINT_BRACEFIXER_H
