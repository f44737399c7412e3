/*
 * braceauditor.h — Track Razor code-block brace depth line by line
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_BRACEAUDITOR_H
#define RAZORLINT_BRACEAUDITOR_H

#include <QList>
#include <QString>
#include <QStringList>

#include "lineclassifier.h"

struct DepthStep {
    int line;          // 1-based
    int depthBefore;
    int depthAfter;    // may be negative

    bool operator==(const DepthStep &other) const {
        return line == other.line && depthBefore == other.depthBefore
               && depthAfter == other.depthAfter;
    }
};

struct BraceAuditResult {
    QList<DepthStep> steps;   // one per code-bearing line
    QStringList errors;
    int finalDepth = 0;

    bool isClean() const { return errors.isEmpty(); }
};

class BraceAuditor
{
public:
    BraceAuditor() = default;
    explicit BraceAuditor(const LineClassifier &classifier);

    // Audit an already scrubbed code view.  Every code-bearing line yields
    // a step; a line ending below zero reports an extra closer, and a
    // non-zero final depth reports the overall imbalance.  Depth is never
    // clamped, so both checks are independent.
    BraceAuditResult audit(const QString &codeView) const;

    // Scrub comments from a raw document, then audit it.
    BraceAuditResult auditDocument(const QString &text) const;

    const LineClassifier &classifier() const { return m_classifier; }

private:
    LineClassifier m_classifier;
};

#endif // RAZORLINT_BRACEAUDITOR_H
