/*
 * report.h — Text rendering of audit traces for the console
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_REPORT_H
#define RAZORLINT_REPORT_H

#include <QList>
#include <QString>
#include <QStringList>

#include "braceauditor.h"
#include "tagauditor.h"

namespace Report {

// "    line    12: depth 1 -> 2"
QStringList formatBraceSteps(const QList<DepthStep> &steps);

// "    line    12: open  <div>  depth 1 -> 2"
QStringList formatTagSteps(const QList<TagStep> &steps);

// Prefix every message with `indent` spaces.
QStringList indented(const QStringList &messages, int indent = 2);

} // namespace Report

#endif // RAZORLINT_REPORT_H
