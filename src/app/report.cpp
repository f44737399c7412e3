/*
 * report.cpp — Text rendering of audit traces for the console
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "report.h"

namespace Report {

QStringList formatBraceSteps(const QList<DepthStep> &steps)
{
    QStringList lines;
    lines.reserve(steps.size());
    for (const DepthStep &step : steps) {
        lines.append(QStringLiteral("    line %1: depth %2 -> %3")
                         .arg(step.line, 5).arg(step.depthBefore).arg(step.depthAfter));
    }
    return lines;
}

QStringList formatTagSteps(const QList<TagStep> &steps)
{
    QStringList lines;
    lines.reserve(steps.size());
    for (const TagStep &step : steps) {
        // Pad the kind so the tag column lines up ("open ", "close", "self ")
        const QString kind = TagTokenizer::kindName(step.kind).leftJustified(5, QLatin1Char(' '));
        lines.append(QStringLiteral("    line %1: %2 <%3>  depth %4 -> %5")
                         .arg(step.line, 5)
                         .arg(kind, step.tag)
                         .arg(step.depthBefore)
                         .arg(step.depthAfter));
    }
    return lines;
}

QStringList indented(const QStringList &messages, int indent)
{
    const QString prefix(indent, QLatin1Char(' '));
    QStringList lines;
    lines.reserve(messages.size());
    for (const QString &message : messages)
        lines.append(prefix + message);
    return lines;
}

} // namespace Report
