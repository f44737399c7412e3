/*
 * linediff.h — Line-based unified diff for section mismatch reports
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_LINEDIFF_H
#define RAZORLINT_LINEDIFF_H

#include <QList>
#include <QString>
#include <QStringList>

namespace LineDiff {

struct Op {
    enum Type { Equal, Delete, Insert };
    Type type;
    int fromLine;   // 0-based position in the old text before this op
    int toLine;     // 0-based position in the new text before this op
    QString text;
};

// Shortest edit script between two line lists (longest common subsequence).
QList<Op> diff(const QStringList &from, const QStringList &to);

// "--- / +++ / @@" formatted diff with `context` lines around each change.
// Returns an empty string when the inputs are equal.
QString unified(const QStringList &from, const QStringList &to,
                const QString &fromLabel, const QString &toLabel, int context = 3);

} // namespace LineDiff

#endif // RAZORLINT_LINEDIFF_H
