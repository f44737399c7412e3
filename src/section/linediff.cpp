/*
 * linediff.cpp — Line-based unified diff for section mismatch reports
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "linediff.h"

#include <algorithm>

namespace LineDiff {

QList<Op> diff(const QStringList &from, const QStringList &to)
{
    // Common head and tail lines are matched directly; only the middle
    // goes through the LCS table
    int head = 0;
    while (head < from.size() && head < to.size() && from[head] == to[head])
        ++head;
    int tail = 0;
    while (tail < from.size() - head && tail < to.size() - head
           && from[from.size() - 1 - tail] == to[to.size() - 1 - tail])
        ++tail;

    const int n = from.size() - tail;
    const int m = to.size() - tail;
    const qsizetype width = qsizetype(m - head) + 1;

    // lcs[(i - head) * width + (j - head)] = LCS length of from[i..n) and to[j..m)
    QList<int> lcs(qsizetype(n - head + 1) * width, 0);
    auto at = [head, width](int i, int j) { return qsizetype(i - head) * width + (j - head); };
    for (int i = n - 1; i >= head; --i) {
        for (int j = m - 1; j >= head; --j) {
            lcs[at(i, j)] = (from[i] == to[j])
                ? lcs[at(i + 1, j + 1)] + 1
                : std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
        }
    }

    QList<Op> ops;
    for (int k = 0; k < head; ++k)
        ops.append({Op::Equal, k, k, from[k]});

    int i = head;
    int j = head;
    while (i < n || j < m) {
        if (i < n && j < m && from[i] == to[j]) {
            ops.append({Op::Equal, i, j, from[i]});
            ++i;
            ++j;
        } else if (j >= m || (i < n && lcs[at(i + 1, j)] >= lcs[at(i, j + 1)])) {
            ops.append({Op::Delete, i, j, from[i]});
            ++i;
        } else {
            ops.append({Op::Insert, i, j, to[j]});
            ++j;
        }
    }

    for (int k = 0; k < tail; ++k)
        ops.append({Op::Equal, n + k, m + k, from[n + k]});
    return ops;
}

// Range as printed in a hunk header: "start" or "start,length"
static QString formatRange(int start, int length)
{
    int beginning = start + 1;
    if (length == 1)
        return QString::number(beginning);
    if (length == 0)
        --beginning;
    return QStringLiteral("%1,%2").arg(beginning).arg(length);
}

QString unified(const QStringList &from, const QStringList &to,
                const QString &fromLabel, const QString &toLabel, int context)
{
    const QList<Op> ops = diff(from, to);

    QList<int> changes;
    for (int k = 0; k < ops.size(); ++k) {
        if (ops[k].type != Op::Equal)
            changes.append(k);
    }
    if (changes.isEmpty())
        return QString();

    // Group changes whose separating run of equal lines fits in the context
    QList<QPair<int, int>> hunks;
    int first = changes.first();
    int last = first;
    for (int c = 1; c < changes.size(); ++c) {
        if (changes[c] - last - 1 > 2 * context) {
            hunks.append({first, last});
            first = changes[c];
        }
        last = changes[c];
    }
    hunks.append({first, last});

    QStringList out;
    out.append(QStringLiteral("--- %1").arg(fromLabel));
    out.append(QStringLiteral("+++ %1").arg(toLabel));

    for (const auto &hunk : hunks) {
        const int begin = std::max(0, hunk.first - context);
        const int end = std::min(int(ops.size()), hunk.second + context + 1);

        int fromCount = 0;
        int toCount = 0;
        for (int k = begin; k < end; ++k) {
            if (ops[k].type != Op::Insert)
                ++fromCount;
            if (ops[k].type != Op::Delete)
                ++toCount;
        }

        out.append(QStringLiteral("@@ -%1 +%2 @@")
                       .arg(formatRange(ops[begin].fromLine, fromCount),
                            formatRange(ops[begin].toLine, toCount)));

        for (int k = begin; k < end; ++k) {
            const QChar marker = ops[k].type == Op::Equal ? QLatin1Char(' ')
                               : ops[k].type == Op::Delete ? QLatin1Char('-')
                                                           : QLatin1Char('+');
            out.append(marker + ops[k].text);
        }
    }

    return out.join(QLatin1Char('\n'));
}

} // namespace LineDiff
