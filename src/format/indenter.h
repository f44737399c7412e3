/*
 * indenter.h — Re-derive indentation from braces and block-level tags
 *
 * A coarse per-line heuristic, not a formatter: a line containing '}' or
 * a closing block tag is outdented one level before it is written, and a
 * line containing '{' or an opening (not self-closed) block tag indents
 * the lines after it.  Each condition counts once per line no matter how
 * many braces or tags it holds.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_INDENTER_H
#define RAZORLINT_INDENTER_H

#include <QRegularExpression>
#include <QString>
#include <QStringList>

class Indenter
{
public:
    Indenter();
    explicit Indenter(const QStringList &blockTags, int indentWidth = 2);

    QString reindent(const QString &text) const;

    int indentWidth() const { return m_indentWidth; }

    static QStringList defaultBlockTags();

private:
    void buildPatterns(const QStringList &blockTags);

    QRegularExpression m_openTagRx;
    QRegularExpression m_closeTagRx;
    int m_indentWidth = 2;
};

#endif // RAZORLINT_INDENTER_H
