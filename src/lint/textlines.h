/*
 * textlines.h — Line addressing helpers shared by the auditors and fixers
 *
 * Every view produced by the scrubber keeps its newlines in place, so a
 * character offset in a view maps to the same 1-based line number as in
 * the original document.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_TEXTLINES_H
#define RAZORLINT_TEXTLINES_H

#include <QList>
#include <QString>
#include <QStringList>

#include <algorithm>

namespace TextLines {

/// Convert CRLF and lone CR line endings to LF.
inline QString normalizeNewlines(const QString &text)
{
    if (!text.contains(QLatin1Char('\r')))
        return text;
    QString result = text;
    result.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    result.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    return result;
}

/// Split normalised text into physical lines (a trailing newline yields
/// a final empty element, like QString::split).
inline QStringList split(const QString &text)
{
    return normalizeNewlines(text).split(QLatin1Char('\n'));
}

inline QString leftTrimmed(const QString &line)
{
    int i = 0;
    while (i < line.size() && line[i].isSpace())
        ++i;
    return line.mid(i);
}

inline QString rightTrimmed(const QString &line)
{
    int end = line.size();
    while (end > 0 && line[end - 1].isSpace())
        --end;
    return line.left(end);
}

/// Offset -> line lookup built once per view.
class LineIndex
{
public:
    explicit LineIndex(const QString &text)
    {
        m_starts.append(0);
        for (int i = 0; i < text.size(); ++i) {
            if (text[i] == QLatin1Char('\n'))
                m_starts.append(i + 1);
        }
    }

    // 1-based line containing the character at offset.
    int lineAt(int offset) const
    {
        auto it = std::upper_bound(m_starts.cbegin(), m_starts.cend(), offset);
        return int(it - m_starts.cbegin());
    }

    int lineCount() const { return m_starts.size(); }

private:
    QList<int> m_starts;
};

} // namespace TextLines

#endif // RAZORLINT_TEXTLINES_H
