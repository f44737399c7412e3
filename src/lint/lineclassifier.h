/*
 * lineclassifier.h — Decide whether a template line carries brace structure
 *
 * The brace auditor only counts braces on lines that look like Razor
 * code; braces on plain markup lines (inline styles, text) are ignored.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_LINECLASSIFIER_H
#define RAZORLINT_LINECLASSIFIER_H

#include <QString>
#include <QStringList>

enum class LineKind { Blank, Markup, Code };

class LineClassifier
{
public:
    LineClassifier();
    explicit LineClassifier(const QStringList &controlKeywords);

    // Code:   left-trimmed content starts with '@', '{' or '}', or contains
    //         one of the control keywords
    // Blank:  whitespace only
    // Markup: anything else
    LineKind classify(const QString &line) const;

    bool isCode(const QString &line) const { return classify(line) == LineKind::Code; }

    const QStringList &controlKeywords() const { return m_keywords; }

    static QStringList defaultControlKeywords();

private:
    QStringList m_keywords;
};

#endif // RAZORLINT_LINECLASSIFIER_H
