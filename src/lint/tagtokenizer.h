/*
 * tagtokenizer.h — Locate markup tags in a scrubbed markup view
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_TAGTOKENIZER_H
#define RAZORLINT_TAGTOKENIZER_H

#include <QList>
#include <QSet>
#include <QString>

enum class TagKind { Open, Close, SelfClosing };

struct TagToken {
    QString name;      // as written in the source
    TagKind kind;
    int line;          // 1-based
    int offset;        // character offset in the markup view
    QString raw;       // full matched text, e.g. "<div class=\"x\">"
};

namespace TagTokenizer {

// Tokenize every <name ...>, </name> and <name .../> in the view.
// A non-closing tag is SelfClosing when it ends with "/>" or its name is
// in voidTags (compared lower-case).
QList<TagToken> tokenize(const QString &markupView, const QSet<QString> &voidTags);

// HTML void elements, lower-case
QSet<QString> defaultVoidTags();

bool isVoid(const QString &name, const QSet<QString> &voidTags);

QString kindName(TagKind kind);

} // namespace TagTokenizer

#endif // RAZORLINT_TAGTOKENIZER_H
