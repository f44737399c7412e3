/*
 * tagtokenizer.cpp — Locate markup tags in a scrubbed markup view
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tagtokenizer.h"
#include "textlines.h"

#include <QRegularExpression>

namespace TagTokenizer {

QSet<QString> defaultVoidTags()
{
    return {
        QStringLiteral("area"), QStringLiteral("base"), QStringLiteral("br"),
        QStringLiteral("col"), QStringLiteral("embed"), QStringLiteral("hr"),
        QStringLiteral("img"), QStringLiteral("input"), QStringLiteral("link"),
        QStringLiteral("meta"), QStringLiteral("param"), QStringLiteral("source"),
        QStringLiteral("track"), QStringLiteral("wbr"),
    };
}

bool isVoid(const QString &name, const QSet<QString> &voidTags)
{
    return voidTags.contains(name.toLower());
}

QString kindName(TagKind kind)
{
    switch (kind) {
    case TagKind::Open:
        return QStringLiteral("open");
    case TagKind::Close:
        return QStringLiteral("close");
    case TagKind::SelfClosing:
        return QStringLiteral("self");
    }
    return QString();
}

QList<TagToken> tokenize(const QString &markupView, const QSet<QString> &voidTags)
{
    // Group 1: closing slash, group 2: tag name, group 3: attribute text.
    // Attribute text stops at '<' so an unterminated "<name ..." never
    // swallows the next tag.
    static const QRegularExpression tagRx(
        QStringLiteral(R"(<\s*(/)?\s*([A-Za-z0-9\-:_]+)([^<>]*)>)"));

    QList<TagToken> tokens;
    const TextLines::LineIndex index(markupView);

    auto it = tagRx.globalMatch(markupView);
    while (it.hasNext()) {
        auto match = it.next();

        TagToken token;
        token.name = match.captured(2);
        token.raw = match.captured(0);
        token.offset = match.capturedStart();
        token.line = index.lineAt(token.offset);

        if (match.capturedLength(1) > 0)
            token.kind = TagKind::Close;
        else if (token.raw.endsWith(QLatin1String("/>")) || isVoid(token.name, voidTags))
            token.kind = TagKind::SelfClosing;
        else
            token.kind = TagKind::Open;

        tokens.append(token);
    }

    return tokens;
}

} // namespace TagTokenizer
