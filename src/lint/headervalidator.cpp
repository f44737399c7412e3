/*
 * headervalidator.cpp — Check that a section opens with "@if (...) {"
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "headervalidator.h"

#include <QRegularExpression>

namespace HeaderValidator {

static constexpr QChar kByteOrderMark(0xFEFF);

static int skipSpace(const QString &text, int pos)
{
    while (pos < text.size() && text[pos].isSpace())
        ++pos;
    return pos;
}

// End offset of a boilerplate block starting at pos, or -1
static int boilerplateEnd(const QString &text, int pos)
{
    static const QRegularExpression regionRx(
        QStringLiteral(R"(<!--\s*REGION:\s*[\w.]+\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);

    auto region = regionRx.match(text, pos, QRegularExpression::NormalMatch,
                                 QRegularExpression::AnchorAtOffsetMatchOption);
    if (region.hasMatch())
        return region.capturedEnd();

    if (QStringView(text).mid(pos).startsWith(QLatin1String("<!--"))) {
        const int end = text.indexOf(QLatin1String("-->"), pos + 4);
        return end < 0 ? -1 : end + 3;
    }

    if (QStringView(text).mid(pos).startsWith(QLatin1String("@*"))) {
        const int end = text.indexOf(QLatin1String("*@"), pos + 2);
        return end < 0 ? -1 : end + 2;
    }

    return -1;
}

int skipBoilerplate(const QString &text)
{
    int pos = 0;
    if (!text.isEmpty() && text[0] == kByteOrderMark)
        pos = 1;

    pos = skipSpace(text, pos);
    while (pos < text.size()) {
        const int end = boilerplateEnd(text, pos);
        if (end < 0)
            break;
        pos = skipSpace(text, end);
    }
    return pos;
}

bool startsWithIfBlock(const QString &text)
{
    static const QRegularExpression headerRx(QStringLiteral(R"(@if\s*\([^)]*\)\s*\{)"));

    const int head = skipBoilerplate(text);
    return headerRx.match(text, head, QRegularExpression::NormalMatch,
                          QRegularExpression::AnchorAtOffsetMatchOption).hasMatch();
}

} // namespace HeaderValidator
