/*
 * tagfixer.cpp — Repair unbalanced markup tags
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tagfixer.h"
#include "scrubber.h"
#include "textlines.h"

#include <QMap>

TagFixer::TagFixer(const TagAuditor &auditor)
    : m_auditor(auditor)
{
}

FixResult TagFixer::fix(const QString &text, TagAuditResult *afterAudit) const
{
    FixResult result;
    const QString normalized = TextLines::normalizeNewlines(text);
    const QSet<QString> &voidTags = m_auditor.options().voidTags;

    const QList<TagToken> tokens =
        TagTokenizer::tokenize(Scrubber::stripForMarkup(normalized), voidTags);

    QList<StackFrame> stack;
    QMap<int, TagToken> strayClosers;   // keyed by line

    for (const TagToken &token : tokens) {
        if (!m_auditor.tracks(token.name) || token.kind == TagKind::SelfClosing)
            continue;

        if (token.kind == TagKind::Open) {
            stack.append({token.name, token.line});
            continue;
        }

        if (TagTokenizer::isVoid(token.name, voidTags))
            continue;

        if (stack.isEmpty()) {
            if (!strayClosers.contains(token.line))
                strayClosers.insert(token.line, token);
            continue;
        }
        stack.removeLast();
    }

    QStringList lines = normalized.split(QLatin1Char('\n'));
    bool changed = false;

    // Bottom-up so earlier line numbers stay valid
    for (auto it = strayClosers.constEnd(); it != strayClosers.constBegin();) {
        --it;
        const int index = it.key() - 1;
        const TagToken &token = it.value();
        if (index >= 0 && index < lines.size() && lines[index].trimmed() == token.raw) {
            lines.removeAt(index);
            result.actions.append(QStringLiteral("remove extra </%1> at line %2")
                                      .arg(token.name).arg(it.key()));
            changed = true;
        } else {
            result.actions.append(QStringLiteral("keep extra </%1> at line %2: line has other content")
                                      .arg(token.name).arg(it.key()));
        }
    }

    if (!stack.isEmpty()) {
        // Keep a trailing newline as the last thing in the file
        int insertAt = lines.size();
        if (!lines.isEmpty() && lines.last().isEmpty())
            insertAt = lines.size() - 1;

        for (int i = stack.size() - 1; i >= 0; --i) {
            lines.insert(insertAt++, QStringLiteral("</%1>").arg(stack[i].tag));
            result.actions.append(QStringLiteral("append </%1> at EOF for line %2")
                                      .arg(stack[i].tag).arg(stack[i].line));
        }
        changed = true;
    }

    result.changed = changed;
    result.text = changed ? lines.join(QLatin1Char('\n')) : text;

    if (afterAudit)
        *afterAudit = m_auditor.auditDocument(result.text);
    return result;
}
