/*
 * tagauditor.cpp — Check markup tag nesting with an explicit open-tag stack
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tagauditor.h"
#include "scrubber.h"
#include "textlines.h"

TagAuditOptions TagAuditOptions::singleTag(const QString &name)
{
    TagAuditOptions options;
    options.mode = TagMatchMode::SingleTag;
    options.trackedTag = name;
    return options;
}

TagAuditor::TagAuditor(const TagAuditOptions &options)
    : m_options(options)
{
}

bool TagAuditor::tracks(const QString &name) const
{
    if (m_options.mode == TagMatchMode::AnyTag)
        return true;
    return name.compare(m_options.trackedTag, Qt::CaseInsensitive) == 0;
}

TagAuditResult TagAuditor::audit(const QString &markupView) const
{
    TagAuditResult result;
    QList<StackFrame> stack;

    const QList<TagToken> tokens = TagTokenizer::tokenize(markupView, m_options.voidTags);
    for (const TagToken &token : tokens) {
        if (!tracks(token.name))
            continue;

        const int depth = stack.size();

        switch (token.kind) {
        case TagKind::Open:
            stack.append({token.name, token.line});
            result.steps.append({token.line, token.name, token.kind, depth, depth + 1});
            break;

        case TagKind::SelfClosing:
            result.steps.append({token.line, token.name, token.kind, depth, depth});
            break;

        case TagKind::Close:
            if (TagTokenizer::isVoid(token.name, m_options.voidTags)) {
                // </br> and friends never had an opener on the stack
                result.steps.append({token.line, token.name, token.kind, depth, depth});
                break;
            }

            if (stack.isEmpty()) {
                result.errors.append(
                    QStringLiteral("Line %1: unexpected </%2> with empty stack.")
                        .arg(token.line).arg(token.name));
                result.steps.append({token.line, token.name, token.kind, depth, depth - 1});
                break;
            }

            {
                const StackFrame top = stack.takeLast();
                if (top.tag.compare(token.name, Qt::CaseInsensitive) != 0) {
                    result.errors.append(
                        QStringLiteral("Line %1: closing </%2> does not match <%3> opened at line %4.")
                            .arg(token.line).arg(token.name, top.tag).arg(top.line));
                }
                // MismatchPolicy::PopInnermost: the pop stands either way
                result.steps.append({token.line, token.name, token.kind, depth, depth - 1});
            }
            break;
        }
    }

    for (int i = stack.size() - 1; i >= 0; --i) {
        const StackFrame &frame = stack[i];
        if (TagTokenizer::isVoid(frame.tag, m_options.voidTags))
            continue;
        result.errors.append(QStringLiteral("Unclosed <%1> opened at line %2.")
                                 .arg(frame.tag).arg(frame.line));
    }

    result.finalDepth = stack.size();
    result.openFrames = stack;
    return result;
}

TagAuditResult TagAuditor::auditDocument(const QString &text) const
{
    return audit(Scrubber::stripForMarkup(TextLines::normalizeNewlines(text)));
}
