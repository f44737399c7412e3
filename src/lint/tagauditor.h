/*
 * tagauditor.h — Check markup tag nesting with an explicit open-tag stack
 *
 * Runs either over every tag name (AnyTag) or over a single tracked name
 * (SingleTag, e.g. only <div>), in which case all other tags are ignored
 * and their nesting is not evaluated.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_TAGAUDITOR_H
#define RAZORLINT_TAGAUDITOR_H

#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include "tagtokenizer.h"

enum class TagMatchMode { AnyTag, SingleTag };

// What to do when a closing tag names a different element than the
// innermost open one.
enum class MismatchPolicy {
    PopInnermost   // report it, then pop anyway: the closer ends the innermost element
};

struct TagStep {
    int line;
    QString tag;
    TagKind kind;
    int depthBefore;
    int depthAfter;
};

struct StackFrame {
    QString tag;
    int line;      // line the element was opened on
};

struct TagAuditResult {
    QList<TagStep> steps;
    QStringList errors;
    int finalDepth = 0;
    QList<StackFrame> openFrames;   // unclosed elements, outermost first

    bool isClean() const { return errors.isEmpty(); }
};

struct TagAuditOptions {
    QSet<QString> voidTags = TagTokenizer::defaultVoidTags();
    TagMatchMode mode = TagMatchMode::AnyTag;
    QString trackedTag;                          // used in SingleTag mode
    MismatchPolicy mismatchPolicy = MismatchPolicy::PopInnermost;

    // Convenience for "--track-tag div" style use.
    static TagAuditOptions singleTag(const QString &name);
};

class TagAuditor
{
public:
    TagAuditor() = default;
    explicit TagAuditor(const TagAuditOptions &options);

    // Audit an already scrubbed markup view.
    TagAuditResult audit(const QString &markupView) const;

    // Scrub a raw document for markup, then audit it.
    TagAuditResult auditDocument(const QString &text) const;

    // Whether tokens of this tag name take part in the audit.
    bool tracks(const QString &name) const;

    const TagAuditOptions &options() const { return m_options; }

private:
    TagAuditOptions m_options;
};

#endif // RAZORLINT_TAGAUDITOR_H
