/*
 * lintconfig.h — User-tunable tag sets, keywords and section definitions
 *
 * Loaded from a JSON file given with --config.  Every key is optional;
 * missing keys keep the built-in defaults.
 *
 *   {
 *     "voidTags":        ["br", "img", ...],
 *     "blockTags":       ["div", "section", ...],
 *     "controlKeywords": ["@if", "@foreach", ...],
 *     "trackedTag":      "div",
 *     "backupSuffix":    ".lintbak",
 *     "sections": [ { "name": ..., "file": ..., "start": [...],
 *                     "end": ..., "closing": [...], "autofixBraces": false } ]
 *   }
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_LINTCONFIG_H
#define RAZORLINT_LINTCONFIG_H

#include <QJsonObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include "lineclassifier.h"
#include "tagauditor.h"

struct SectionSpec {
    QString name;
    QString file;               // split-out section file to compare against
    QStringList startAnchors;   // tried in order, whitespace-insensitive
    QString endAnchor;          // searched after the start
    QStringList closingPatterns; // regexes tried in order after the end anchor
    bool autofixBraces = false;

    static SectionSpec fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

class LintConfig
{
public:
    LintConfig();

    QSet<QString> voidTags;        // lower-case
    QStringList blockTags;
    QStringList controlKeywords;
    QString trackedTag;            // empty: audit every tag name
    QString backupSuffix;
    QList<SectionSpec> sections;

    struct LoadResult {
        bool valid = true;
        QString errorMessage;      // non-empty if invalid
    };

    // Read and validate a JSON config file into this object.
    LoadResult load(const QString &path);

    // Empty when the configuration can be used, otherwise the first fault.
    QString validate() const;

    TagAuditOptions tagAuditOptions() const;
    LineClassifier lineClassifier() const;

    static LintConfig fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

#endif // RAZORLINT_LINTCONFIG_H
