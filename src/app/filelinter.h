/*
 * filelinter.h — Per-file check / fix / write-back pipeline of the CLI
 *
 * Runs the header check and both audits over one file, applies the
 * requested fixes, re-audits, and saves the result.  The first time a
 * file is rewritten its original content is kept next to it as
 * <file><backupSuffix>; an existing backup is never overwritten.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_FILELINTER_H
#define RAZORLINT_FILELINTER_H

#include <QString>
#include <QTextStream>

#include "lintconfig.h"

class FileLinter
{
public:
    struct Options {
        bool diagnose = false;
        bool autofixBraces = false;
        bool autofixDivs = false;
        bool indent = false;
    };

    FileLinter(const LintConfig &config, const Options &options,
               QTextStream &out, QTextStream &err);

    // True when the file exists and is clean after any fixes.
    bool lintFile(const QString &path);

    // Extract every configured section from the monolith and compare it
    // with its split file.  True when all of them match.
    bool checkSections(const QString &monolithPath);

    static bool readDocument(const QString &path, QString &text);

    // Write text to path, creating the backup first if there is none yet.
    // backupName receives the backup's file name.
    bool writeDocument(const QString &path, const QString &original,
                       const QString &text, QString *backupName = nullptr) const;

private:
    void printLines(QTextStream &stream, const QStringList &lines);

    LintConfig m_config;
    Options m_options;
    QTextStream &m_out;
    QTextStream &m_err;
};

#endif // RAZORLINT_FILELINTER_H
