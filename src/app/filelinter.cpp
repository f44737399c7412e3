/*
 * filelinter.cpp — Per-file check / fix / write-back pipeline of the CLI
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "filelinter.h"
#include "braceauditor.h"
#include "bracefixer.h"
#include "headervalidator.h"
#include "indenter.h"
#include "report.h"
#include "sectioncomparator.h"
#include "sectionextractor.h"
#include "tagauditor.h"
#include "tagfixer.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <KLocalizedString>

FileLinter::FileLinter(const LintConfig &config, const Options &options,
                       QTextStream &out, QTextStream &err)
    : m_config(config)
    , m_options(options)
    , m_out(out)
    , m_err(err)
{
}

void FileLinter::printLines(QTextStream &stream, const QStringList &lines)
{
    for (const QString &line : lines)
        stream << line << Qt::endl;
}

bool FileLinter::readDocument(const QString &path, QString &text)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return false;
    text = QString::fromUtf8(file.readAll());
    return true;
}

bool FileLinter::writeDocument(const QString &path, const QString &original,
                               const QString &text, QString *backupName) const
{
    const QString backupPath = path + m_config.backupSuffix;
    if (backupName)
        *backupName = QFileInfo(backupPath).fileName();

    if (!QFile::exists(backupPath)) {
        QFile backup(backupPath);
        if (!backup.open(QIODevice::WriteOnly)
            || backup.write(original.toUtf8()) < 0) {
            qWarning() << "FileLinter: cannot write backup" << backupPath
                       << backup.errorString();
            return false;
        }
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)
        || file.write(text.toUtf8()) < 0) {
        qWarning() << "FileLinter: cannot write" << path << file.errorString();
        return false;
    }
    return true;
}

bool FileLinter::lintFile(const QString &path)
{
    const QString absolutePath = QFileInfo(path).absoluteFilePath();
    QString original;
    if (!QFileInfo(absolutePath).isFile() || !readDocument(absolutePath, original)) {
        m_err << i18n("ERROR: Missing file %1", path) << Qt::endl;
        return false;
    }

    m_out << i18n("[CHECK] %1", path) << Qt::endl;

    QString text = original;
    const BraceAuditor braceAuditor(m_config.lineClassifier());
    const TagAuditor tagAuditor(m_config.tagAuditOptions());

    if (!HeaderValidator::startsWithIfBlock(text))
        m_err << i18n("  ERROR: Section does not start with '@if (...) {'") << Qt::endl;

    BraceAuditResult braceAudit = braceAuditor.auditDocument(text);
    printLines(m_err, Report::indented(braceAudit.errors));
    if (m_options.diagnose) {
        m_out << i18n("  Brace depth changes:") << Qt::endl;
        printLines(m_out, Report::formatBraceSteps(braceAudit.steps));
    }

    TagAuditResult tagAudit = tagAuditor.auditDocument(text);
    printLines(m_err, Report::indented(tagAudit.errors));
    if (m_options.diagnose) {
        m_out << i18n("  Tag depth changes:") << Qt::endl;
        printLines(m_out, Report::formatTagSteps(tagAudit.steps));
    }

    if (m_options.autofixBraces && braceAudit.finalDepth != 0) {
        const FixResult fix = BraceFixer(braceAuditor).fix(text, &braceAudit);
        for (const QString &action : fix.actions)
            m_out << "  [autofix-braces] " << action << Qt::endl;
        text = fix.text;
        if (braceAudit.isClean()) {
            m_out << i18n("  [autofix-braces] OK") << Qt::endl;
        } else {
            m_err << i18n("  [autofix-braces] still imbalanced") << Qt::endl;
            printLines(m_err, Report::indented(braceAudit.errors));
        }
    }

    if (m_options.autofixDivs && !tagAudit.isClean()) {
        const FixResult fix = TagFixer(tagAuditor).fix(text, &tagAudit);
        if (m_options.diagnose) {
            for (const QString &action : fix.actions)
                m_out << "  [autofix-divs] " << action << Qt::endl;
        }
        if (fix.changed) {
            text = fix.text;
            m_out << i18n("  [autofix-divs] applied") << Qt::endl;
            printLines(m_err, Report::indented(tagAudit.errors));
            if (tagAudit.isClean())
                m_out << i18n("  [autofix-divs] OK") << Qt::endl;
        }
    }

    if (m_options.indent) {
        text = Indenter(m_config.blockTags).reindent(text);
        m_out << i18n("  [indent] applied") << Qt::endl;
    }

    if (text != original) {
        QString backupName;
        if (!writeDocument(absolutePath, original, text, &backupName)) {
            m_err << i18n("  ERROR: Could not save %1", path) << Qt::endl;
            return false;
        }
        m_out << i18n("  Saved. Backup: %1", backupName) << Qt::endl;
    }

    const bool clean = HeaderValidator::startsWithIfBlock(text)
                       && braceAudit.isClean() && tagAudit.isClean();
    if (clean)
        m_out << i18n("  OK") << Qt::endl;
    return clean;
}

bool FileLinter::checkSections(const QString &monolithPath)
{
    QString monolith;
    if (!readDocument(monolithPath, monolith)) {
        m_err << i18n("ERROR: Missing file %1", monolithPath) << Qt::endl;
        return false;
    }

    const QDir baseDir = QFileInfo(monolithPath).absoluteDir();
    const BraceAuditor braceAuditor(m_config.lineClassifier());
    bool allMatch = true;

    for (const SectionSpec &spec : m_config.sections) {
        const SectionExtractor::Result extracted =
            SectionExtractor::extract(monolith, spec, braceAuditor);
        if (!extracted.valid) {
            m_err << i18n("ERROR: %1", extracted.errorMessage) << Qt::endl;
            allMatch = false;
            continue;
        }
        for (const QString &note : extracted.notes)
            m_out << i18n("[INFO] %1: %2", spec.name, note) << Qt::endl;

        const QString splitPath = baseDir.absoluteFilePath(spec.file);
        QString split;
        if (!readDocument(splitPath, split)) {
            m_err << i18n("ERROR: Missing file %1", spec.file) << Qt::endl;
            allMatch = false;
            continue;
        }

        const SectionComparator::Comparison comparison =
            SectionComparator::compare(extracted.text, split, spec.file);
        if (comparison.equal) {
            m_out << i18n("[INFO] %1: OK", spec.name) << Qt::endl;
            continue;
        }

        m_out << Qt::endl << i18n("DIFF for %1:", spec.name) << Qt::endl
              << comparison.diff << Qt::endl << Qt::endl;
        m_err << i18n("ERROR: %1: mismatch. See diff above.", spec.name) << Qt::endl;
        allMatch = false;
    }

    if (allMatch)
        m_out << i18n("[INFO] All sections match.") << Qt::endl;
    return allMatch;
}
