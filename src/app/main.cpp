/*
 * main.cpp — razorlint command line entry point
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include <cstdio>

#include "filelinter.h"
#include "lintconfig.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("razorlint");

    KAboutData aboutData(
        QStringLiteral("razorlint"),
        i18n("razorlint"),
        QStringLiteral("0.1.0"),
        i18n("Brace and tag structure checker for Razor template sections"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2025-2026"));
    KAboutData::setApplicationData(aboutData);

    QTextStream out(stdout);
    QTextStream err(stderr);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("Razor section file to check"),
        QStringLiteral("<file...>"));

    const QCommandLineOption diagnoseOption(
        QStringLiteral("diagnose"), i18n("Show detailed depth changes"));
    const QCommandLineOption autofixBracesOption(
        QStringLiteral("autofix-braces"), i18n("Append missing '}' at EOF or drop surplus trailing '}'"));
    const QCommandLineOption autofixDivsOption(
        QStringLiteral("autofix-divs"), i18n("Drop stray closing tags and close open tags at EOF"));
    const QCommandLineOption indentOption(
        QStringLiteral("indent"), i18n("Re-indent HTML and brace scopes"));
    const QCommandLineOption trackTagOption(
        QStringLiteral("track-tag"), i18n("Only audit the nesting of this tag name"),
        QStringLiteral("name"));
    const QCommandLineOption configOption(
        QStringLiteral("config"), i18n("Read tag sets and sections from a JSON file"),
        QStringLiteral("file"));
    const QCommandLineOption sectionsOption(
        QStringLiteral("sections"),
        i18n("Compare the configured sections of this monolithic layout with their split files"),
        QStringLiteral("monolith"));

    parser.addOptions({diagnoseOption, autofixBracesOption, autofixDivsOption,
                       indentOption, trackTagOption, configOption, sectionsOption});

    if (!parser.parse(app.arguments())) {
        err << parser.errorText() << Qt::endl;
        return 2;
    }
    if (parser.isSet(QStringLiteral("help")))
        parser.showHelp(0);
    if (parser.isSet(QStringLiteral("version")))
        parser.showVersion();
    aboutData.processCommandLine(&parser);

    LintConfig config;
    if (parser.isSet(configOption)) {
        const LintConfig::LoadResult loaded = config.load(parser.value(configOption));
        if (!loaded.valid) {
            err << i18n("ERROR: %1", loaded.errorMessage) << Qt::endl;
            return 2;
        }
    }
    if (parser.isSet(trackTagOption))
        config.trackedTag = parser.value(trackTagOption);

    const QString configFault = config.validate();
    if (!configFault.isEmpty()) {
        err << i18n("ERROR: %1", configFault) << Qt::endl;
        return 2;
    }

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty() && !parser.isSet(sectionsOption)) {
        err << parser.helpText();
        err.flush();
        return 2;
    }

    FileLinter::Options options;
    options.diagnose = parser.isSet(diagnoseOption);
    options.autofixBraces = parser.isSet(autofixBracesOption);
    options.autofixDivs = parser.isSet(autofixDivsOption);
    options.indent = parser.isSet(indentOption);

    FileLinter linter(config, options, out, err);
    int exitCode = 0;

    if (parser.isSet(sectionsOption)) {
        if (config.sections.isEmpty()) {
            err << i18n("ERROR: --sections needs a --config file with \"sections\"") << Qt::endl;
            return 2;
        }
        if (!linter.checkSections(parser.value(sectionsOption)))
            exitCode = 1;
    }

    for (const QString &file : files) {
        if (!linter.lintFile(file))
            exitCode = 1;
    }

    return exitCode;
}
