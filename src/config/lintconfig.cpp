/*
 * lintconfig.cpp — User-tunable tag sets, keywords and section definitions
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "lintconfig.h"
#include "indenter.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>

// ---------------------------------------------------------------------------
// JSON helpers
// ---------------------------------------------------------------------------

static QStringList stringListFromJson(const QJsonValue &value, const QStringList &fallback)
{
    if (!value.isArray())
        return fallback;

    QStringList list;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &item : array) {
        const QString s = item.toString();
        if (!s.isEmpty())
            list.append(s);
    }
    return list;
}

static QJsonArray stringListToJson(const QStringList &list)
{
    QJsonArray array;
    for (const QString &s : list)
        array.append(s);
    return array;
}

static QSet<QString> lowerCaseSet(const QStringList &list)
{
    QSet<QString> set;
    for (const QString &s : list)
        set.insert(s.toLower());
    return set;
}

// ---------------------------------------------------------------------------
// SectionSpec
// ---------------------------------------------------------------------------

SectionSpec SectionSpec::fromJson(const QJsonObject &obj)
{
    SectionSpec spec;
    spec.name            = obj.value(QLatin1String("name")).toString();
    spec.file            = obj.value(QLatin1String("file")).toString();
    spec.endAnchor       = obj.value(QLatin1String("end")).toString();
    spec.autofixBraces   = obj.value(QLatin1String("autofixBraces")).toBool(false);
    spec.closingPatterns = stringListFromJson(obj.value(QLatin1String("closing")), {});

    // "start" may be a single anchor or a list of alternatives
    const QJsonValue start = obj.value(QLatin1String("start"));
    if (start.isString())
        spec.startAnchors = QStringList{start.toString()};
    else
        spec.startAnchors = stringListFromJson(start, {});

    return spec;
}

QJsonObject SectionSpec::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("name")]          = name;
    obj[QLatin1String("file")]          = file;
    obj[QLatin1String("start")]         = stringListToJson(startAnchors);
    obj[QLatin1String("end")]           = endAnchor;
    obj[QLatin1String("closing")]       = stringListToJson(closingPatterns);
    obj[QLatin1String("autofixBraces")] = autofixBraces;
    return obj;
}

// ---------------------------------------------------------------------------
// LintConfig
// ---------------------------------------------------------------------------

LintConfig::LintConfig()
    : voidTags(TagTokenizer::defaultVoidTags())
    , blockTags(Indenter::defaultBlockTags())
    , controlKeywords(LineClassifier::defaultControlKeywords())
    , backupSuffix(QStringLiteral(".lintbak"))
{
}

LintConfig LintConfig::fromJson(const QJsonObject &obj)
{
    LintConfig config;

    if (obj.contains(QLatin1String("voidTags"))) {
        config.voidTags = lowerCaseSet(
            stringListFromJson(obj.value(QLatin1String("voidTags")), {}));
    }
    config.blockTags = stringListFromJson(obj.value(QLatin1String("blockTags")),
                                          config.blockTags);
    config.controlKeywords = stringListFromJson(obj.value(QLatin1String("controlKeywords")),
                                                config.controlKeywords);
    config.trackedTag = obj.value(QLatin1String("trackedTag")).toString();
    config.backupSuffix = obj.value(QLatin1String("backupSuffix"))
                              .toString(config.backupSuffix);

    const QJsonArray sections = obj.value(QLatin1String("sections")).toArray();
    for (const QJsonValue &value : sections)
        config.sections.append(SectionSpec::fromJson(value.toObject()));

    return config;
}

QJsonObject LintConfig::toJson() const
{
    QStringList voids(voidTags.cbegin(), voidTags.cend());
    voids.sort();

    QJsonArray sectionArray;
    for (const SectionSpec &spec : sections)
        sectionArray.append(spec.toJson());

    QJsonObject obj;
    obj[QLatin1String("voidTags")]        = stringListToJson(voids);
    obj[QLatin1String("blockTags")]       = stringListToJson(blockTags);
    obj[QLatin1String("controlKeywords")] = stringListToJson(controlKeywords);
    obj[QLatin1String("trackedTag")]      = trackedTag;
    obj[QLatin1String("backupSuffix")]    = backupSuffix;
    obj[QLatin1String("sections")]        = sectionArray;
    return obj;
}

LintConfig::LoadResult LintConfig::load(const QString &path)
{
    LoadResult result;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        result.valid = false;
        result.errorMessage = QStringLiteral("Cannot open config file %1: %2")
                                  .arg(path, file.errorString());
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.valid = false;
        result.errorMessage = doc.isNull()
            ? QStringLiteral("Invalid JSON in %1 at offset %2: %3")
                  .arg(path).arg(parseError.offset).arg(parseError.errorString())
            : QStringLiteral("Config file %1 must contain a JSON object").arg(path);
        return result;
    }

    *this = fromJson(doc.object());

    const QString fault = validate();
    if (!fault.isEmpty()) {
        result.valid = false;
        result.errorMessage = QStringLiteral("%1: %2").arg(path, fault);
    }
    return result;
}

QString LintConfig::validate() const
{
    if (voidTags.isEmpty())
        return QStringLiteral("voidTags must not be empty");
    if (blockTags.isEmpty())
        return QStringLiteral("blockTags must not be empty");
    if (backupSuffix.isEmpty())
        return QStringLiteral("backupSuffix must not be empty");

    for (const SectionSpec &spec : sections) {
        if (spec.name.isEmpty())
            return QStringLiteral("every section needs a name");
        if (spec.startAnchors.isEmpty() || spec.endAnchor.isEmpty())
            return QStringLiteral("section %1 needs start and end anchors").arg(spec.name);
        if (spec.closingPatterns.isEmpty())
            return QStringLiteral("section %1 needs at least one closing pattern").arg(spec.name);
        for (const QString &pattern : spec.closingPatterns) {
            const QRegularExpression rx(pattern);
            if (!rx.isValid()) {
                return QStringLiteral("section %1: bad closing pattern \"%2\": %3")
                    .arg(spec.name, pattern, rx.errorString());
            }
        }
    }

    return QString();
}

TagAuditOptions LintConfig::tagAuditOptions() const
{
    TagAuditOptions options = trackedTag.isEmpty()
        ? TagAuditOptions()
        : TagAuditOptions::singleTag(trackedTag);
    options.voidTags = voidTags;
    return options;
}

LineClassifier LintConfig::lineClassifier() const
{
    return LineClassifier(controlKeywords);
}
