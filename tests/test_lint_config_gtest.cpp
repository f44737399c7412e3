/**
 * Lint Configuration Tests
 */

#include "lint_test_common.hpp"

#include "indenter.h"
#include "lintconfig.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

using namespace lint_test;

namespace {

QJsonObject parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

QString writeFile(const QTemporaryDir &dir, const char *name, const QByteArray &data)
{
    const QString path = dir.filePath(QString::fromUtf8(name));
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
        file.write(data);
    return path;
}

} // namespace

TEST(LintConfigTest, Defaults) {
    const LintConfig config;

    EXPECT_EQ(config.voidTags, TagTokenizer::defaultVoidTags());
    EXPECT_EQ(config.blockTags, Indenter::defaultBlockTags());
    EXPECT_EQ(config.controlKeywords, LineClassifier::defaultControlKeywords());
    EXPECT_TRUE(config.trackedTag.isEmpty());
    EXPECT_EQ(config.backupSuffix, qs(".lintbak"));
    EXPECT_TRUE(config.sections.isEmpty());
    EXPECT_TRUE(config.validate().isEmpty());
}

TEST(LintConfigTest, MissingKeysKeepDefaults) {
    const LintConfig config = LintConfig::fromJson(parse(R"({"trackedTag": "div"})"));

    EXPECT_EQ(config.trackedTag, qs("div"));
    EXPECT_EQ(config.voidTags, TagTokenizer::defaultVoidTags());
    EXPECT_EQ(config.backupSuffix, qs(".lintbak"));
}

TEST(LintConfigTest, VoidTagsAreLowerCased) {
    const LintConfig config = LintConfig::fromJson(parse(R"({"voidTags": ["BR", "X-Icon"]})"));

    EXPECT_EQ(config.voidTags.size(), 2);
    EXPECT_TRUE(config.voidTags.contains(qs("br")));
    EXPECT_TRUE(config.voidTags.contains(qs("x-icon")));
}

TEST(LintConfigTest, SectionStartAcceptsStringOrList) {
    const LintConfig config = LintConfig::fromJson(parse(R"({
        "sections": [
            {"name": "Header", "file": "Header.razor", "start": "@if (showHeader)",
             "end": "<!-- end header -->", "closing": ["\\}"]},
            {"name": "Footer", "file": "Footer.razor", "start": ["@if (a)", "@if (b)"],
             "end": "</footer>", "closing": ["\\}", "</div>\\s*\\}"], "autofixBraces": true}
        ]
    })"));

    ASSERT_EQ(config.sections.size(), 2);
    EXPECT_EQ(config.sections[0].startAnchors, QStringList{qs("@if (showHeader)")});
    EXPECT_FALSE(config.sections[0].autofixBraces);
    EXPECT_EQ(config.sections[1].startAnchors.size(), 2);
    EXPECT_EQ(config.sections[1].closingPatterns.size(), 2);
    EXPECT_TRUE(config.sections[1].autofixBraces);
    EXPECT_TRUE(config.validate().isEmpty());
}

TEST(LintConfigTest, JsonRoundTrip) {
    LintConfig config;
    config.trackedTag = qs("section");
    config.backupSuffix = qs(".orig");
    SectionSpec spec;
    spec.name = qs("Nav");
    spec.file = qs("Nav.razor");
    spec.startAnchors = {qs("@if (nav)")};
    spec.endAnchor = qs("</nav>");
    spec.closingPatterns = {qs("\\}")};
    config.sections.append(spec);

    const LintConfig copy = LintConfig::fromJson(config.toJson());

    EXPECT_EQ(copy.voidTags, config.voidTags);
    EXPECT_EQ(copy.blockTags, config.blockTags);
    EXPECT_EQ(copy.trackedTag, config.trackedTag);
    EXPECT_EQ(copy.backupSuffix, config.backupSuffix);
    ASSERT_EQ(copy.sections.size(), 1);
    EXPECT_EQ(copy.sections[0].name, spec.name);
    EXPECT_EQ(copy.sections[0].endAnchor, spec.endAnchor);
}

TEST(LintConfigTest, ValidateReportsFaults) {
    EXPECT_EQ(LintConfig::fromJson(parse(R"({"voidTags": []})")).validate(),
              qs("voidTags must not be empty"));
    EXPECT_EQ(LintConfig::fromJson(parse(R"({"blockTags": []})")).validate(),
              qs("blockTags must not be empty"));
    EXPECT_EQ(LintConfig::fromJson(parse(R"({"backupSuffix": ""})")).validate(),
              qs("backupSuffix must not be empty"));
    EXPECT_EQ(LintConfig::fromJson(parse(R"({"sections": [{"start": "a", "end": "b"}]})")).validate(),
              qs("every section needs a name"));
    EXPECT_EQ(LintConfig::fromJson(parse(R"({"sections": [{"name": "S", "start": "a"}]})")).validate(),
              qs("section S needs start and end anchors"));
    EXPECT_EQ(LintConfig::fromJson(parse(R"({"sections": [{"name": "S", "start": "a", "end": "b"}]})"))
                  .validate(),
              qs("section S needs at least one closing pattern"));

    const QString fault = LintConfig::fromJson(
        parse(R"({"sections": [{"name": "S", "start": "a", "end": "b", "closing": ["(\\}"]}]})"))
        .validate();
    EXPECT_TRUE(fault.startsWith(qs("section S: bad closing pattern"))) << fault.toStdString();
}

TEST(LintConfigTest, TrackedTagSelectsSingleTagMode) {
    LintConfig config;
    EXPECT_EQ(config.tagAuditOptions().mode, TagMatchMode::AnyTag);

    config.trackedTag = qs("div");
    config.voidTags = {qs("hr")};
    const TagAuditOptions options = config.tagAuditOptions();
    EXPECT_EQ(options.mode, TagMatchMode::SingleTag);
    EXPECT_EQ(options.voidTags, QSet<QString>{qs("hr")});
}

TEST(LintConfigTest, ControlKeywordsReachTheClassifier) {
    LintConfig config;
    config.controlKeywords = {qs("@lock")};
    const LineClassifier classifier = config.lineClassifier();

    EXPECT_EQ(classifier.classify(qs("  <p>@lock (x)</p>")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("  <p>@foreach</p>")), LineKind::Markup);
}

TEST(LintConfigTest, LoadFromFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = writeFile(dir, "lint.json", R"({"trackedTag": "ul", "backupSuffix": ".bak"})");

    LintConfig config;
    const LintConfig::LoadResult result = config.load(path);
    EXPECT_TRUE(result.valid) << result.errorMessage.toStdString();
    EXPECT_EQ(config.trackedTag, qs("ul"));
    EXPECT_EQ(config.backupSuffix, qs(".bak"));
}

TEST(LintConfigTest, LoadRejectsBadInput) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    LintConfig config;
    LintConfig::LoadResult result = config.load(dir.filePath(qs("missing.json")));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(result.errorMessage.startsWith(qs("Cannot open config file")));

    result = config.load(writeFile(dir, "broken.json", "{ \"voidTags\": [ "));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(result.errorMessage.startsWith(qs("Invalid JSON"))) << result.errorMessage.toStdString();

    result = config.load(writeFile(dir, "array.json", "[1, 2]"));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(result.errorMessage.contains(qs("must contain a JSON object")));

    result = config.load(writeFile(dir, "empty-void.json", R"({"voidTags": []})"));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(result.errorMessage.endsWith(qs("voidTags must not be empty")));
}
