/**
 * Line Classifier Tests
 */

#include "lint_test_common.hpp"

#include "lineclassifier.h"

using namespace lint_test;

TEST(LineClassifierTest, BlankLines) {
    const LineClassifier classifier;
    EXPECT_EQ(classifier.classify(QString()), LineKind::Blank);
    EXPECT_EQ(classifier.classify(qs("   \t ")), LineKind::Blank);
}

TEST(LineClassifierTest, DirectiveAndBraceStarts) {
    const LineClassifier classifier;
    EXPECT_EQ(classifier.classify(qs("@if (x) {")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("    @Model.Name")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("  {")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("}")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("} else {")), LineKind::Code);
}

TEST(LineClassifierTest, ControlKeywordInsideMarkup) {
    const LineClassifier classifier;
    EXPECT_EQ(classifier.classify(qs("<div>@if (open) {")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("<ul>@foreach (var i in items) {")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("<td>@switch (kind) {")), LineKind::Code);
}

TEST(LineClassifierTest, PlainMarkup) {
    const LineClassifier classifier;
    EXPECT_EQ(classifier.classify(qs("<div style=\"a{b}\">")), LineKind::Markup);
    EXPECT_EQ(classifier.classify(qs("  some text }")), LineKind::Markup);
    EXPECT_EQ(classifier.classify(qs("<span>@Model.Name</span>")), LineKind::Markup);
}

TEST(LineClassifierTest, ForKeywordNeedsTrailingSpace) {
    const LineClassifier classifier;
    EXPECT_EQ(classifier.classify(qs("<p>@for (int i = 0; i < 3; i++) {")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("<p>@format</p>")), LineKind::Markup);
}

TEST(LineClassifierTest, CustomKeywords) {
    const LineClassifier classifier(QStringList{QStringLiteral("@lock")});
    EXPECT_EQ(classifier.classify(qs("<p>@lock (x) {")), LineKind::Code);
    EXPECT_EQ(classifier.classify(qs("<p>@if (x) {")), LineKind::Markup);
    EXPECT_TRUE(classifier.isCode(qs("@if (x) {")));
}
