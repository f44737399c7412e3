/**
 * Leading-Header Validator Tests
 */

#include "lint_test_common.hpp"

#include "headervalidator.h"

using namespace lint_test;

TEST(HeaderValidatorTest, PlainIfBlock) {
    EXPECT_TRUE(HeaderValidator::startsWithIfBlock(doc({"@if (x) {", "<div>", "</div>", "}"})));
}

TEST(HeaderValidatorTest, BraceOnNextLine) {
    EXPECT_TRUE(HeaderValidator::startsWithIfBlock(doc({"@if (!isInitializedAsStudentUser)", "{", "}"})));
    EXPECT_TRUE(HeaderValidator::startsWithIfBlock(qs("@if(x){")));
}

TEST(HeaderValidatorTest, MissingClosingParenthesis) {
    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(qs("@if (x {")));
}

TEST(HeaderValidatorTest, ConditionWithNestedParenthesisIsRejected) {
    // Shallow check: the condition may not contain ')'
    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(qs("@if (Check(x)) {")));
}

TEST(HeaderValidatorTest, MissingBrace) {
    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(qs("@if (x) <div>")));
}

TEST(HeaderValidatorTest, OtherDirectiveFirst) {
    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(doc({"<div>", "@if (x) {", "}"})));
    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(qs("@foreach (var i in items) {")));
    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(QString()));
}

TEST(HeaderValidatorTest, SkipsBomAndWhitespace) {
    QString text = qs("\n\n   @if (x) {");
    text.prepend(QChar(0xFEFF));
    EXPECT_TRUE(HeaderValidator::startsWithIfBlock(text));
}

TEST(HeaderValidatorTest, SkipsLeadingComments) {
    const QString text = doc({
        "<!-- REGION: Student.Start -->",
        "@* generated from MainLayout.razor",
        "   do not edit *@",
        "",
        "<!-- note -->   @if (ready) {",
        "}",
    });
    EXPECT_TRUE(HeaderValidator::startsWithIfBlock(text));
}

TEST(HeaderValidatorTest, UnterminatedCommentStopsSkipping) {
    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(doc({"<!-- open", "@if (x) {"})));
}

TEST(HeaderValidatorTest, SkipBoilerplateOffset) {
    const QString text = qs("  <!-- a --> @* b *@\n@if (x) {");
    EXPECT_EQ(HeaderValidator::skipBoilerplate(text), text.indexOf(QLatin1String("@if")));
    EXPECT_EQ(HeaderValidator::skipBoilerplate(qs("plain")), 0);
}
