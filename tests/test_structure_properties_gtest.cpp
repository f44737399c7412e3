/**
 * Structure Property Tests
 *
 * End-to-end scenarios across the header validator, both auditors and
 * both fixers, plus the determinism, brace round-trip and tag-fixer
 * idempotence properties over a shared set of templates.
 */

#include "lint_test_common.hpp"

#include "braceauditor.h"
#include "bracefixer.h"
#include "headervalidator.h"
#include "tagauditor.h"
#include "tagfixer.h"

using namespace lint_test;

namespace {

QStringList sampleTemplates()
{
    return {
        doc({"@if (x) {", "<div>", "</div>", "}"}),
        doc({"@if (x) {", "<div>", "}"}),
        doc({"@if (x) {", "</div>", "<div>", "}"}),
        doc({"@if (ready) {", "  @foreach (var row in rows) {", "    <tr><td>@row.Name</td>",
             "  }", "<table>"}),
        doc({"@* header *@", "@if (a) {", "}", "}", "{", "<section><p>x</section>"}),
        doc({"<!-- REGION: Nav.Start -->", "@if (nav) {", "<ul>", "<li>@(items.Count > 0 ? \"</ul>\" : \"\")",
             "@code {", "  int n = 0; // }", "}", "</ul>"}),
        qs("@if (x) {\r\n<div>\r\n<span>\r\n</div>\r\n"),
        doc({"<div>", "<span class=\"a\""}),
        doc({"@if (url.StartsWith(\"https://x\")) {", "<a href=\"https://example.com\">go</a>", "}"}),
    };
}

} // namespace

// ============================================================================
// Scenarios
// ============================================================================

TEST(StructureScenarioTest, ValidSection) {
    const QString text = doc({"@if (x) {", "<div>", "</div>", "}"});

    EXPECT_TRUE(HeaderValidator::startsWithIfBlock(text));
    const BraceAuditResult braces = BraceAuditor().auditDocument(text);
    EXPECT_EQ(braces.finalDepth, 0);
    EXPECT_TRUE(braces.isClean());
    const TagAuditResult tags = TagAuditor().auditDocument(text);
    EXPECT_EQ(tags.finalDepth, 0);
    EXPECT_TRUE(tags.isClean());
}

TEST(StructureScenarioTest, UnclosedTagIsFixedAtEndOfFile) {
    const QString text = doc({"@if (x) {", "<div>", "}"});

    const TagAuditResult before = TagAuditor().auditDocument(text);
    ASSERT_EQ(before.errors.size(), 1);
    EXPECT_EQ(before.errors[0], qs("Unclosed <div> opened at line 2."));

    TagAuditResult after;
    const FixResult fix = TagFixer().fix(text, &after);
    EXPECT_TRUE(fix.text.endsWith(qs("</div>")));
    EXPECT_TRUE(after.isClean());
}

TEST(StructureScenarioTest, PrematureCloseGivesTwoDiagnostics) {
    const TagAuditor auditor(TagAuditOptions::singleTag(qs("div")));
    const TagAuditResult result = auditor.auditDocument(doc({"@if (x) {", "</div>", "<div>", "}"}));

    ASSERT_EQ(result.errors.size(), 2);
    EXPECT_EQ(result.errors[0], qs("Line 2: unexpected </div> with empty stack."));
    EXPECT_EQ(result.errors[1], qs("Unclosed <div> opened at line 3."));
}

TEST(StructureScenarioTest, HeaderWithoutClosingParenthesis) {
    const QString text = qs("@if (x {");

    EXPECT_FALSE(HeaderValidator::startsWithIfBlock(text));
    EXPECT_EQ(BraceAuditor().auditDocument(text).finalDepth, 1);
}

TEST(StructureScenarioTest, TransientNegativeDepthWithBalancedTotal) {
    const BraceAuditResult result =
        BraceAuditor().auditDocument(doc({"@if (a) {", "}", "}", "{", "<p>ok</p>"}));

    EXPECT_EQ(result.finalDepth, 0);
    ASSERT_EQ(result.errors.size(), 1);
    EXPECT_EQ(result.errors[0], qs("Line 3: extra closing '}' detected. depth 0 -> -1"));
}

TEST(StructureScenarioTest, ClosingAndReopeningOnOneLineBelowZero) {
    const BraceAuditResult result = BraceAuditor().auditDocument(doc({"@if (a) {", "}", "}}{", "}"}));

    EXPECT_EQ(result.finalDepth, -2);
    ASSERT_GE(result.errors.size(), 1);
    EXPECT_EQ(result.errors[0], qs("Line 3: extra closing '}' detected. depth 0 -> -1"));
}

// ============================================================================
// Properties
// ============================================================================

TEST(StructurePropertyTest, AuditsAreDeterministic) {
    for (const QString &text : sampleTemplates()) {
        const BraceAuditResult b1 = BraceAuditor().auditDocument(text);
        const BraceAuditResult b2 = BraceAuditor().auditDocument(text);
        EXPECT_EQ(b1.steps, b2.steps);
        EXPECT_EQ(b1.errors, b2.errors);

        const TagAuditResult t1 = TagAuditor().auditDocument(text);
        const TagAuditResult t2 = TagAuditor().auditDocument(text);
        EXPECT_EQ(t1.errors, t2.errors);
        EXPECT_EQ(t1.steps.size(), t2.steps.size());
        EXPECT_EQ(t1.finalDepth, t2.finalDepth);
    }
}

TEST(StructurePropertyTest, BraceAdditionBalancesWithoutLocalViolations) {
    for (const QString &text : sampleTemplates()) {
        const BraceAuditResult before = BraceAuditor().auditDocument(text);
        bool wentNegative = false;
        for (const DepthStep &step : before.steps)
            wentNegative = wentNegative || step.depthAfter < 0;
        if (before.finalDepth <= 0 || wentNegative)
            continue;

        BraceAuditResult after;
        BraceFixer().fix(text, &after);
        EXPECT_EQ(after.finalDepth, 0) << text.toStdString();
        EXPECT_TRUE(after.isClean()) << text.toStdString();
    }
}

TEST(StructurePropertyTest, TagFixerIsIdempotent) {
    for (const QString &text : sampleTemplates()) {
        const FixResult first = TagFixer().fix(text);
        const FixResult second = TagFixer().fix(first.text);
        EXPECT_EQ(second.text, first.text) << text.toStdString();

        const TagAuditor single(TagAuditOptions::singleTag(qs("div")));
        const FixResult singleFirst = TagFixer(single).fix(text);
        EXPECT_EQ(TagFixer(single).fix(singleFirst.text).text, singleFirst.text) << text.toStdString();
    }
}

TEST(StructurePropertyTest, FixesKeepLineCountStableOrGrowAtEnd) {
    for (const QString &text : sampleTemplates()) {
        const FixResult fix = BraceFixer().fix(text);
        if (BraceAuditor().auditDocument(text).finalDepth > 0)
            EXPECT_GE(fix.text.count(QLatin1Char('\n')), text.count(QLatin1Char('\n')));
        else
            EXPECT_LE(fix.text.count(QLatin1Char('\n')), text.count(QLatin1Char('\n')));
    }
}
