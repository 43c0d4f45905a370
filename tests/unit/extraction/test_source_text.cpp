#include <gtest/gtest.h>
#include "hqa/extraction/source_text.hpp"
#include "hqa/utils/string_utils.hpp"

using namespace hqa;
using namespace hqa::extraction;

TEST(SourceTextTest, SplitsLines) {
    const SourceText text("a\r\nb\nc");

    ASSERT_EQ(text.line_count(), 3u);
    EXPECT_EQ(text.line(0), "a");
    EXPECT_EQ(text.line(1), "b");
    EXPECT_EQ(text.line(2), "c");
}

TEST(SourceTextTest, MaskedLinesKeepLength) {
    const SourceText text("const a = 'x // y'; // tail");

    ASSERT_EQ(text.line_count(), 1u);
    EXPECT_EQ(text.code(0).size(), text.line(0).size());
}

TEST(SourceTextTest, MasksLineCommentAndStringContents) {
    const SourceText text("const a = 'x // y'; // tail");
    const std::string code(text.code(0));

    EXPECT_EQ(string_utils::trim(code), "const a = '      ';");
    EXPECT_FALSE(string_utils::contains(code, "tail"));
}

TEST(SourceTextTest, MasksBlockCommentAcrossLines) {
    const SourceText text("a /* one\n two */ b\nc");

    EXPECT_EQ(string_utils::trim(text.code(0)), "a");
    EXPECT_EQ(string_utils::trim(text.code(1)), "b");
    EXPECT_EQ(text.code(2), "c");
}

TEST(SourceTextTest, MasksTemplateLiteralAcrossLines) {
    const SourceText text("const t = `first\nsecond ${x}` + y;");
    const std::string second(text.code(1));

    EXPECT_FALSE(string_utils::contains(second, "second"));
    EXPECT_TRUE(string_utils::contains(second, "` + y;"));
}

TEST(SourceTextTest, HandlesEscapedQuotes) {
    const SourceText text(R"(const s = 'it\'s' + z;)");
    const std::string code(text.code(0));

    EXPECT_TRUE(string_utils::contains(code, "+ z;"));
    EXPECT_FALSE(string_utils::contains(code, "it"));
}

TEST(SourceTextTest, UnterminatedQuoteEndsAtLineBreak) {
    const SourceText text("const s = 'abc\nvar y = 1;");

    EXPECT_EQ(text.code(1), "var y = 1;");
}

TEST(SourceTextTest, QuotesInsideRegexLiteralsDoNotOpenStrings) {
    const SourceText text("const a = /'/;\nconst b = /\"/;\nconst c = /`/;\nvar d = 1;");

    EXPECT_EQ(text.code(0), "const a = / /;");
    EXPECT_EQ(text.code(1), "const b = / /;");
    EXPECT_EQ(text.code(2), "const c = / /;");
    EXPECT_EQ(text.code(3), "var d = 1;");
}

TEST(SourceTextTest, RegexLiteralClassesAndEscapes) {
    const SourceText text(R"(if (/[/'`]/.test(s) || /a\/"b/.test(s)) { go(); })");

    EXPECT_EQ(text.code(0), R"(if (/     /.test(s) || /     /.test(s)) { go(); })");
}

TEST(SourceTextTest, RegexLiteralAfterKeyword) {
    const SourceText text("return /'/.test(s);");

    EXPECT_EQ(text.code(0), "return / /.test(s);");
}

TEST(SourceTextTest, DivisionIsNotARegexLiteral) {
    const SourceText text("const half = total / 2 / count; const s = 'a';");

    EXPECT_EQ(text.code(0), "const half = total / 2 / count; const s = ' ';");
}

TEST(SourceTextTest, BlankCode) {
    const SourceText text("// only a comment\n\n   \nx = 1;\n/* block */");

    EXPECT_TRUE(text.is_blank_code(0));
    EXPECT_TRUE(text.is_blank_code(1));
    EXPECT_TRUE(text.is_blank_code(2));
    EXPECT_FALSE(text.is_blank_code(3));
    EXPECT_TRUE(text.is_blank_code(4));
}

TEST(SourceTextTest, Spans) {
    const SourceText text("  foo() {\n    return 1;\n  }");

    EXPECT_EQ(text.raw_span(0, 2, 2), "foo() {\n    return 1;\n  }");
    EXPECT_EQ(text.raw_span(1, 1), "    return 1;");
    EXPECT_EQ(text.raw_span(0, 99, 2), "foo() {\n    return 1;\n  }");
    EXPECT_TRUE(text.raw_span(5, 6).empty());
}

TEST(SourceTextTest, EmptyContent) {
    const SourceText text("");

    ASSERT_EQ(text.line_count(), 1u);
    EXPECT_TRUE(text.is_blank_code(0));
}
