#include <gtest/gtest.h>
#include "hqa/utils/string_utils.hpp"

using namespace hqa::string_utils;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  var x = 1;\t"), "var x = 1;");
    EXPECT_EQ(trim_left("  a "), "a ");
    EXPECT_EQ(trim_right("  a "), "  a");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringUtilsTest, Split) {
    const auto parts = split("a, b,,c", ',');

    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], " b");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "c");
}

TEST(StringUtilsTest, SplitLines_DropsCarriageReturns) {
    const auto lines = split_lines("one\r\ntwo\nthree");

    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(StringUtilsTest, SplitLines_TrailingNewlineYieldsEmptyLastLine) {
    EXPECT_EQ(split_lines("a\n").size(), 2u);
    EXPECT_EQ(split_lines("").size(), 1u);
}

TEST(StringUtilsTest, Join) {
    EXPECT_EQ(join(std::vector<std::string>{"Database", "Mailer"}, ", "), "Database, Mailer");
    EXPECT_EQ(join(std::vector<std::string>{}, ", "), "");
}

TEST(StringUtilsTest, ToLowerAndContains) {
    EXPECT_EQ(to_lower("TypeScript"), "typescript");
    EXPECT_TRUE(contains("console.log(x)", "console."));
    EXPECT_FALSE(contains("logger.info(x)", "console."));
}

TEST(StringUtilsTest, ReplaceAll) {
    EXPECT_EQ(replace_all("a == b == c", "==", "==="), "a === b === c");
    EXPECT_EQ(replace_all("abc", "", "x"), "abc");
}

TEST(StringUtilsTest, IsWordAt) {
    const std::string_view line = "var variable = avar;";

    EXPECT_TRUE(is_word_at(line, 0, "var"));
    EXPECT_FALSE(is_word_at(line, 4, "var"));
    EXPECT_FALSE(is_word_at(line, 16, "var"));
    EXPECT_FALSE(is_word_at(line, 30, "var"));
}

TEST(StringUtilsTest, IdentifierChars) {
    EXPECT_TRUE(is_identifier_char('$'));
    EXPECT_TRUE(is_identifier_char('_'));
    EXPECT_FALSE(is_identifier_char('-'));
    EXPECT_EQ(keep_identifier_chars("get-user<script>", 100), "getuserscript");
    EXPECT_EQ(keep_identifier_chars("abcdef", 3), "abc");
}
