#include <gtest/gtest.h>
#include "hqa/extraction/structural_extractor.hpp"

#include <chrono>
#include <string>

using namespace hqa;
using namespace hqa::extraction;

class StructuralExtractorTest : public ::testing::Test {
protected:
    [[nodiscard]] std::vector<SourceUnit> extract(const std::string& content) const {
        auto result = extractor.extract(content);
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value() : std::vector<SourceUnit>{};
    }

    heuristics::Limits limits;
    StructuralExtractor extractor{limits};
};

TEST_F(StructuralExtractorTest, FunctionDeclaration) {
    const auto units = extract("function add(a, b) {\n  return a + b;\n}\n");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].name, "add");
    EXPECT_EQ(units[0].parameters, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(units[0].start_line, 1u);
    EXPECT_EQ(units[0].start_column, 1u);
    EXPECT_EQ(units[0].end_line, 3u);
    EXPECT_EQ(units[0].line_count(), 3u);
}

TEST_F(StructuralExtractorTest, ArrowFunctionBinding) {
    const auto units = extract("const mul = (x, y) => {\n  return x * y;\n};\n");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].name, "mul");
    EXPECT_EQ(units[0].start_column, 7u);
    EXPECT_EQ(units[0].end_line, 3u);
}

TEST_F(StructuralExtractorTest, ExpressionBodiedArrowIsSingleLine) {
    const auto units = extract("const inc = (n) => n + 1;\nconst next = 2;\n");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].name, "inc");
    EXPECT_EQ(units[0].start_line, 1u);
    EXPECT_EQ(units[0].end_line, 1u);
}

TEST_F(StructuralExtractorTest, AsyncFunctionExpressionAndObjectMethod) {
    const auto units = extract(
        "const load = async function (url) {\n"
        "  return url;\n"
        "};\n"
        "const api = {\n"
        "  save: function (record) {\n"
        "    return record;\n"
        "  },\n"
        "};\n");

    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0].name, "load");
    EXPECT_EQ(units[1].name, "save");
    EXPECT_EQ(units[1].parameters, (std::vector<std::string>{"record"}));
}

TEST_F(StructuralExtractorTest, ClassMethod) {
    const auto units = extract("class Cart {\n  total(items) {\n    return items.length;\n  }\n}\n");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].name, "total");
    EXPECT_EQ(units[0].start_line, 2u);
    EXPECT_EQ(units[0].start_column, 3u);
    EXPECT_EQ(units[0].end_line, 4u);
}

TEST_F(StructuralExtractorTest, TypeScriptReturnAnnotation) {
    const auto units = extract("function size(list: string[]): number {\n  return list.length;\n}\n");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].name, "size");
    EXPECT_EQ(units[0].parameters, (std::vector<std::string>{"list"}));
}

TEST_F(StructuralExtractorTest, ControlStatementsAreNotUnits) {
    const auto units = extract("if (ready) {\n  go();\n}\nwhile (busy) {\n  wait();\n}\n");

    EXPECT_TRUE(units.empty());
}

TEST_F(StructuralExtractorTest, CommentedSignaturesAreIgnored) {
    const auto units = extract("// function hidden(a) {\n/* function other(b) { */\n");

    EXPECT_TRUE(units.empty());
}

TEST_F(StructuralExtractorTest, MissingBraceWithinSearchWindowDropsUnit) {
    const auto units = extract("function late(a)\n\n\n\n\n{\n}\n");

    EXPECT_TRUE(units.empty());
}

TEST_F(StructuralExtractorTest, UnitCeiling) {
    heuristics::Limits small;
    small.max_units = 2;
    const StructuralExtractor capped(small);

    const auto result = capped.extract(
        "function a() {\n}\nfunction b() {\n}\nfunction c() {\n}\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 2u);
}

TEST_F(StructuralExtractorTest, OversizedBodyDropsUnit) {
    heuristics::Limits small;
    small.max_body_chars = 10;
    const StructuralExtractor capped(small);

    const auto result = capped.extract("function big() {\n  return 12345678;\n}\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(StructuralExtractorTest, ExpiredBudgetReturnsTimeout) {
    security::ResourceLimiter limiter({std::chrono::milliseconds(0), 1000});
    limiter.start_timer();

    const auto result = extractor.extract("function a() {\n}\n", &limiter);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
}

TEST_F(StructuralExtractorTest, ParseParameters) {
    EXPECT_EQ(extractor.parse_parameters("a = 1, ...rest, d: string, e"),
              (std::vector<std::string>{"a", "rest", "d", "e"}));
    EXPECT_EQ(extractor.parse_parameters("cb = (x, y) => x, z"),
              (std::vector<std::string>{"cb", "z"}));
    EXPECT_TRUE(extractor.parse_parameters("   ").empty());
}

TEST_F(StructuralExtractorTest, ParseParameters_Limits) {
    EXPECT_TRUE(extractor.parse_parameters(std::string(501, 'a')).empty());

    std::string many;
    for (int i = 0; i < 25; ++i) {
        many += (i ? ", p" : "p") + std::to_string(i);
    }
    EXPECT_EQ(extractor.parse_parameters(many).size(), 20u);

    const auto longest = extractor.parse_parameters(std::string(80, 'q'));
    ASSERT_EQ(longest.size(), 1u);
    EXPECT_EQ(longest[0].size(), 50u);
}

TEST_F(StructuralExtractorTest, FindBody) {
    const SourceText text("function f() {\n  if (a) {\n    b();\n  }\n}\nafter();");

    const auto span = extractor.find_body(text, 0, 0);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->first_line, 0u);
    EXPECT_EQ(span->last_line, 4u);
}

TEST_F(StructuralExtractorTest, FindBody_UnclosedRunsToEnd) {
    const SourceText text("function f() {\n  return 1;\n");

    const auto span = extractor.find_body(text, 0, 0);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->last_line, 2u);
}

TEST_F(StructuralExtractorTest, ExtractImports) {
    const SourceText text(
        "import React from 'react';\n"
        "const fs = require(\"fs\");\n"
        "import './styles.css';\n"
        "const lazy = import('./lazy');\n"
        "import { useState } from 'react';\n"
        "// import hidden from 'hidden';\n");

    const auto imports = extractor.extract_imports(text);

    EXPECT_EQ(imports, (std::vector<std::string>{"react", "fs", "./styles.css", "./lazy"}));
}

TEST_F(StructuralExtractorTest, ExtractClasses) {
    const SourceText text(
        "class Account {\n"
        "  constructor(owner) {\n"
        "    this.owner = owner;\n"
        "  }\n"
        "  deposit(amount) {\n"
        "    return amount;\n"
        "  }\n"
        "  withdraw(amount) {\n"
        "    return amount;\n"
        "  }\n"
        "}\n");
    const auto units = extractor.extract(text);
    ASSERT_TRUE(units.is_ok());
    ASSERT_EQ(units.value().size(), 3u);

    const auto classes = extractor.extract_classes(text, units.value());

    ASSERT_EQ(classes.size(), 1u);
    EXPECT_EQ(classes[0].name, "Account");
    EXPECT_EQ(classes[0].line, 1u);
    EXPECT_EQ(classes[0].end_line, 11u);
    ASSERT_EQ(classes[0].methods.size(), 2u);
    EXPECT_EQ(classes[0].methods[0].name, "deposit");
    EXPECT_EQ(classes[0].methods[1].name, "withdraw");
}

TEST_F(StructuralExtractorTest, ExtractClasses_NestedUnitsAreNotMethods) {
    const SourceText text(
        "class Runner {\n"
        "  start() {\n"
        "    const step = () => {\n"
        "      return 1;\n"
        "    };\n"
        "    return step;\n"
        "  }\n"
        "}\n");
    const auto units = extractor.extract(text);
    ASSERT_TRUE(units.is_ok());
    ASSERT_EQ(units.value().size(), 2u);

    const auto classes = extractor.extract_classes(text, units.value());

    ASSERT_EQ(classes.size(), 1u);
    ASSERT_EQ(classes[0].methods.size(), 1u);
    EXPECT_EQ(classes[0].methods[0].name, "start");
}
