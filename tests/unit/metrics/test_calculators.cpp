#include <gtest/gtest.h>
#include "hqa/metrics/calculator.hpp"
#include "hqa/extraction/structural_extractor.hpp"

#include <string>

using namespace hqa;
using namespace hqa::metrics;

class CalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        translator.initialize();
    }

    [[nodiscard]] std::vector<Finding> run(const IMetricCalculator& calculator, const std::string& content) const {
        const extraction::SourceText text(content);
        const extraction::StructuralExtractor extractor(config.limits);
        const auto units = extractor.extract(text);
        EXPECT_TRUE(units.is_ok());
        const MetricContext context{text, units.value(), config, translator};
        return calculator.calculate(context);
    }

    static std::string branching_function(const int branches) {
        std::string code = "function busy(a) {\n";
        for (int i = 0; i < branches; ++i) {
            code += "  if (a) { a--; }\n";
        }
        code += "}\n";
        return code;
    }

    heuristics::HeuristicsConfig config;
    i18n::Translator translator;
};

TEST_F(CalculatorTest, DefaultSet) {
    const auto calculators = make_default_calculators();

    ASSERT_EQ(calculators.size(), 4u);
    EXPECT_EQ(calculators[0]->name(), "complexity");
    EXPECT_EQ(calculators[1]->name(), "function-length");
    EXPECT_EQ(calculators[2]->name(), "parameter-count");
    EXPECT_EQ(calculators[3]->name(), "nesting-depth");
}

TEST_F(CalculatorTest, Complexity_AtThresholdIsQuiet) {
    const ComplexityCalculator calculator;

    EXPECT_TRUE(run(calculator, branching_function(9)).empty());
}

TEST_F(CalculatorTest, Complexity_Warning) {
    const ComplexityCalculator calculator;

    const auto findings = run(calculator, branching_function(11));

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].type, FindingType::Complexity);
    EXPECT_EQ(findings[0].severity, Severity::Warning);
    EXPECT_EQ(findings[0].rule, "complexity");
    EXPECT_EQ(findings[0].line, 1u);
    EXPECT_EQ(findings[0].message, "Function 'busy' has a complexity of 12 (threshold 10)");
}

TEST_F(CalculatorTest, Complexity_EscalatesToError) {
    const ComplexityCalculator calculator;

    const auto findings = run(calculator, branching_function(16));

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].severity, Severity::Error);
}

TEST_F(CalculatorTest, FunctionLength) {
    const FunctionLengthCalculator calculator;
    std::string code = "function long_one() {\n";
    for (int i = 0; i < 60; ++i) {
        code += "  step();\n";
    }
    code += "}\n";

    const auto findings = run(calculator, code);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].type, FindingType::FunctionLength);
    EXPECT_EQ(findings[0].rule, "max-lines-per-function");
    EXPECT_EQ(findings[0].message, "Function 'long_one' has 62 lines (threshold 50)");
}

TEST_F(CalculatorTest, FunctionLength_ShortFunctionIsQuiet) {
    const FunctionLengthCalculator calculator;

    EXPECT_TRUE(run(calculator, "function short_one() {\n  return 1;\n}\n").empty());
}

TEST_F(CalculatorTest, ParameterCount) {
    const ParameterCountCalculator calculator;

    const auto findings = run(calculator,
        "function five(a, b, c, d, e) {\n}\n"
        "function six(a, b, c, d, e, f) {\n}\n");

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].type, FindingType::ParameterCount);
    EXPECT_EQ(findings[0].rule, "max-params");
    EXPECT_EQ(findings[0].line, 3u);
    EXPECT_EQ(findings[0].message, "Function 'six' has 6 parameters (threshold 5)");
}

TEST_F(CalculatorTest, NestingDepth_SingleFindingAtDeepestLine) {
    const NestingDepthCalculator calculator;

    const auto findings = run(calculator,
        "function a() {\n"
        "  if (b) {\n"
        "    if (c) {\n"
        "      while (d) {\n"
        "        for (;;) {\n"
        "          if (e) {\n"
        "            go();\n"
        "          }\n"
        "        }\n"
        "      }\n"
        "    }\n"
        "  }\n"
        "}\n");

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].type, FindingType::NestingDepth);
    EXPECT_EQ(findings[0].rule, "max-depth");
    EXPECT_EQ(findings[0].line, 6u);
    EXPECT_EQ(findings[0].column, 1u);
}

TEST_F(CalculatorTest, NestingDepth_RunsWithoutUnits) {
    const NestingDepthCalculator calculator;

    const auto findings = run(calculator, "{\n{\n{\n{\n{\n}\n}\n}\n}\n}\n");

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].line, 5u);
}

TEST_F(CalculatorTest, UnitCalculatorsNeedUnits) {
    const std::string no_units = "const a = 1;\nconst b = a + 2;\n";

    EXPECT_TRUE(run(ComplexityCalculator{}, no_units).empty());
    EXPECT_TRUE(run(FunctionLengthCalculator{}, no_units).empty());
    EXPECT_TRUE(run(ParameterCountCalculator{}, no_units).empty());
}

TEST_F(CalculatorTest, ThresholdsComeFromConfig) {
    config.thresholds.parameter_count = 1;
    const ParameterCountCalculator calculator;

    EXPECT_EQ(run(calculator, "function two(a, b) {\n}\n").size(), 1u);
}
