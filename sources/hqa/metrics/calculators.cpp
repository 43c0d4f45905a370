#include "hqa/metrics/calculator.hpp"
#include "hqa/metrics/complexity.hpp"

#include <string>

namespace hqa::metrics
{
    namespace {

        Finding make_unit_finding(const MetricContext& context, const SourceUnit& unit,
                                  FindingType type, Severity severity, std::string rule,
                                  std::string_view message_key, std::string_view suggestion_key,
                                  std::size_t value, std::size_t threshold) {
            const i18n::Params params{
                {"name", unit.name},
                {"value", std::to_string(value)},
                {"threshold", std::to_string(threshold)}
            };

            Finding finding;
            finding.type = type;
            finding.severity = severity;
            finding.line = unit.start_line;
            finding.column = unit.start_column;
            finding.rule = std::move(rule);
            finding.message = context.translator.translate(message_key, params);
            finding.suggestion = context.translator.translate(suggestion_key, params);
            return finding;
        }

    }  // namespace

    std::vector<Finding> ComplexityCalculator::calculate(const MetricContext& context) const {
        std::vector<Finding> findings;
        const auto& thresholds = context.config.thresholds;

        for (const auto& unit : context.units) {
            const std::size_t complexity = cyclomatic_complexity(unit.code, thresholds.complexity_ceiling);
            if (complexity <= thresholds.complexity) {
                continue;
            }

            const auto severity = complexity > thresholds.complexity_error ? Severity::Error : Severity::Warning;
            findings.push_back(make_unit_finding(context, unit, FindingType::Complexity, severity, "complexity",
                                                 "findings.complexity.message", "findings.complexity.suggestion",
                                                 complexity, thresholds.complexity));
        }

        return findings;
    }

    std::vector<Finding> FunctionLengthCalculator::calculate(const MetricContext& context) const {
        std::vector<Finding> findings;
        const auto threshold = context.config.thresholds.function_length;

        for (const auto& unit : context.units) {
            if (const std::size_t lines = unit.line_count(); lines > threshold) {
                findings.push_back(make_unit_finding(context, unit, FindingType::FunctionLength, Severity::Warning,
                                                     "max-lines-per-function",
                                                     "findings.function_length.message",
                                                     "findings.function_length.suggestion",
                                                     lines, threshold));
            }
        }

        return findings;
    }

    std::vector<Finding> ParameterCountCalculator::calculate(const MetricContext& context) const {
        std::vector<Finding> findings;
        const auto threshold = context.config.thresholds.parameter_count;

        for (const auto& unit : context.units) {
            if (const std::size_t count = unit.parameters.size(); count > threshold) {
                findings.push_back(make_unit_finding(context, unit, FindingType::ParameterCount, Severity::Warning,
                                                     "max-params",
                                                     "findings.parameter_count.message",
                                                     "findings.parameter_count.suggestion",
                                                     count, threshold));
            }
        }

        return findings;
    }

    std::vector<Finding> NestingDepthCalculator::calculate(const MetricContext& context) const {
        std::vector<Finding> findings;
        const auto threshold = context.config.thresholds.nesting_depth;

        const auto nesting = max_nesting_depth(context.text.code_lines(), context.config.limits.max_brace_depth);
        if (nesting.depth <= threshold) {
            return findings;
        }

        const i18n::Params params{
            {"value", std::to_string(nesting.depth)},
            {"threshold", std::to_string(threshold)}
        };

        Finding finding;
        finding.type = FindingType::NestingDepth;
        finding.severity = Severity::Warning;
        finding.line = nesting.line;
        finding.column = 1;
        finding.rule = "max-depth";
        finding.message = context.translator.translate("findings.nesting_depth.message", params);
        finding.suggestion = context.translator.translate("findings.nesting_depth.suggestion", params);
        findings.push_back(std::move(finding));

        return findings;
    }

    std::vector<std::unique_ptr<IMetricCalculator>> make_default_calculators() {
        std::vector<std::unique_ptr<IMetricCalculator>> calculators;
        calculators.push_back(std::make_unique<ComplexityCalculator>());
        calculators.push_back(std::make_unique<FunctionLengthCalculator>());
        calculators.push_back(std::make_unique<ParameterCountCalculator>());
        calculators.push_back(std::make_unique<NestingDepthCalculator>());
        return calculators;
    }

}  // namespace hqa::metrics
