#ifndef HQA_CALCULATOR_HPP
#define HQA_CALCULATOR_HPP

/**
 * @file calculator.hpp
 * @brief Metric calculator interface and the standard calculators.
 *
 * Calculators measure units (or the whole file) and turn threshold
 * breaches into Findings. Unit-based calculators return nothing when the
 * extractor produced no units; the file-wide nesting calculator does not
 * depend on units at all.
 */

#include "hqa/types.hpp"
#include "hqa/heuristics/config.hpp"
#include "hqa/extraction/source_text.hpp"
#include "hqa/i18n/translator.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace hqa::metrics {

    struct MetricContext {
        const extraction::SourceText& text;
        const std::vector<SourceUnit>& units;
        const heuristics::HeuristicsConfig& config;
        const i18n::Translator& translator;
    };

    class IMetricCalculator {
    public:
        virtual ~IMetricCalculator() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::vector<Finding> calculate(const MetricContext& context) const = 0;
    };

    /**
     * Cyclomatic proxy per unit. Warning above thresholds.complexity,
     * error above thresholds.complexity_error.
     */
    class ComplexityCalculator final : public IMetricCalculator {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "complexity"; }
        [[nodiscard]] std::vector<Finding> calculate(const MetricContext& context) const override;
    };

    class FunctionLengthCalculator final : public IMetricCalculator {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "function-length"; }
        [[nodiscard]] std::vector<Finding> calculate(const MetricContext& context) const override;
    };

    class ParameterCountCalculator final : public IMetricCalculator {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "parameter-count"; }
        [[nodiscard]] std::vector<Finding> calculate(const MetricContext& context) const override;
    };

    /**
     * File-wide brace depth. At most one finding, at the line where the
     * maximum depth was first reached.
     */
    class NestingDepthCalculator final : public IMetricCalculator {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "nesting-depth"; }
        [[nodiscard]] std::vector<Finding> calculate(const MetricContext& context) const override;
    };

    [[nodiscard]] std::vector<std::unique_ptr<IMetricCalculator>> make_default_calculators();

}  // namespace hqa::metrics

#endif // HQA_CALCULATOR_HPP
