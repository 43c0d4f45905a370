#ifndef HQA_PATTERN_DETECTORS_HPP
#define HQA_PATTERN_DETECTORS_HPP

#include "hqa/detectors/detector.hpp"

namespace hqa::detectors {

    /**
     * Reports `var` declarations at a statement boundary.
     */
    class DeprecatedDeclarationDetector final : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "deprecated-declaration";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds function-scoped 'var' declarations";
        }

        [[nodiscard]] std::vector<Finding> detect(const DetectionContext& context) const override;
    };

    /**
     * Reports loose equality operators that are not part of `===` or `!==`.
     */
    class WeakEqualityDetector final : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "weak-equality";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds '==' and '!=' comparisons";
        }

        [[nodiscard]] std::vector<Finding> detect(const DetectionContext& context) const override;
    };

    class DebugStatementDetector final : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "debug-statement";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds console output calls left in the code";
        }

        [[nodiscard]] std::vector<Finding> detect(const DetectionContext& context) const override;
    };

    /**
     * Reports integer literals of two or more digits.
     *
     * A line is skipped when its raw text contains a word from the
     * configured allow-list (case-insensitive), or when it declares an
     * UPPER_CASE constant, since that is the fix this detector asks for.
     */
    class MagicNumberDetector final : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "unnamed-constant";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds unnamed numeric constants";
        }

        [[nodiscard]] std::vector<Finding> detect(const DetectionContext& context) const override;
    };

}  // namespace hqa::detectors

#endif // HQA_PATTERN_DETECTORS_HPP
