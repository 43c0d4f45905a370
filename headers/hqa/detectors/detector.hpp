#ifndef HQA_DETECTOR_HPP
#define HQA_DETECTOR_HPP

/**
 * @file detector.hpp
 * @brief Pattern detector interface.
 *
 * A detector scans the lines of one file for a single anti-pattern family
 * and reports every occurrence as a Finding. Detectors are independent and
 * order-insensitive. They match on the masked view of each line, so text
 * inside comments and string literals never produces a finding.
 *
 * Detector families:
 * - DeprecatedDeclarationDetector: function-scoped `var` declarations
 * - WeakEqualityDetector: `==` and `!=`
 * - DebugStatementDetector: console output calls
 * - MagicNumberDetector: unnamed integer literals of 20 and above
 */

#include "hqa/types.hpp"
#include "hqa/heuristics/config.hpp"
#include "hqa/extraction/source_text.hpp"
#include "hqa/i18n/translator.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace hqa::detectors {

    /**
     * Read-only inputs shared by all detectors for one file.
     */
    struct DetectionContext {
        const extraction::SourceText& text;
        const heuristics::HeuristicsConfig& config;
        const i18n::Translator& translator;
    };

    /**
     * Base interface for all pattern detectors.
     */
    class IDetector {
    public:
        virtual ~IDetector() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Scans every line of the file.
         *
         * @param context File text, configuration and message catalog.
         * @return One Finding per occurrence, in line order.
         */
        [[nodiscard]] virtual std::vector<Finding> detect(const DetectionContext& context) const = 0;
    };

    /**
     * Creates the standard detector set in reporting order.
     */
    [[nodiscard]] std::vector<std::unique_ptr<IDetector>> make_default_detectors();

}  // namespace hqa::detectors

#endif // HQA_DETECTOR_HPP
