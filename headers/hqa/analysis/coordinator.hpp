#ifndef HQA_COORDINATOR_HPP
#define HQA_COORDINATOR_HPP

/**
 * @file coordinator.hpp
 * @brief Entry point that runs the full pipeline on files and projects.
 *
 * Per file, the coordinator runs:
 * 1. InputGuard: path and content validation, bounded read
 * 2. StructuralExtractor: units under the time budget
 * 3. Detectors and calculators, each inside its own error boundary
 * 4. Location clamping, ordering by (line, column) and truncation
 *
 * Project runs replace steps 3 and 4 with the principle checkers and
 * aggregate their violations into a ProjectReport.
 *
 * Nothing thrown by a stage escapes a public method. A file that fails,
 * times out or is cancelled yields an empty result and a metrics update;
 * it never affects other files. Several threads may call the analyze
 * methods on one coordinator at once.
 *
 * @code
 *     hqa::analysis::AnalysisCoordinator coordinator;
 *     auto findings = coordinator.analyze_file("src/app.js", "javascript");
 *     auto report = coordinator.analyze_project("src");
 * @endcode
 */

#include "hqa/types.hpp"
#include "hqa/core/config.hpp"
#include "hqa/analysis/analysis_metrics.hpp"
#include "hqa/analysis/project_report.hpp"
#include "hqa/security/input_guard.h"
#include "hqa/extraction/structural_extractor.hpp"
#include "hqa/detectors/detector.hpp"
#include "hqa/metrics/calculator.hpp"
#include "hqa/principles/principle_checker.hpp"
#include "hqa/i18n/translator.hpp"

#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <vector>

namespace hqa::analysis {

    class AnalysisCoordinator {
    public:
        /**
         * @param config Limits, thresholds and catalog settings.
         * @param metrics Counters to update; shared with the caller so
         *        they can be read while analysis runs.
         */
        explicit AnalysisCoordinator(
            core::Config config = core::Config::default_config(),
            std::shared_ptr<AnalysisMetrics> metrics = std::make_shared<AnalysisMetrics>()
        );

        /**
         * Runs the given detectors and calculators in place of the standard
         * sets. Principle checkers are always the standard ones.
         */
        AnalysisCoordinator(
            core::Config config,
            std::vector<std::unique_ptr<detectors::IDetector>> detectors,
            std::vector<std::unique_ptr<metrics::IMetricCalculator>> calculators,
            std::shared_ptr<AnalysisMetrics> metrics = std::make_shared<AnalysisMetrics>()
        );

        AnalysisCoordinator(const AnalysisCoordinator&) = delete;
        AnalysisCoordinator& operator=(const AnalysisCoordinator&) = delete;

        /**
         * Reads and analyzes one file.
         *
         * @param path File to analyze.
         * @param language Declared language tag, e.g. "javascript" or "ts".
         * @param stop Optional cancellation token.
         * @return Findings ordered by (line, column); empty on rejection,
         *         unsupported language, timeout or failure.
         */
        [[nodiscard]] std::vector<Finding> analyze_file(
            const fs::path& path,
            std::string_view language,
            std::stop_token stop = {}
        ) const;

        /**
         * Analyzes content the caller already holds. The path is used for
         * validation and display only.
         */
        [[nodiscard]] std::vector<Finding> analyze_content(
            const fs::path& path,
            std::string_view content,
            std::string_view language,
            std::stop_token stop = {}
        ) const;

        /**
         * Walks root, skipping the configured ignore_dirs, and runs every
         * principle checker on each source file.
         *
         * @param root Project directory.
         * @param language Declared tag for every file, or empty to infer the
         *        language from each file extension.
         */
        [[nodiscard]] ProjectReport analyze_project(
            const fs::path& root,
            std::string_view language = {}
        ) const;

        /**
         * Same as analyze_project() over an explicit file list.
         */
        [[nodiscard]] ProjectReport analyze_files(
            const std::vector<fs::path>& paths,
            std::string_view language = {}
        ) const;

        [[nodiscard]] MetricsSnapshot get_metrics() const noexcept { return metrics_->snapshot(); }

        void reset_metrics() noexcept { metrics_->reset(); }

        [[nodiscard]] std::shared_ptr<AnalysisMetrics> metrics_handle() const noexcept { return metrics_; }

        [[nodiscard]] const core::Config& config() const noexcept { return config_; }

        /**
         * The message catalog, initialized on first use.
         */
        [[nodiscard]] const i18n::Translator& translator() const;

    private:
        void ensure_initialized() const;

        [[nodiscard]] std::vector<Finding> run_analysis(const AnalysisContext& context,
                                                        std::stop_token stop) const;

        std::vector<Finding> abort_file(const AnalysisContext& context, const Error& error) const;

        void analyze_structure(const fs::path& path, Language language, ProjectReport& report) const;

        [[nodiscard]] std::vector<Finding> finalize(std::vector<Finding> findings,
                                                    const extraction::SourceText& text) const;

        core::Config config_;
        std::shared_ptr<AnalysisMetrics> metrics_;
        security::InputGuard guard_;
        extraction::StructuralExtractor extractor_;

        mutable i18n::Translator translator_;
        mutable std::once_flag init_flag_;

        std::vector<std::unique_ptr<detectors::IDetector>> detectors_;
        std::vector<std::unique_ptr<metrics::IMetricCalculator>> calculators_;
        std::vector<std::unique_ptr<principles::PrincipleChecker>> checkers_;
    };

}  // namespace hqa::analysis

#endif // HQA_COORDINATOR_HPP
