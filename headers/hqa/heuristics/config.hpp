#ifndef HQA_HEURISTICS_CONFIG_HPP
#define HQA_HEURISTICS_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Safety limits and quality thresholds for heuristic analysis.
 *
 * Thresholds follow the defaults of the common JavaScript lint rules:
 * - ESLint complexity: 10 (error escalation at 15)
 * - ESLint max-lines-per-function: 50
 * - ESLint max-params: 5 (reported from 6)
 * - ESLint max-depth: 4
 *
 * Safety limits bound every dimension of the scan so that adversarial
 * input cannot make the engine allocate or loop without bound.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace hqa::heuristics
{
    /**
     * @brief Hard ceilings applied to untrusted input.
     */
    struct Limits {
        /// Maximum accepted file size in bytes (inclusive)
        std::size_t max_file_size = 1'000'000;

        /// Maximum path length in characters
        std::size_t max_path_length = 500;

        /// Lines longer than this are skipped by every line scanner
        std::size_t max_line_length = 1000;

        /// Files with more lines degrade to an empty finding list
        std::size_t max_lines_per_file = 10'000;

        /// Maximum number of units extracted per file
        std::size_t max_units = 100;

        /// Unit bodies larger than this are dropped
        std::size_t max_body_chars = 50'000;

        /// Brace scanning stops after this many body lines
        std::size_t max_body_lines = 1000;

        /// Brace depth is clamped to this value
        std::size_t max_brace_depth = 50;

        /// Lines searched after a signature for the opening brace
        std::size_t brace_search_lines = 3;

        /// Findings kept per file after sorting
        std::size_t max_findings_per_file = 1000;

        /// Sanitized identifier length
        std::size_t max_name_length = 100;

        /// Raw parameter text above this length yields no parameters
        std::size_t max_parameter_text = 500;

        /// Sanitized parameter token length
        std::size_t max_parameter_length = 50;

        /// Maximum number of parameters kept per unit
        std::size_t max_parameters = 20;

        /// Maximum number of imports collected per file
        std::size_t max_imports = 200;

        /// Wall-clock budget for one file
        std::chrono::milliseconds analysis_time{30'000};
    };

    /**
     * @brief Metric thresholds that turn measurements into findings.
     */
    struct Thresholds {
        /// Cyclomatic proxy above this emits a warning
        std::size_t complexity = 10;

        /// Cyclomatic proxy above this escalates to an error
        std::size_t complexity_error = 15;

        /// Sanity ceiling for the cyclomatic proxy
        std::size_t complexity_ceiling = 999;

        /// Body line count above this emits a warning
        std::size_t function_length = 50;

        /// Parameter count above this emits a warning
        std::size_t parameter_count = 5;

        /// File-wide brace depth above this emits one finding
        std::size_t nesting_depth = 4;
    };

    /**
     * @brief Context words that make a numeric literal acceptable on a line.
     */
    struct MagicNumberConfig {
        std::vector<std::string> allow_list{"line", "port", "timeout", "version", "http"};
    };

    /**
     * @brief Inclusive low/medium/high boundaries for severity bucketing.
     */
    struct SeverityThresholds {
        double low = 0.0;
        double medium = 0.0;
        double high = 0.0;
    };

    /**
     * @brief Single-responsibility checker thresholds.
     */
    struct SRPConfig {
        SeverityThresholds method_count{10, 15, 20};
        SeverityThresholds complexity{20, 35, 50};
        SeverityThresholds concerns{3, 4, 5};
        SeverityThresholds class_lines{200, 300, 500};
        SeverityThresholds parameters{6, 8, 10};
        SeverityThresholds classes_per_file{3, 5, 8};
    };

    /**
     * @brief Dependency-inversion checker thresholds.
     */
    struct DIPConfig {
        SeverityThresholds instantiations{3, 5, 8};
    };

    /**
     * @brief Project walk settings.
     */
    struct ProjectConfig {
        std::vector<std::string> ignore_dirs{"node_modules", ".git", "dist", "build", "coverage"};
        std::size_t max_files = 10'000;
    };

    /**
     * @brief Aggregated heuristics configuration.
     */
    struct HeuristicsConfig {
        Limits limits;
        Thresholds thresholds;
        MagicNumberConfig magic_numbers;
        SRPConfig srp;
        DIPConfig dip;
        ProjectConfig project;

        static HeuristicsConfig defaults() {
            return HeuristicsConfig{};
        }
    };

}  // namespace hqa::heuristics

#endif // HQA_HEURISTICS_CONFIG_HPP
