#ifndef HQA_PROJECT_REPORT_HPP
#define HQA_PROJECT_REPORT_HPP

/**
 * @file project_report.hpp
 * @brief Aggregated result of a principle check over many files.
 *
 * Scoring:
 * - file score: max(0, 100 - sum of severity weights), with weights
 *   critical 10, high 6, medium 3, low 1
 * - overall score: mean of the file scores of every analyzed file
 * - principle score: max(0, 100 - 5 * violations of that principle)
 */

#include "hqa/types.hpp"
#include "hqa/analysis/analysis_metrics.hpp"

#include <map>
#include <string>
#include <vector>

namespace hqa::analysis {

    /**
     * A file that was not analyzed, with the reason.
     */
    struct SkippedFile {
        std::string file;
        std::string reason;
    };

    struct FileScore {
        std::string file;
        double score = 100.0;
        std::size_t violations = 0;
    };

    struct PrincipleSummary {
        std::size_t violations = 0;
        double score = 100.0;
    };

    struct ProjectReport {
        std::vector<Violation> violations;
        std::size_t files_discovered = 0;
        std::size_t files_analyzed = 0;
        std::vector<SkippedFile> skipped;
        std::vector<FileScore> file_scores;
        double overall_score = 100.0;
        std::map<Principle, PrincipleSummary> principles;
        MetricsSnapshot metrics;
    };

    [[nodiscard]] double severity_weight(ViolationSeverity severity) noexcept;

    /**
     * Score of one file from its violations.
     */
    [[nodiscard]] double file_score(const std::vector<Violation>& violations) noexcept;

    /**
     * Fills overall_score and the per-principle summaries from
     * file_scores and violations.
     *
     * @param report Report to update.
     * @param checked Principles that were checked; each gets a summary
     *        even when it has no violation.
     */
    void compute_scores(ProjectReport& report, const std::vector<Principle>& checked);

}  // namespace hqa::analysis

#endif // HQA_PROJECT_REPORT_HPP
