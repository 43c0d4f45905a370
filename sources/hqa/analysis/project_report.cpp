#include "hqa/analysis/project_report.hpp"

#include <algorithm>

namespace hqa::analysis
{
    double severity_weight(const ViolationSeverity severity) noexcept {
        switch (severity) {
            case ViolationSeverity::Critical: return 10.0;
            case ViolationSeverity::High:     return 6.0;
            case ViolationSeverity::Medium:   return 3.0;
            case ViolationSeverity::Low:      return 1.0;
        }
        return 0.0;
    }

    double file_score(const std::vector<Violation>& violations) noexcept {
        double penalty = 0.0;
        for (const auto& violation : violations) {
            penalty += severity_weight(violation.severity);
        }
        return std::max(0.0, 100.0 - penalty);
    }

    void compute_scores(ProjectReport& report, const std::vector<Principle>& checked) {
        if (report.file_scores.empty()) {
            report.overall_score = 100.0;
        } else {
            double total = 0.0;
            for (const auto& score : report.file_scores) {
                total += score.score;
            }
            report.overall_score = total / static_cast<double>(report.file_scores.size());
        }

        report.principles.clear();
        for (const auto principle : checked) {
            report.principles[principle] = PrincipleSummary{};
        }
        for (const auto& violation : report.violations) {
            ++report.principles[violation.principle].violations;
        }
        for (auto& [principle, summary] : report.principles) {
            summary.score = std::max(0.0, 100.0 - 5.0 * static_cast<double>(summary.violations));
        }
    }

}  // namespace hqa::analysis
