#ifndef HQA_JSON_REPORT_HPP
#define HQA_JSON_REPORT_HPP

/**
 * @file json_report.hpp
 * @brief JSON serialization of findings, violations and project reports.
 *
 * The to_json overloads live next to the types they serialize so that
 * nlohmann::json picks them up through argument-dependent lookup:
 * @code
 *     nlohmann::json j = coordinator.analyze_file(path, "js");
 * @endcode
 *
 * Optional Violation fields are omitted when unset.
 */

#include "hqa/result.hpp"
#include "hqa/error.hpp"
#include "hqa/types.hpp"
#include "hqa/analysis/analysis_metrics.hpp"
#include "hqa/analysis/project_report.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace hqa {

    void to_json(nlohmann::json& j, const Finding& finding);
    void to_json(nlohmann::json& j, const ViolationMetrics& metrics);
    void to_json(nlohmann::json& j, const Violation& violation);

}  // namespace hqa

namespace hqa::analysis {

    void to_json(nlohmann::json& j, const MetricsSnapshot& snapshot);
    void to_json(nlohmann::json& j, const ProjectReport& report);

}  // namespace hqa::analysis

namespace hqa::report {

    namespace fs = std::filesystem;

    /**
     * Wraps a project report with tool name, version and generation time.
     */
    [[nodiscard]] nlohmann::json build_project_report(const analysis::ProjectReport& report);

    /**
     * Findings of one file under its display name.
     */
    [[nodiscard]] nlohmann::json build_file_report(std::string_view file, const std::vector<Finding>& findings);

    /**
     * Writes json to path, pretty-printed with two-space indentation.
     */
    [[nodiscard]] Result<void, Error> write_json_report(const fs::path& path, const nlohmann::json& json);

}  // namespace hqa::report

#endif // HQA_JSON_REPORT_HPP
