#include "hqa/report/json_report.hpp"
#include "hqa/version.hpp"
#include "hqa/utils/file_utils.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hqa
{
    using json = nlohmann::json;

    void to_json(json& j, const Finding& finding) {
        j = json{
            {"type", to_string(finding.type)},
            {"message", finding.message},
            {"severity", to_string(finding.severity)},
            {"line", finding.line},
            {"column", finding.column},
            {"rule", finding.rule},
            {"suggestion", finding.suggestion}
        };
    }

    void to_json(json& j, const ViolationMetrics& metrics) {
        j = json{
            {"complexity", metrics.complexity},
            {"method_count", metrics.method_count},
            {"dependencies", metrics.dependencies},
            {"parameters", metrics.parameters},
            {"lines_of_code", metrics.lines_of_code},
            {"class_count", metrics.class_count},
            {"import_concerns", metrics.import_concerns}
        };
    }

    void to_json(json& j, const Violation& violation) {
        j = json::object();
        j["principle"] = to_string(violation.principle);
        j["severity"] = to_string(violation.severity);
        j["file"] = violation.file;
        if (violation.line) {
            j["line"] = *violation.line;
        }
        if (violation.class_name) {
            j["class"] = *violation.class_name;
        }
        if (violation.method_name) {
            j["method"] = *violation.method_name;
        }
        j["description"] = violation.description;
        j["explanation"] = violation.explanation;
        j["impact"] = violation.impact;
        j["suggestion"] = violation.suggestion;
        if (violation.metrics) {
            j["metrics"] = *violation.metrics;
        }
    }

}  // namespace hqa

namespace hqa::analysis
{
    using json = nlohmann::json;

    void to_json(json& j, const MetricsSnapshot& snapshot) {
        j = json{
            {"files_analyzed", snapshot.files_analyzed},
            {"total_findings", snapshot.total_findings},
            {"security_rejections", snapshot.security_rejections},
            {"files_skipped", snapshot.files_skipped},
            {"failed_files", snapshot.failed_files},
            {"timeouts", snapshot.timeouts},
            {"average_latency_ms", snapshot.average_latency_ms}
        };
    }

    void to_json(json& j, const ProjectReport& report) {
        json summary;
        summary["files_discovered"] = report.files_discovered;
        summary["files_analyzed"] = report.files_analyzed;
        summary["files_skipped"] = report.skipped.size();
        summary["violations"] = report.violations.size();
        summary["overall_score"] = report.overall_score;

        json principles = json::object();
        for (const auto& [principle, entry] : report.principles) {
            principles[to_string(principle)] = {
                {"violations", entry.violations},
                {"score", entry.score}
            };
        }

        json files = json::array();
        for (const auto& score : report.file_scores) {
            files.push_back({
                {"file", score.file},
                {"score", score.score},
                {"violations", score.violations}
            });
        }

        json skipped = json::array();
        for (const auto& entry : report.skipped) {
            skipped.push_back({
                {"file", entry.file},
                {"reason", entry.reason}
            });
        }

        j = json::object();
        j["summary"] = summary;
        j["principles"] = principles;
        j["files"] = files;
        j["skipped"] = skipped;
        j["violations"] = report.violations;
        j["metrics"] = report.metrics;
    }

}  // namespace hqa::analysis

namespace hqa::report
{
    namespace {

        std::string format_timestamp(const std::chrono::system_clock::time_point tp) {
            const auto time = std::chrono::system_clock::to_time_t(tp);
            std::tm tm{};
            gmtime_r(&time, &tm);
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
            return oss.str();
        }

    }  // namespace

    nlohmann::json build_project_report(const analysis::ProjectReport& report) {
        nlohmann::json output = report;
        output["tool"] = PROJECT_SHORT_NAME;
        output["version"] = VERSION_STRING;
        output["generated_at"] = format_timestamp(std::chrono::system_clock::now());
        return output;
    }

    nlohmann::json build_file_report(const std::string_view file, const std::vector<Finding>& findings) {
        return nlohmann::json{
            {"file", std::string(file)},
            {"count", findings.size()},
            {"findings", findings}
        };
    }

    Result<void, Error> write_json_report(const fs::path& path, const nlohmann::json& json) {
        return file_utils::write_file(path, json.dump(2));
    }

}  // namespace hqa::report
