#include "hqa/detectors/pattern_detectors.hpp"

#include <regex>

namespace hqa::detectors
{
    namespace {

        const std::regex& console_pattern() {
            static const std::regex rx(
                R"(\bconsole\s*\.\s*(log|warn|error|info|debug|trace|table|dir)\b)");
            return rx;
        }

    }  // namespace

    std::vector<Finding> DebugStatementDetector::detect(const DetectionContext& context) const {
        std::vector<Finding> findings;
        const auto& text = context.text;
        const auto max_length = context.config.limits.max_line_length;

        for (std::size_t i = 0; i < text.line_count(); ++i) {
            if (text.line(i).size() > max_length) {
                continue;
            }

            const std::string code(text.code(i));
            for (auto it = std::sregex_iterator(code.begin(), code.end(), console_pattern());
                 it != std::sregex_iterator(); ++it) {
                const auto& match = *it;
                const i18n::Params params{{"method", match[1].str()}};

                Finding finding;
                finding.type = FindingType::DebugStatement;
                finding.severity = Severity::Warning;
                finding.line = i + 1;
                finding.column = static_cast<std::size_t>(match.position(0)) + 1;
                finding.rule = "no-console";
                finding.message = context.translator.translate("findings.no_console.message", params);
                finding.suggestion = context.translator.translate("findings.no_console.suggestion", params);
                findings.push_back(std::move(finding));
            }
        }

        return findings;
    }
}  // namespace hqa::detectors
