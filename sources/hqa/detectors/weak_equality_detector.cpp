#include "hqa/detectors/pattern_detectors.hpp"

namespace hqa::detectors
{
    std::vector<Finding> WeakEqualityDetector::detect(const DetectionContext& context) const {
        std::vector<Finding> findings;
        const auto& text = context.text;
        const auto max_length = context.config.limits.max_line_length;

        for (std::size_t i = 0; i < text.line_count(); ++i) {
            if (text.line(i).size() > max_length) {
                continue;
            }

            const auto code = text.code(i);
            std::size_t pos = 0;
            while (pos + 1 < code.size()) {
                const char c = code[pos];
                if ((c != '=' && c != '!') || code[pos + 1] != '=') {
                    ++pos;
                    continue;
                }

                // "===" and "!==" are the strict forms; skip the whole operator.
                if (pos + 2 < code.size() && code[pos + 2] == '=') {
                    pos += 3;
                    continue;
                }

                const std::string op = c == '=' ? "==" : "!=";
                const std::string strict = c == '=' ? "===" : "!==";
                const i18n::Params params{{"operator", op}, {"strict", strict}};

                Finding finding;
                finding.type = FindingType::WeakEquality;
                finding.severity = Severity::Warning;
                finding.line = i + 1;
                finding.column = pos + 1;
                finding.rule = "eqeqeq";
                finding.message = context.translator.translate("findings.eqeqeq.message", params);
                finding.suggestion = context.translator.translate("findings.eqeqeq.suggestion", params);
                findings.push_back(std::move(finding));
                pos += 2;
            }
        }

        return findings;
    }
}  // namespace hqa::detectors
