#include "hqa/detectors/pattern_detectors.hpp"
#include "hqa/utils/string_utils.hpp"

#include <cctype>

namespace hqa::detectors
{
    namespace {

        bool is_statement_boundary(std::string_view code, std::size_t pos) {
            if (pos == 0) {
                return true;
            }
            const char prev = code[pos - 1];
            return std::isspace(static_cast<unsigned char>(prev)) ||
                   prev == ';' || prev == '{' || prev == '}' || prev == '(';
        }

        /**
         * `var` must be followed by whitespace and then a binding: an
         * identifier or a destructuring pattern.
         */
        bool is_followed_by_binding(std::string_view code, std::size_t pos) {
            std::size_t next = pos + 3;
            if (next >= code.size() || !std::isspace(static_cast<unsigned char>(code[next]))) {
                return false;
            }
            while (next < code.size() && std::isspace(static_cast<unsigned char>(code[next]))) {
                ++next;
            }
            if (next >= code.size()) {
                return false;
            }
            const char c = code[next];
            return (string_utils::is_identifier_char(c) && !std::isdigit(static_cast<unsigned char>(c))) ||
                   c == '{' || c == '[';
        }

    }  // namespace

    std::vector<Finding> DeprecatedDeclarationDetector::detect(const DetectionContext& context) const {
        std::vector<Finding> findings;
        const auto& text = context.text;
        const auto max_length = context.config.limits.max_line_length;

        for (std::size_t i = 0; i < text.line_count(); ++i) {
            if (text.line(i).size() > max_length) {
                continue;
            }

            const auto code = text.code(i);
            for (std::size_t pos = code.find("var"); pos != std::string_view::npos; pos = code.find("var", pos + 3)) {
                if (!string_utils::is_word_at(code, pos, "var") ||
                    !is_statement_boundary(code, pos) ||
                    !is_followed_by_binding(code, pos)) {
                    continue;
                }

                Finding finding;
                finding.type = FindingType::DeprecatedDeclaration;
                finding.severity = Severity::Warning;
                finding.line = i + 1;
                finding.column = pos + 1;
                finding.rule = "no-var";
                finding.message = context.translator.translate("findings.no_var.message");
                finding.suggestion = context.translator.translate("findings.no_var.suggestion");
                findings.push_back(std::move(finding));
            }
        }

        return findings;
    }
}  // namespace hqa::detectors
