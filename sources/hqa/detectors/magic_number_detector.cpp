#include "hqa/detectors/pattern_detectors.hpp"
#include "hqa/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace hqa::detectors
{
    namespace {

        const std::regex& named_constant_pattern() {
            static const std::regex rx(R"(\bconst\s+[A-Z][A-Z0-9_]*\s*=)");
            return rx;
        }

        bool is_number_neighbour(const char c) {
            return c == '.' || string_utils::is_identifier_char(c);
        }

        // Two-digit values below 20 are treated as ordinary counts.
        bool is_magic(const std::string_view digits) {
            return digits.size() >= 3 || (digits.size() == 2 && digits.front() >= '2');
        }

        bool has_allowed_context(std::string_view raw, const std::vector<std::string>& allow_list) {
            const std::string lower = string_utils::to_lower(raw);
            return std::ranges::any_of(allow_list, [&](const std::string& word) {
                return !word.empty() && string_utils::contains(lower, string_utils::to_lower(word));
            });
        }

    }  // namespace

    std::vector<Finding> MagicNumberDetector::detect(const DetectionContext& context) const {
        std::vector<Finding> findings;
        const auto& text = context.text;
        const auto max_length = context.config.limits.max_line_length;
        const auto& allow_list = context.config.magic_numbers.allow_list;

        for (std::size_t i = 0; i < text.line_count(); ++i) {
            const auto raw = text.line(i);
            if (raw.size() > max_length || has_allowed_context(raw, allow_list)) {
                continue;
            }

            const std::string code(text.code(i));
            if (std::regex_search(code, named_constant_pattern())) {
                continue;
            }

            std::size_t pos = 0;
            while (pos < code.size()) {
                if (!std::isdigit(static_cast<unsigned char>(code[pos]))) {
                    ++pos;
                    continue;
                }

                std::size_t end = pos;
                while (end < code.size() && std::isdigit(static_cast<unsigned char>(code[end]))) {
                    ++end;
                }

                const bool isolated = (pos == 0 || !is_number_neighbour(code[pos - 1])) &&
                                      (end == code.size() || !is_number_neighbour(code[end]));
                if (isolated && is_magic(std::string_view(code).substr(pos, end - pos))) {
                    const i18n::Params params{{"value", code.substr(pos, end - pos)}};

                    Finding finding;
                    finding.type = FindingType::UnnamedConstant;
                    finding.severity = Severity::Info;
                    finding.line = i + 1;
                    finding.column = pos + 1;
                    finding.rule = "no-magic-numbers";
                    finding.message = context.translator.translate("findings.no_magic_numbers.message", params);
                    finding.suggestion = context.translator.translate("findings.no_magic_numbers.suggestion", params);
                    findings.push_back(std::move(finding));
                }
                pos = end;
            }
        }

        return findings;
    }
}  // namespace hqa::detectors
