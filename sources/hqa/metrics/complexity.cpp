#include "hqa/metrics/complexity.hpp"
#include "hqa/utils/string_utils.hpp"

#include <algorithm>
#include <array>

namespace hqa::metrics {

    namespace {

        constexpr std::array<std::string_view, 5> kDecisionKeywords = {
            "if", "for", "while", "case", "catch"
        };

        bool is_ternary_at(std::string_view code, std::size_t i) {
            if (i > 0 && code[i - 1] == '?') {
                return false;
            }
            if (i + 1 >= code.size()) {
                return true;
            }
            const char next = code[i + 1];
            return next != '.' && next != '?' && next != ':' && next != ')' && next != ',';
        }

    }  // namespace

    std::size_t cyclomatic_complexity(std::string_view code, const std::size_t ceiling) {
        std::size_t complexity = 1;
        std::size_t i = 0;

        while (i < code.size() && complexity < ceiling) {
            const char c = code[i];

            if (string_utils::is_identifier_char(c)) {
                std::size_t end = i;
                while (end < code.size() && string_utils::is_identifier_char(code[end])) {
                    ++end;
                }
                const auto word = code.substr(i, end - i);
                if (std::ranges::find(kDecisionKeywords, word) != kDecisionKeywords.end()) {
                    ++complexity;
                }
                i = end;
                continue;
            }

            if ((c == '&' || c == '|') && i + 1 < code.size() && code[i + 1] == c) {
                ++complexity;
                i += 2;
                continue;
            }

            if (c == '?' && is_ternary_at(code, i)) {
                ++complexity;
            }
            ++i;
        }

        return std::min(complexity, ceiling);
    }

    NestingDepth max_nesting_depth(const std::vector<std::string>& code_lines, const std::size_t ceiling) {
        NestingDepth result;
        std::size_t depth = 0;

        for (std::size_t line = 0; line < code_lines.size(); ++line) {
            for (const char c : code_lines[line]) {
                if (c == '{') {
                    depth = std::min(depth + 1, ceiling);
                    if (depth > result.depth) {
                        result.depth = depth;
                        result.line = line + 1;
                    }
                } else if (c == '}' && depth > 0) {
                    --depth;
                }
            }
        }

        return result;
    }

}  // namespace hqa::metrics
