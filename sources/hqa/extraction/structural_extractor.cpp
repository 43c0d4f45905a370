#include "hqa/extraction/structural_extractor.hpp"
#include "hqa/security/sanitizer.h"
#include "hqa/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <regex>

namespace hqa::extraction {

    namespace {

        struct Signature {
            std::string name;
            std::string parameters;
            std::size_t column = 0;
            bool expression_body = false;
        };

        constexpr std::array<std::string_view, 14> kControlKeywords = {
            "if", "for", "while", "switch", "catch", "function", "return",
            "with", "do", "else", "typeof", "new", "await", "yield"
        };

        constexpr std::array<std::string_view, 3> kNonMethodNames = {"constructor", "get", "set"};

        const std::regex& declaration_pattern() {
            static const std::regex rx(
                R"(\bfunction\s*\*?\s*([A-Za-z_$][\w$]*)\s*\(([^)]*)\))");
            return rx;
        }

        const std::regex& binding_pattern() {
            static const std::regex rx(
                R"(([A-Za-z_$][\w$]*)\s*[:=]\s*(?:async\s+)?(?:function\s*\*?\s*(?:[A-Za-z_$][\w$]*)?\s*)?)"
                R"(\(([^)]*)\)\s*(?::\s*[\w$.<>\[\]]+\s*)?(=>|\{))");
            return rx;
        }

        const std::regex& method_pattern() {
            static const std::regex rx(
                R"(([A-Za-z_$][\w$]*)\s*\(([^)]*)\)\s*(?::\s*[\w$.<>\[\]]+\s*)?\{)");
            return rx;
        }

        const std::regex& class_pattern() {
            static const std::regex rx(R"(\bclass\s+([A-Za-z_$][\w$]*))");
            return rx;
        }

        const std::array<std::regex, 3>& import_patterns() {
            static const std::array<std::regex, 3> patterns = {
                std::regex(R"(\bfrom\s*['"]([^'"]+)['"])"),
                std::regex(R"(^\s*import\s*['"]([^'"]+)['"])"),
                std::regex(R"(\b(?:require|import)\s*\(\s*['"]([^'"]+)['"]\s*\))")
            };
            return patterns;
        }

        bool is_control_keyword(std::string_view name) {
            return std::ranges::find(kControlKeywords, name) != kControlKeywords.end();
        }

        bool has_expression_body(std::string_view code, std::size_t match_end) {
            const auto rest = string_utils::trim(code.substr(std::min(match_end, code.size())));
            return !rest.empty() && rest.front() != '{';
        }

        std::optional<Signature> match_signature(const std::string& code) {
            std::smatch m;

            if (std::regex_search(code, m, declaration_pattern())) {
                return Signature{m[1].str(), m[2].str(), static_cast<std::size_t>(m.position(0)), false};
            }

            if (std::regex_search(code, m, binding_pattern()) && !is_control_keyword(m[1].str())) {
                const bool arrow = m[3].str() == "=>";
                const auto end = static_cast<std::size_t>(m.position(0) + m.length(0));
                return Signature{m[1].str(), m[2].str(), static_cast<std::size_t>(m.position(0)),
                                 arrow && has_expression_body(code, end)};
            }

            if (std::regex_search(code, m, method_pattern()) && !is_control_keyword(m[1].str())) {
                return Signature{m[1].str(), m[2].str(), static_cast<std::size_t>(m.position(0)), false};
            }

            return std::nullopt;
        }

        /**
         * Splits on commas that are not nested inside brackets.
         */
        std::vector<std::string_view> split_top_level(std::string_view raw) {
            std::vector<std::string_view> parts;
            int depth = 0;
            std::size_t start = 0;
            for (std::size_t i = 0; i < raw.size(); ++i) {
                const char c = raw[i];
                if (c == '(' || c == '[' || c == '{' || c == '<') {
                    ++depth;
                } else if ((c == ')' || c == ']' || c == '}' || c == '>') && depth > 0) {
                    --depth;
                } else if (c == ',' && depth == 0) {
                    parts.push_back(raw.substr(start, i - start));
                    start = i + 1;
                }
            }
            parts.push_back(raw.substr(start));
            return parts;
        }

    }  // namespace

    StructuralExtractor::StructuralExtractor(const heuristics::Limits& limits)
        : limits_(limits) {}

    Result<std::vector<SourceUnit>, Error> StructuralExtractor::extract(
        std::string_view content,
        const security::ResourceLimiter* limiter
    ) const {
        const SourceText text(content);
        return extract(text, limiter);
    }

    Result<std::vector<SourceUnit>, Error> StructuralExtractor::extract(
        const SourceText& text,
        const security::ResourceLimiter* limiter
    ) const {
        std::vector<SourceUnit> units;

        for (std::size_t i = 0; i < text.line_count(); ++i) {
            if (units.size() >= limits_.max_units) {
                spdlog::debug("Unit limit of {} reached at line {}", limits_.max_units, i + 1);
                break;
            }

            if (limiter != nullptr && i % 64 == 0) {
                if (auto status = limiter->check_time_limit(); status.is_err()) {
                    return Result<std::vector<SourceUnit>, Error>::failure(status.error());
                }
            }

            if (text.line(i).size() > limits_.max_line_length || text.is_blank_code(i)) {
                continue;
            }

            const std::string code(text.code(i));
            auto signature = match_signature(code);
            if (!signature) {
                continue;
            }

            BodySpan span{i, i};
            if (!signature->expression_body) {
                auto body = find_body(text, i, signature->column);
                if (!body) {
                    continue;
                }
                span = *body;
            }

            std::string body = text.raw_span(span.first_line, span.last_line, signature->column);
            if (body.size() > limits_.max_body_chars) {
                spdlog::debug("Dropping unit at line {}: body of {} chars", i + 1, body.size());
                continue;
            }

            SourceUnit unit;
            unit.name = security::Sanitizer::sanitize_identifier(signature->name, limits_.max_name_length);
            unit.parameters = parse_parameters(signature->parameters);
            unit.body = std::move(body);
            unit.code = text.code_span(span.first_line, span.last_line, signature->column);
            unit.start_line = i + 1;
            unit.start_column = signature->column + 1;
            unit.end_line = span.last_line + 1;
            units.push_back(std::move(unit));
        }

        return Result<std::vector<SourceUnit>, Error>::success(std::move(units));
    }

    std::vector<ClassUnit> StructuralExtractor::extract_classes(
        const SourceText& text,
        const std::vector<SourceUnit>& units
    ) const {
        std::vector<ClassUnit> classes;

        for (std::size_t i = 0; i < text.line_count() && classes.size() < limits_.max_units; ++i) {
            if (text.line(i).size() > limits_.max_line_length || text.is_blank_code(i)) {
                continue;
            }

            const std::string code(text.code(i));
            std::smatch m;
            if (!std::regex_search(code, m, class_pattern())) {
                continue;
            }

            const auto column = static_cast<std::size_t>(m.position(0));
            auto span = find_body(text, i, column);
            if (!span) {
                continue;
            }

            ClassUnit cls;
            cls.name = security::Sanitizer::sanitize_identifier(m[1].str(), limits_.max_name_length);
            cls.line = i + 1;
            cls.end_line = span->last_line + 1;
            cls.code = text.code_span(span->first_line, span->last_line, column);

            auto inside = [&](const SourceUnit& unit) {
                return unit.start_line >= cls.line && unit.start_line <= cls.end_line;
            };

            for (const auto& unit : units) {
                if (!inside(unit) ||
                    std::ranges::find(kNonMethodNames, unit.name) != kNonMethodNames.end()) {
                    continue;
                }

                const bool nested = std::ranges::any_of(units, [&](const SourceUnit& outer) {
                    return &outer != &unit && inside(outer) &&
                           outer.start_line < unit.start_line && unit.start_line <= outer.end_line;
                });
                if (!nested) {
                    cls.methods.push_back(unit);
                }
            }

            classes.push_back(std::move(cls));
        }

        return classes;
    }

    std::vector<std::string> StructuralExtractor::extract_imports(const SourceText& text) const {
        std::vector<std::string> imports;

        for (std::size_t i = 0; i < text.line_count(); ++i) {
            const auto raw = text.line(i);
            if (raw.size() > limits_.max_line_length || text.is_blank_code(i)) {
                continue;
            }

            const std::string line(raw);
            for (const auto& pattern : import_patterns()) {
                for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern);
                     it != std::sregex_iterator(); ++it) {
                    std::string specifier = (*it)[1].str();
                    if (std::ranges::find(imports, specifier) == imports.end()) {
                        imports.push_back(std::move(specifier));
                    }
                    if (imports.size() >= limits_.max_imports) {
                        return imports;
                    }
                }
            }
        }

        return imports;
    }

    std::vector<std::string> StructuralExtractor::parse_parameters(std::string_view raw) const {
        std::vector<std::string> parameters;
        raw = string_utils::trim(raw);
        if (raw.empty() || raw.size() > limits_.max_parameter_text) {
            return parameters;
        }

        for (auto part : split_top_level(raw)) {
            if (const auto cut = part.find_first_of("=:"); cut != std::string_view::npos) {
                part = part.substr(0, cut);
            }

            auto token = string_utils::keep_identifier_chars(part, limits_.max_parameter_length);
            if (token.empty()) {
                continue;
            }
            parameters.push_back(std::move(token));
            if (parameters.size() >= limits_.max_parameters) {
                break;
            }
        }

        return parameters;
    }

    std::optional<BodySpan> StructuralExtractor::find_body(
        const SourceText& text,
        const std::size_t line,
        const std::size_t column
    ) const {
        std::size_t depth = 0;
        bool opened = false;
        std::size_t last = line;

        for (std::size_t l = line; l < text.line_count() && l - line < limits_.max_body_lines; ++l) {
            const auto code = text.code(l);
            last = l;

            for (std::size_t k = (l == line ? column : 0); k < code.size(); ++k) {
                if (code[k] == '{') {
                    depth = std::min(depth + 1, limits_.max_brace_depth);
                    opened = true;
                } else if (code[k] == '}' && depth > 0) {
                    --depth;
                    if (opened && depth == 0) {
                        return BodySpan{line, l};
                    }
                }
            }

            if (!opened && l - line >= limits_.brace_search_lines) {
                return std::nullopt;
            }
        }

        if (!opened) {
            return std::nullopt;
        }
        return BodySpan{line, last};
    }

}  // namespace hqa::extraction
