#ifndef HQA_TYPES_HPP
#define HQA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for heuristic source analysis.
 *
 * Types are organized into categories:
 *
 * - Language: supported source languages and tag parsing
 * - Structure: SourceUnit, ClassUnit, FileStructure
 * - Findings: Finding, Severity, FindingType
 * - Principles: Violation, Principle, ViolationSeverity, ViolationMetrics
 * - Context: AnalysisContext
 *
 * Structural records are created once per file scan and never retained
 * across files.
 */

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "heuristics/config.hpp"

namespace hqa {

    namespace fs = std::filesystem;

    // ============================================================================
    // Language
    // ============================================================================

    enum class Language {
        JavaScript,
        TypeScript
    };

    [[nodiscard]] const char* to_string(Language language) noexcept;

    /**
     * Parses a declared language tag ("script", "js", "ts", ...).
     * Matching is case-insensitive; unknown tags yield nullopt.
     */
    [[nodiscard]] std::optional<Language> parse_language(std::string_view tag);

    /**
     * Maps a file extension to a language, or nullopt when unsupported.
     */
    [[nodiscard]] std::optional<Language> language_from_extension(const fs::path& path);

    // ============================================================================
    // Structure
    // ============================================================================

    /**
     * A function-like construct recovered from source text.
     *
     * The name and parameters are sanitized; body holds the raw text span
     * and code holds the same span with comments and string contents blanked.
     */
    struct SourceUnit {
        std::string name;
        std::vector<std::string> parameters;
        std::string body;
        std::string code;
        std::size_t start_line = 1;
        std::size_t start_column = 1;
        std::size_t end_line = 1;

        [[nodiscard]] std::size_t line_count() const noexcept {
            return end_line >= start_line ? end_line - start_line + 1 : 1;
        }
    };

    /**
     * A class-like construct with the units declared inside its span.
     */
    struct ClassUnit {
        std::string name;
        std::size_t line = 1;
        std::size_t end_line = 1;
        std::vector<SourceUnit> methods;
        std::size_t complexity = 0;
        std::string code;

        [[nodiscard]] std::size_t line_count() const noexcept {
            return end_line >= line ? end_line - line + 1 : 1;
        }
    };

    /**
     * Everything the principle checkers need from one file.
     */
    struct FileStructure {
        std::string file;
        std::string module_name;
        Language language = Language::JavaScript;
        std::vector<SourceUnit> units;
        std::vector<ClassUnit> classes;
        std::vector<std::string> imports;
        std::size_t line_count = 0;
    };

    // ============================================================================
    // Findings
    // ============================================================================

    enum class Severity {
        Info,
        Warning,
        Error
    };

    enum class FindingType {
        DeprecatedDeclaration,
        WeakEquality,
        DebugStatement,
        UnnamedConstant,
        Complexity,
        FunctionLength,
        ParameterCount,
        NestingDepth
    };

    [[nodiscard]] const char* to_string(Severity severity) noexcept;
    [[nodiscard]] const char* to_string(FindingType type) noexcept;

    /**
     * A single reported anti-pattern occurrence.
     *
     * line and column are 1-based and lie inside the analyzed file.
     */
    struct Finding {
        FindingType type = FindingType::DeprecatedDeclaration;
        std::string message;
        Severity severity = Severity::Warning;
        std::size_t line = 1;
        std::size_t column = 1;
        std::string rule;
        std::string suggestion;

        bool operator==(const Finding&) const = default;
    };

    // ============================================================================
    // Principles
    // ============================================================================

    enum class Principle {
        SRP,
        OCP,
        LSP,
        ISP,
        DIP
    };

    enum class ViolationSeverity {
        Low,
        Medium,
        High,
        Critical
    };

    [[nodiscard]] const char* to_string(Principle principle) noexcept;
    [[nodiscard]] const char* to_string(ViolationSeverity severity) noexcept;

    struct ViolationMetrics {
        std::size_t complexity = 0;
        std::size_t method_count = 0;
        std::size_t dependencies = 0;
        std::size_t parameters = 0;
        std::size_t lines_of_code = 0;
        std::size_t class_count = 0;
        std::vector<std::string> import_concerns;
    };

    /**
     * A design-principle breach produced by exactly one checker.
     */
    struct Violation {
        Principle principle = Principle::SRP;
        ViolationSeverity severity = ViolationSeverity::Low;
        std::string file;
        std::optional<std::size_t> line;
        std::optional<std::string> class_name;
        std::optional<std::string> method_name;
        std::string description;
        std::string explanation;
        std::string impact;
        std::string suggestion;
        std::optional<ViolationMetrics> metrics;
    };

    // ============================================================================
    // Context
    // ============================================================================

    /**
     * Per-file record produced by the input guard. Never persisted.
     */
    struct AnalysisContext {
        std::string display_path;
        fs::path path;
        Language language = Language::JavaScript;
        std::string content;
        std::size_t content_length = 0;
        bool is_safe = false;
    };

}  // namespace hqa

#endif // HQA_TYPES_HPP
