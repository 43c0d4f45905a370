#include "hqa/types.hpp"
#include "hqa/utils/string_utils.hpp"

namespace hqa {

    const char* to_string(Language language) noexcept {
        switch (language) {
            case Language::JavaScript: return "javascript";
            case Language::TypeScript: return "typescript";
        }
        return "unknown";
    }

    std::optional<Language> parse_language(std::string_view tag) {
        const std::string lower = string_utils::to_lower(string_utils::trim(tag));

        if (lower == "javascript" || lower == "js" || lower == "jsx" ||
            lower == "mjs" || lower == "cjs" || lower == "script") {
            return Language::JavaScript;
        }
        if (lower == "typescript" || lower == "ts" || lower == "tsx") {
            return Language::TypeScript;
        }
        return std::nullopt;
    }

    std::optional<Language> language_from_extension(const fs::path& path) {
        std::string ext = path.extension().string();
        if (ext.empty()) {
            return std::nullopt;
        }
        return parse_language(std::string_view(ext).substr(1));
    }

    const char* to_string(Severity severity) noexcept {
        switch (severity) {
            case Severity::Info:    return "info";
            case Severity::Warning: return "warning";
            case Severity::Error:   return "error";
        }
        return "unknown";
    }

    const char* to_string(FindingType type) noexcept {
        switch (type) {
            case FindingType::DeprecatedDeclaration: return "deprecated-declaration";
            case FindingType::WeakEquality:          return "weak-equality";
            case FindingType::DebugStatement:        return "debug-statement";
            case FindingType::UnnamedConstant:       return "unnamed-constant";
            case FindingType::Complexity:            return "complexity";
            case FindingType::FunctionLength:        return "function-length";
            case FindingType::ParameterCount:        return "parameter-count";
            case FindingType::NestingDepth:          return "nesting-depth";
        }
        return "unknown";
    }

    const char* to_string(Principle principle) noexcept {
        switch (principle) {
            case Principle::SRP: return "SRP";
            case Principle::OCP: return "OCP";
            case Principle::LSP: return "LSP";
            case Principle::ISP: return "ISP";
            case Principle::DIP: return "DIP";
        }
        return "unknown";
    }

    const char* to_string(ViolationSeverity severity) noexcept {
        switch (severity) {
            case ViolationSeverity::Low:      return "low";
            case ViolationSeverity::Medium:   return "medium";
            case ViolationSeverity::High:     return "high";
            case ViolationSeverity::Critical: return "critical";
        }
        return "unknown";
    }

}  // namespace hqa
