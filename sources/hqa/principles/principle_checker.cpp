#include "hqa/principles/principle_checker.hpp"
#include "hqa/principles/srp_checker.hpp"
#include "hqa/principles/dip_checker.hpp"
#include "hqa/extraction/structural_extractor.hpp"
#include "hqa/metrics/complexity.hpp"
#include "hqa/security/input_guard.h"
#include "hqa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace hqa::principles
{
    namespace {

        struct ConcernKeywords {
            Concern concern;
            std::vector<std::string_view> keywords;
        };

        const std::vector<ConcernKeywords>& concern_keywords() {
            static const std::vector<ConcernKeywords> table = {
                {Concern::DataAccess, {"database", "db", "sql", "mongo", "redis", "orm", "prisma",
                                       "sequelize", "typeorm"}},
                {Concern::Network, {"http", "axios", "fetch", "request", "api", "rest", "graphql", "socket"}},
                {Concern::Filesystem, {"file", "fs", "path", "upload", "download", "stream"}},
                {Concern::Messaging, {"email", "mail", "smtp", "sendgrid", "nodemailer"}},
                {Concern::Validation, {"validation", "validator", "joi", "yup", "ajv", "zod"}},
                {Concern::Presentation, {"react", "vue", "angular", "component", "ui", "dom", "jsx", "tsx"}},
                {Concern::Authentication, {"auth", "jwt", "passport", "session", "oauth", "bcrypt"}},
                {Concern::Observability, {"log", "winston", "pino", "console", "debug"}},
            };
            return table;
        }

        Error to_error(const security::Rejection& rejection) {
            return Error::security_error(rejection.message, security::to_string(rejection.reason));
        }

    }  // namespace

    const char* to_string(Concern concern) noexcept {
        switch (concern) {
            case Concern::DataAccess:     return "data-access";
            case Concern::Network:        return "network";
            case Concern::Filesystem:     return "filesystem";
            case Concern::Messaging:      return "messaging";
            case Concern::Validation:     return "validation";
            case Concern::Presentation:   return "presentation";
            case Concern::Authentication: return "authentication";
            case Concern::Observability:  return "observability";
        }
        return "unknown";
    }

    Result<FileStructure, Error> build_file_structure(
        const AnalysisContext& context,
        const heuristics::HeuristicsConfig& config,
        const security::ResourceLimiter* limiter
    ) {
        const extraction::SourceText text(context.content);
        const extraction::StructuralExtractor extractor(config.limits);

        auto units = extractor.extract(text, limiter);
        if (units.is_err()) {
            return Result<FileStructure, Error>::failure(units.error());
        }

        FileStructure structure;
        structure.file = context.display_path;
        structure.module_name = fs::path(context.display_path).stem().string();
        structure.language = context.language;
        structure.line_count = text.line_count();
        structure.classes = extractor.extract_classes(text, units.value());
        structure.imports = extractor.extract_imports(text);

        for (auto& cls : structure.classes) {
            for (const auto& method : cls.methods) {
                cls.complexity += metrics::cyclomatic_complexity(method.code, config.thresholds.complexity_ceiling);
            }
        }

        structure.units = std::move(units).value();
        return Result<FileStructure, Error>::success(std::move(structure));
    }

    std::vector<SourceUnit> top_level_units(const std::vector<SourceUnit>& units) {
        std::vector<SourceUnit> result;
        for (const auto& unit : units) {
            const bool nested = std::ranges::any_of(units, [&](const SourceUnit& outer) {
                return &outer != &unit &&
                       outer.start_line < unit.start_line && unit.start_line <= outer.end_line;
            });
            if (!nested) {
                result.push_back(unit);
            }
        }
        return result;
    }

    PrincipleChecker::PrincipleChecker(const heuristics::HeuristicsConfig& config,
                                       const i18n::Translator& translator)
        : config_(config)
        , translator_(translator) {}

    bool PrincipleChecker::supports_language(const Language language) const noexcept {
        return language == Language::JavaScript || language == Language::TypeScript;
    }

    bool PrincipleChecker::supports_language(std::string_view tag) const {
        const auto language = parse_language(tag);
        return language.has_value() && supports_language(*language);
    }

    Result<std::vector<Violation>, Error> PrincipleChecker::check(
        const fs::path& path,
        std::string_view language
    ) const {
        const auto parsed = parse_language(language);
        if (!parsed) {
            return Result<std::vector<Violation>, Error>::failure(
                Error::invalid_argument("Unsupported language", std::string(language.substr(0, 20)))
            );
        }
        if (!supports_language(*parsed)) {
            return Result<std::vector<Violation>, Error>::success({});
        }

        const security::InputGuard guard(config_.limits);
        auto context = guard.load(path, *parsed);
        if (context.is_err()) {
            return Result<std::vector<Violation>, Error>::failure(to_error(context.error()));
        }

        security::ResourceLimiter limiter({config_.limits.analysis_time, config_.limits.max_findings_per_file});
        limiter.start_timer();

        auto structure = build_file_structure(context.value(), config_, &limiter);
        if (structure.is_err()) {
            return Result<std::vector<Violation>, Error>::failure(structure.error());
        }

        return Result<std::vector<Violation>, Error>::success(check(structure.value()));
    }

    ViolationSeverity PrincipleChecker::severity_from_thresholds(
        const double value,
        const heuristics::SeverityThresholds& thresholds
    ) noexcept {
        if (value >= thresholds.high) {
            return ViolationSeverity::Critical;
        }
        if (value >= thresholds.medium) {
            return ViolationSeverity::High;
        }
        if (value >= thresholds.low) {
            return ViolationSeverity::Medium;
        }
        return ViolationSeverity::Low;
    }

    std::set<Concern> PrincipleChecker::classify_import_concerns(const std::vector<std::string>& imports) {
        std::set<Concern> concerns;
        for (const auto& specifier : imports) {
            const std::string lower = string_utils::to_lower(specifier);
            for (const auto& [concern, keywords] : concern_keywords()) {
                const bool hit = std::ranges::any_of(keywords, [&](std::string_view keyword) {
                    return string_utils::contains(lower, keyword);
                });
                if (hit) {
                    concerns.insert(concern);
                }
            }
        }
        return concerns;
    }

    Violation PrincipleChecker::make_violation(const ViolationSeverity severity,
                                               const FileStructure& structure,
                                               ViolationDraft draft) const {
        Violation violation;
        violation.principle = principle();
        violation.severity = severity;
        violation.file = structure.file.empty() ? "unknown-file" : structure.file;
        violation.line = draft.line;
        violation.class_name = std::move(draft.class_name);
        violation.method_name = std::move(draft.method_name);
        violation.description = std::move(draft.description);
        violation.explanation = std::move(draft.explanation);
        violation.impact = std::move(draft.impact);
        violation.suggestion = std::move(draft.suggestion);
        violation.metrics = std::move(draft.metrics);

        if (string_utils::trim(violation.suggestion).empty()) {
            violation.suggestion = translator_.translate("violations.default_suggestion",
                                                         {{"principle", to_string(principle())}});
        }
        return violation;
    }

    PrincipleChecker::ViolationDraft PrincipleChecker::draft_from_catalog(std::string_view prefix,
                                                                          const i18n::Params& params) const {
        const std::string base(prefix);
        ViolationDraft draft;
        draft.description = translator_.translate(base + ".description", params);
        draft.explanation = translator_.translate(base + ".explanation", params);
        draft.impact = translator_.translate(base + ".impact", params);
        draft.suggestion = translator_.translate(base + ".suggestion", params);
        return draft;
    }

    std::vector<std::unique_ptr<PrincipleChecker>> make_default_checkers(
        const heuristics::HeuristicsConfig& config,
        const i18n::Translator& translator
    ) {
        std::vector<std::unique_ptr<PrincipleChecker>> checkers;
        checkers.push_back(std::make_unique<SRPChecker>(config, translator));
        checkers.push_back(std::make_unique<DIPChecker>(config, translator));
        return checkers;
    }

}  // namespace hqa::principles
