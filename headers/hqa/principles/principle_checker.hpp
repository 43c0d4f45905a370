#ifndef HQA_PRINCIPLE_CHECKER_HPP
#define HQA_PRINCIPLE_CHECKER_HPP

/**
 * @file principle_checker.hpp
 * @brief Base class for design-principle checkers.
 *
 * A checker consumes the structure of one file (units, classes, imports)
 * and reports Violations for a single principle. The base class owns the
 * logic every checker shares:
 *
 * - severity_from_thresholds(): inclusive low/medium/high bucketing
 * - classify_import_concerns(): dependency names to coarse concerns
 * - make_violation(): stamps principle, severity and file, and guarantees
 *   a non-empty suggestion
 *
 * Checkers never modify each other's output.
 */

#include "hqa/result.hpp"
#include "hqa/error.hpp"
#include "hqa/types.hpp"
#include "hqa/heuristics/config.hpp"
#include "hqa/i18n/translator.hpp"
#include "hqa/security/resource_limiter.h"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hqa::principles {

    /**
     * Coarse functional category inferred from a dependency name.
     */
    enum class Concern {
        DataAccess,
        Network,
        Filesystem,
        Messaging,
        Validation,
        Presentation,
        Authentication,
        Observability
    };

    [[nodiscard]] const char* to_string(Concern concern) noexcept;

    /**
     * Extracts units, classes and imports from a validated context.
     *
     * Class complexity is the sum of the cyclomatic proxies of its methods.
     *
     * @param context Context returned by the input guard.
     * @param config Limits used by the extractor.
     * @param limiter Optional time budget.
     * @return The file structure, or Timeout/Cancelled.
     */
    [[nodiscard]] Result<FileStructure, Error> build_file_structure(
        const AnalysisContext& context,
        const heuristics::HeuristicsConfig& config,
        const security::ResourceLimiter* limiter = nullptr
    );

    /**
     * Units not contained in the body of another unit.
     */
    [[nodiscard]] std::vector<SourceUnit> top_level_units(const std::vector<SourceUnit>& units);

    class PrincipleChecker {
    public:
        PrincipleChecker(const heuristics::HeuristicsConfig& config, const i18n::Translator& translator);
        virtual ~PrincipleChecker() = default;

        [[nodiscard]] virtual Principle principle() const noexcept = 0;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual bool supports_language(Language language) const noexcept;

        /**
         * Tag form of supports_language(); unknown tags are unsupported.
         */
        [[nodiscard]] bool supports_language(std::string_view tag) const;

        /**
         * Loads a file through the input guard, extracts its structure and
         * checks it.
         *
         * @param path File to check.
         * @param language Declared language tag.
         * @return Violations, an empty list for unsupported languages, or
         *         an error when the file is rejected or times out.
         */
        [[nodiscard]] Result<std::vector<Violation>, Error> check(
            const fs::path& path,
            std::string_view language
        ) const;

        [[nodiscard]] virtual std::vector<Violation> check(const FileStructure& structure) const = 0;

        /**
         * Buckets value into a severity. Boundaries are inclusive and the
         * highest matching bucket wins; values below low map to Low.
         */
        [[nodiscard]] static ViolationSeverity severity_from_thresholds(
            double value,
            const heuristics::SeverityThresholds& thresholds
        ) noexcept;

        /**
         * Maps import specifiers to concerns by lower-case substring match.
         * One import may contribute several concerns.
         */
        [[nodiscard]] static std::set<Concern> classify_import_concerns(const std::vector<std::string>& imports);

    protected:
        /**
         * Fields a checker fills in; the rest is stamped by make_violation().
         */
        struct ViolationDraft {
            std::optional<std::size_t> line;
            std::optional<std::string> class_name;
            std::optional<std::string> method_name;
            std::string description;
            std::string explanation;
            std::string impact;
            std::string suggestion;
            std::optional<ViolationMetrics> metrics;
        };

        [[nodiscard]] Violation make_violation(ViolationSeverity severity,
                                               const FileStructure& structure,
                                               ViolationDraft draft) const;

        /**
         * Translates the description/explanation/impact/suggestion quartet
         * stored under prefix.
         */
        [[nodiscard]] ViolationDraft draft_from_catalog(std::string_view prefix, const i18n::Params& params) const;

        [[nodiscard]] const heuristics::HeuristicsConfig& config() const noexcept { return config_; }
        [[nodiscard]] const i18n::Translator& translator() const noexcept { return translator_; }

    private:
        heuristics::HeuristicsConfig config_;
        const i18n::Translator& translator_;
    };

    /**
     * Creates the standard checker set (SRP, DIP).
     */
    [[nodiscard]] std::vector<std::unique_ptr<PrincipleChecker>> make_default_checkers(
        const heuristics::HeuristicsConfig& config,
        const i18n::Translator& translator
    );

}  // namespace hqa::principles

#endif // HQA_PRINCIPLE_CHECKER_HPP
