#ifndef HQA_STRUCTURAL_EXTRACTOR_HPP
#define HQA_STRUCTURAL_EXTRACTOR_HPP

/**
 * @file structural_extractor.hpp
 * @brief Regex and brace-balance recovery of functions, classes and imports.
 *
 * The extractor never builds a syntax tree. It matches a small family of
 * signature patterns line by line over the masked view of a SourceText,
 * then finds the unit body by counting braces from the match column.
 * Every dimension is bounded by heuristics::Limits:
 *
 * - lines longer than max_line_length are not matched
 * - at most max_units units are returned
 * - the opening brace must appear within brace_search_lines lines
 * - brace counting stops after max_body_lines lines or at max_brace_depth
 * - bodies longer than max_body_chars drop the unit
 *
 * Signatures recognized:
 * @code
 *     function name(a, b) { ... }
 *     const name = async (a, b) => { ... }
 *     name: function (a) { ... }
 *     name(a, b) { ... }
 * @endcode
 */

#include "hqa/result.hpp"
#include "hqa/error.hpp"
#include "hqa/types.hpp"
#include "hqa/heuristics/config.hpp"
#include "hqa/extraction/source_text.hpp"
#include "hqa/security/resource_limiter.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hqa::extraction {

    /**
     * Inclusive line range of a brace-delimited body, 0-based.
     */
    struct BodySpan {
        std::size_t first_line = 0;
        std::size_t last_line = 0;
    };

    class StructuralExtractor {
    public:
        explicit StructuralExtractor(const heuristics::Limits& limits = {});

        /**
         * Extracts units from raw content.
         *
         * @param content File content.
         * @param limiter Optional budget checked while scanning.
         * @return Units in source order, or Timeout/Cancelled.
         */
        [[nodiscard]] Result<std::vector<SourceUnit>, Error> extract(
            std::string_view content,
            const security::ResourceLimiter* limiter = nullptr
        ) const;

        [[nodiscard]] Result<std::vector<SourceUnit>, Error> extract(
            const SourceText& text,
            const security::ResourceLimiter* limiter = nullptr
        ) const;

        /**
         * Recovers class declarations and assigns each the units whose start
         * line falls inside its body. Constructors and accessors are not
         * counted as methods. Complexity is left at zero.
         */
        [[nodiscard]] std::vector<ClassUnit> extract_classes(
            const SourceText& text,
            const std::vector<SourceUnit>& units
        ) const;

        /**
         * Collects module specifiers from import statements, require calls
         * and dynamic imports. Comment lines are ignored.
         */
        [[nodiscard]] std::vector<std::string> extract_imports(const SourceText& text) const;

        /**
         * Sanitizes a raw parameter list into identifier tokens.
         */
        [[nodiscard]] std::vector<std::string> parse_parameters(std::string_view raw) const;

        /**
         * Finds the brace-delimited body starting at (line, column).
         *
         * @return The body span, or nullopt when no opening brace is found
         *         within the search window.
         */
        [[nodiscard]] std::optional<BodySpan> find_body(
            const SourceText& text,
            std::size_t line,
            std::size_t column
        ) const;

    private:
        heuristics::Limits limits_;
    };

}  // namespace hqa::extraction

#endif // HQA_STRUCTURAL_EXTRACTOR_HPP
