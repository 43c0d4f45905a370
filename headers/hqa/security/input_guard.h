#ifndef HQA_INPUT_GUARD_H
#define HQA_INPUT_GUARD_H

#include "hqa/result.hpp"
#include "hqa/types.hpp"
#include "hqa/heuristics/config.hpp"
#include "hqa/analysis/analysis_metrics.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hqa::security {

    /**
     * Why a file was refused before analysis.
     */
    enum class RejectionReason {
        EmptyPath,
        NullByte,
        PathTooLong,
        PathTraversal,
        NotFound,
        NotRegularFile,
        ReadFailure,
        FileTooLarge,
        SuspiciousContent
    };

    [[nodiscard]] const char* to_string(RejectionReason reason) noexcept;

    /**
     * Typed skip outcome. The message never contains the raw path.
     */
    struct Rejection {
        RejectionReason reason = RejectionReason::EmptyPath;
        std::string message;
    };

    /**
     * Validates and sanitizes a candidate file before any scanner sees it.
     *
     * Checks path shape (empty, null bytes, length, parent traversal),
     * the byte ceiling, and a short list of high-risk content patterns.
     * Untrusted input never makes the guard throw: every outcome is either
     * an AnalysisContext or a Rejection. Each rejection increments the
     * security-rejection counter of the attached metrics exactly once.
     */
    class InputGuard {
    public:
        /**
         * Construct a guard.
         * @param limits Path and size ceilings.
         * @param metrics Counters to update on rejection; may be null.
         */
        explicit InputGuard(const heuristics::Limits& limits,
                            std::shared_ptr<analysis::AnalysisMetrics> metrics = nullptr);

        /**
         * Validate a path and content supplied by the caller.
         *
         * @param path Path the content was read from.
         * @param content Raw file content.
         * @param language Declared language of the file.
         * @return A safe context or the reason for rejection.
         */
        [[nodiscard]] Result<AnalysisContext, Rejection> validate(
            const fs::path& path,
            std::string_view content,
            Language language = Language::JavaScript
        ) const;

        /**
         * Validate a path, check its on-disk size, then read it with a
         * bounded read and validate the content.
         */
        [[nodiscard]] Result<AnalysisContext, Rejection> load(
            const fs::path& path,
            Language language = Language::JavaScript
        ) const;

        /**
         * Linear scan for embedded script tags, dynamic evaluation and
         * string-based timer callbacks.
         *
         * @return The name of the first pattern found, or empty when clean.
         */
        [[nodiscard]] static std::string find_suspicious_pattern(std::string_view content);

        /**
         * True when the lexically normalized path has a ".." component.
         */
        [[nodiscard]] static bool contains_path_traversal(const fs::path& path);

    private:
        [[nodiscard]] std::optional<Rejection> check_path(const fs::path& path) const;
        [[nodiscard]] Result<AnalysisContext, Rejection> reject(const fs::path& path,
                                                                Rejection rejection) const;

        heuristics::Limits limits_;
        std::shared_ptr<analysis::AnalysisMetrics> metrics_;
    };

} // namespace hqa::security

#endif // HQA_INPUT_GUARD_H
