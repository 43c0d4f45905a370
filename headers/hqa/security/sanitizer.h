#ifndef HQA_SANITIZER_H
#define HQA_SANITIZER_H

#include <cstddef>
#include <string>
#include <string_view>

namespace hqa::security {

    /**
     * Redaction helpers for everything that leaves the engine.
     *
     * Log lines, error messages and record fields must never echo a full
     * path or an unbounded piece of untrusted text. These helpers reduce a
     * path to a safe display name, clean identifiers captured by the
     * extractor, and redact path-like tokens from exception messages.
     */
    class Sanitizer {
    public:
        static constexpr std::size_t max_display_name = 50;  ///< Display names are truncated to this length.
        static constexpr std::size_t max_error_message = 200; ///< Error messages are truncated to this length.

        /**
         * Reduce a path to its file name, keeping only [A-Za-z0-9._-].
         *
         * @param path Untrusted path.
         * @return Display name, or "unknown-file" when nothing is left.
         */
        static std::string sanitize_file_path(std::string_view path);

        /**
         * Keep only identifier characters and truncate.
         *
         * @param name Captured identifier text.
         * @param max_length Maximum length of the result.
         * @param fallback Returned when nothing is left after cleaning.
         * @return The cleaned identifier.
         */
        static std::string sanitize_identifier(std::string_view name, std::size_t max_length,
                                               std::string_view fallback = "anonymous");

        /**
         * Replace path-like tokens with "[PATH]", drop control characters
         * and truncate to max_error_message characters.
         *
         * @param message Raw error text, typically from an exception.
         * @return Message safe to log.
         */
        static std::string sanitize_error_message(std::string_view message);
    };

} // namespace hqa::security

#endif // HQA_SANITIZER_H
