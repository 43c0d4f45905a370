#ifndef HQA_ERROR_HPP
#define HQA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types and error handling utilities.
 *
 * Provides a structured error type that carries an error code, a message,
 * and optional context. Designed to work with Result<T, Error> so that every
 * stage of the analysis pipeline reports failure explicitly.
 *
 * Error categories:
 * - None: No error (success state)
 * - InvalidArgument: Invalid function arguments or parameters
 * - NotFound: Requested file or resource not found
 * - ParseError: Failed to parse configuration or catalog data
 * - IoError: File system or I/O operation failed
 * - ConfigError: Configuration validation failed
 * - SecurityError: Input rejected as unsafe
 * - ResourceLimit: A size or count ceiling was exceeded
 * - Timeout: The analysis time budget expired
 * - Cancelled: The caller requested cancellation
 * - AnalysisError: A scanner or checker failed
 * - InternalError: Unexpected internal error
 *
 * Usage:
 * @code
 *     auto units = extraction::StructuralExtractor{}.extract(text);
 *     if (units.is_err()) {
 *         spdlog::warn("extraction failed: {}", units.error().to_string());
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace hqa {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or parameter
        NotFound,         ///< Resource not found
        ParseError,       ///< Parsing failed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Configuration error
        SecurityError,    ///< Input rejected as unsafe
        ResourceLimit,    ///< Size or count ceiling exceeded
        Timeout,          ///< Time budget expired
        Cancelled,        ///< Cancellation requested
        AnalysisError,    ///< Analysis operation failed
        InternalError     ///< Internal/unexpected error
    };

    /**
     * Converts an ErrorCode to its string representation.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::SecurityError:   return "SecurityError";
            case ErrorCode::ResourceLimit:   return "ResourceLimit";
            case ErrorCode::Timeout:         return "Timeout";
            case ErrorCode::Cancelled:       return "Cancelled";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error type with code, message, and optional context.
     *
     * Error objects are immutable after construction. The context usually
     * carries a sanitized file name or the offending limit.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error security_error(std::string message, std::string context) {
            return {ErrorCode::SecurityError, std::move(message), std::move(context)};
        }

        static Error resource_limit(std::string message) {
            return {ErrorCode::ResourceLimit, std::move(message)};
        }

        static Error timeout(std::string message) {
            return {ErrorCode::Timeout, std::move(message)};
        }

        static Error cancelled(std::string message) {
            return {ErrorCode::Cancelled, std::move(message)};
        }

        static Error analysis_error(std::string message, std::string context) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Returns true for the errors that end a file's analysis early
         * without pointing at a defect (time budget, cancellation).
         */
        [[nodiscard]] bool is_interruption() const noexcept {
            return code_ == ErrorCode::Timeout || code_ == ErrorCode::Cancelled;
        }

        /**
         * Creates a new error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace hqa

#endif // HQA_ERROR_HPP
