#include "hqa/security/input_guard.h"
#include "hqa/security/sanitizer.h"
#include "hqa/utils/file_utils.hpp"
#include "hqa/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <system_error>

namespace hqa::security {

    namespace {

        std::size_t skip_spaces(std::string_view s, std::size_t pos) {
            while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
                ++pos;
            }
            return pos;
        }

        bool matches_ignore_case(std::string_view s, std::size_t pos, std::string_view word) {
            if (pos + word.size() > s.size()) {
                return false;
            }
            for (std::size_t i = 0; i < word.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(s[pos + i])) != word[i]) {
                    return false;
                }
            }
            return true;
        }

        bool is_call_at(std::string_view s, std::size_t pos, std::string_view word) {
            if (!string_utils::is_word_at(s, pos, word)) {
                return false;
            }
            const std::size_t next = skip_spaces(s, pos + word.size());
            return next < s.size() && s[next] == '(';
        }

        bool is_string_timer_at(std::string_view s, std::size_t pos, std::string_view word) {
            if (!is_call_at(s, pos, word)) {
                return false;
            }
            const std::size_t paren = s.find('(', pos + word.size());
            const std::size_t arg = skip_spaces(s, paren + 1);
            return arg < s.size() && (s[arg] == '"' || s[arg] == '\'' || s[arg] == '`');
        }

    }  // namespace

    const char* to_string(RejectionReason reason) noexcept {
        switch (reason) {
            case RejectionReason::EmptyPath:         return "empty-path";
            case RejectionReason::NullByte:          return "null-byte";
            case RejectionReason::PathTooLong:       return "path-too-long";
            case RejectionReason::PathTraversal:     return "path-traversal";
            case RejectionReason::NotFound:          return "not-found";
            case RejectionReason::NotRegularFile:    return "not-regular-file";
            case RejectionReason::ReadFailure:       return "read-failure";
            case RejectionReason::FileTooLarge:      return "file-too-large";
            case RejectionReason::SuspiciousContent: return "suspicious-content";
        }
        return "unknown";
    }

    InputGuard::InputGuard(const heuristics::Limits& limits,
                           std::shared_ptr<analysis::AnalysisMetrics> metrics)
        : limits_(limits)
        , metrics_(std::move(metrics)) {}

    Result<AnalysisContext, Rejection> InputGuard::validate(
        const fs::path& path,
        std::string_view content,
        const Language language
    ) const {
        if (auto rejection = check_path(path)) {
            return reject(path, std::move(*rejection));
        }

        if (content.size() > limits_.max_file_size) {
            return reject(path, {RejectionReason::FileTooLarge,
                                 "File too large: " + std::to_string(content.size()) +
                                 " bytes (max: " + std::to_string(limits_.max_file_size) + ")"});
        }

        if (const auto pattern = find_suspicious_pattern(content); !pattern.empty()) {
            return reject(path, {RejectionReason::SuspiciousContent,
                                 "Suspicious content detected: " + pattern});
        }

        AnalysisContext context;
        context.display_path = Sanitizer::sanitize_file_path(path.string());
        context.path = path.lexically_normal();
        context.language = language;
        context.content = std::string(content);
        context.content_length = content.size();
        context.is_safe = true;
        return Result<AnalysisContext, Rejection>::success(std::move(context));
    }

    Result<AnalysisContext, Rejection> InputGuard::load(const fs::path& path, const Language language) const
    {
        if (auto rejection = check_path(path)) {
            return reject(path, std::move(*rejection));
        }

        std::error_code ec;
        const auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            return reject(path, {RejectionReason::NotFound, "File does not exist"});
        }
        if (!fs::is_regular_file(status)) {
            return reject(path, {RejectionReason::NotRegularFile, "Not a regular file"});
        }

        const auto size = fs::file_size(path, ec);
        if (ec) {
            return reject(path, {RejectionReason::ReadFailure, "Failed to get file size"});
        }
        if (size > limits_.max_file_size) {
            return reject(path, {RejectionReason::FileTooLarge,
                                 "File too large: " + std::to_string(size) +
                                 " bytes (max: " + std::to_string(limits_.max_file_size) + ")"});
        }

        auto content = file_utils::read_file_bounded(path, limits_.max_file_size + 1);
        if (content.is_err()) {
            return reject(path, {RejectionReason::ReadFailure, content.error().message()});
        }

        return validate(path, content.value(), language);
    }

    std::string InputGuard::find_suspicious_pattern(std::string_view content) {
        for (std::size_t i = 0; i < content.size(); ++i) {
            switch (content[i]) {
                case '<':
                    if (matches_ignore_case(content, i + 1, "script")) {
                        return "script-tag";
                    }
                    break;
                case 'e':
                    if (is_call_at(content, i, "eval")) {
                        return "dynamic-evaluation";
                    }
                    break;
                case 'F':
                    if (is_call_at(content, i, "Function")) {
                        return "dynamic-function";
                    }
                    break;
                case 's':
                    if (is_string_timer_at(content, i, "setTimeout") ||
                        is_string_timer_at(content, i, "setInterval")) {
                        return "string-timer";
                    }
                    break;
                default:
                    break;
            }
        }
        return {};
    }

    bool InputGuard::contains_path_traversal(const fs::path& path) {
        for (const auto& part : path.lexically_normal()) {
            if (part == "..") {
                return true;
            }
        }
        return false;
    }

    std::optional<Rejection> InputGuard::check_path(const fs::path& path) const {
        const auto& native = path.native();

        if (native.empty()) {
            return Rejection{RejectionReason::EmptyPath, "File path cannot be empty"};
        }

        if (native.find('\0') != fs::path::string_type::npos) {
            return Rejection{RejectionReason::NullByte, "File path contains a null byte"};
        }

        if (native.size() > limits_.max_path_length) {
            return Rejection{RejectionReason::PathTooLong,
                             "File path exceeds maximum length of " +
                             std::to_string(limits_.max_path_length)};
        }

        if (contains_path_traversal(path)) {
            return Rejection{RejectionReason::PathTraversal, "Path traversal detected"};
        }

        return std::nullopt;
    }

    Result<AnalysisContext, Rejection> InputGuard::reject(const fs::path& path, Rejection rejection) const {
        if (metrics_) {
            metrics_->record_rejection();
        }

        spdlog::warn("Input rejected [{}] {}: {}",
                     to_string(rejection.reason),
                     Sanitizer::sanitize_file_path(path.string()),
                     Sanitizer::sanitize_error_message(rejection.message));

        return Result<AnalysisContext, Rejection>::failure(std::move(rejection));
    }

} // namespace hqa::security
