#include "hqa/security/sanitizer.h"
#include "hqa/utils/string_utils.hpp"

#include <cctype>

namespace hqa::security {

    namespace {

        bool is_display_char(const char c) {
            const auto uc = static_cast<unsigned char>(c);
            return std::isalnum(uc) || c == '.' || c == '_' || c == '-';
        }

        bool is_separator(const char c) {
            return c == '/' || c == '\\';
        }

        /**
         * A token is path-like from its first separator onwards when a second
         * separator follows inside the same token.
         */
        void append_redacted_token(std::string& out, std::string_view token) {
            const std::size_t first = token.find_first_of("/\\");
            if (first != std::string_view::npos &&
                token.find_first_of("/\\", first + 1) != std::string_view::npos) {
                out.append(token.substr(0, first));
                out.append("[PATH]");
                return;
            }
            out.append(token);
        }

    }  // namespace

    std::string Sanitizer::sanitize_file_path(std::string_view path) {
        std::size_t start = 0;
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (is_separator(path[i])) {
                start = i + 1;
            }
        }

        std::string result;
        for (const char c : path.substr(start)) {
            if (result.size() >= max_display_name) {
                break;
            }
            if (is_display_char(c)) {
                result.push_back(c);
            }
        }

        if (result.empty()) {
            return "unknown-file";
        }
        return result;
    }

    std::string Sanitizer::sanitize_identifier(std::string_view name, const std::size_t max_length,
                                               std::string_view fallback) {
        std::string result = string_utils::keep_identifier_chars(string_utils::trim(name), max_length);
        if (result.empty()) {
            return std::string(fallback);
        }
        return result;
    }

    std::string Sanitizer::sanitize_error_message(std::string_view message) {
        std::string result;
        result.reserve(std::min(message.size(), max_error_message));

        std::size_t pos = 0;
        while (pos < message.size() && result.size() < max_error_message) {
            const auto c = static_cast<unsigned char>(message[pos]);
            if (std::isspace(c)) {
                result.push_back(' ');
                ++pos;
                continue;
            }

            std::size_t end = pos;
            while (end < message.size() && !std::isspace(static_cast<unsigned char>(message[end]))) {
                ++end;
            }

            std::string token;
            for (const char tc : message.substr(pos, end - pos)) {
                if (!std::iscntrl(static_cast<unsigned char>(tc))) {
                    token.push_back(tc);
                }
            }
            append_redacted_token(result, token);
            pos = end;
        }

        if (result.size() > max_error_message) {
            result.resize(max_error_message);
        }
        return result;
    }

} // namespace hqa::security
