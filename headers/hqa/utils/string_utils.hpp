#ifndef HQA_STRING_UTILS_HPP
#define HQA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the scanners.
 *
 * All scanners work on std::string_view slices of a file's lines, so
 * these helpers avoid allocation wherever the result can be a view.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>

namespace hqa::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter.
     *
     * @param s The string to split.
     * @param delimiter The character to split on.
     * @return A vector of string views representing the parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits text into lines, dropping a trailing carriage return per line.
     */
    inline std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines;
        for (auto part : split(text, '\n')) {
            if (!part.empty() && part.back() == '\r') {
                part.remove_suffix(1);
            }
            lines.emplace_back(part);
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string result;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                result += delimiter;
            }
            result += part;
            first = false;
        }
        return result;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        std::size_t pos = 0;
        std::size_t found;
        while ((found = s.find(from, pos)) != std::string_view::npos) {
            result.append(s.substr(pos, found - pos));
            result.append(to);
            pos = found + from.size();
        }
        result.append(s.substr(pos));
        return result;
    }

    /**
     * Characters allowed in a script identifier.
     */
    inline bool is_identifier_char(const char c) noexcept {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '_' || c == '$';
    }

    /**
     * True when s[pos, pos + word.size()) equals word and is not part of a
     * longer identifier.
     */
    inline bool is_word_at(std::string_view s, std::size_t pos, std::string_view word) noexcept {
        if (pos + word.size() > s.size() || s.substr(pos, word.size()) != word) {
            return false;
        }
        if (pos > 0 && is_identifier_char(s[pos - 1])) {
            return false;
        }
        const std::size_t after = pos + word.size();
        return after >= s.size() || !is_identifier_char(s[after]);
    }

    /**
     * Keeps only identifier-safe characters and truncates to max_length.
     */
    inline std::string keep_identifier_chars(std::string_view s, std::size_t max_length) {
        std::string result;
        result.reserve(std::min(s.size(), max_length));
        for (const char c : s) {
            if (result.size() >= max_length) {
                break;
            }
            if (is_identifier_char(c)) {
                result.push_back(c);
            }
        }
        return result;
    }

}  // namespace hqa::string_utils

#endif // HQA_STRING_UTILS_HPP
