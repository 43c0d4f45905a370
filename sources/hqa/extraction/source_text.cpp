#include "hqa/extraction/source_text.hpp"
#include "hqa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace hqa::extraction {

    namespace {

        enum class LexState {
            Code,
            BlockComment,
            SingleQuote,
            DoubleQuote,
            Template
        };

        constexpr std::array<std::string_view, 6> kRegexPrefixKeywords = {
            "return", "typeof", "case", "yield", "void", "delete"
        };

        /**
         * True when a '/' at `slash` starts an expression, which makes it a
         * regular expression literal rather than a division.
         */
        bool starts_regex(std::string_view line, const std::size_t slash) {
            std::size_t j = slash;
            while (j > 0 && std::isspace(static_cast<unsigned char>(line[j - 1]))) {
                --j;
            }
            if (j == 0) {
                return true;
            }

            const char prev = line[j - 1];
            if (std::string_view("(,=:[!&|?{};").find(prev) != std::string_view::npos) {
                return true;
            }
            if (!string_utils::is_identifier_char(prev)) {
                return false;
            }

            std::size_t start = j;
            while (start > 0 && string_utils::is_identifier_char(line[start - 1])) {
                --start;
            }
            const auto word = line.substr(start, j - start);
            return std::ranges::find(kRegexPrefixKeywords, word) != kRegexPrefixKeywords.end();
        }

        /**
         * Index of the '/' closing a regular expression literal opened at
         * `open`, or npos when the line ends first.
         */
        std::size_t regex_end(std::string_view line, const std::size_t open) {
            bool in_class = false;
            for (std::size_t k = open + 1; k < line.size(); ++k) {
                const char c = line[k];
                if (c == '\\') {
                    ++k;
                } else if (c == '[') {
                    in_class = true;
                } else if (c == ']') {
                    in_class = false;
                } else if (c == '/' && !in_class) {
                    return k;
                }
            }
            return std::string_view::npos;
        }

        /**
         * Masks one line in place and returns the state at the end of it.
         * Quoted strings and regular expression literals do not continue past
         * a line break; block comments and template literals do.
         */
        LexState mask_line(std::string& line, LexState state) {
            std::size_t i = 0;
            const std::size_t n = line.size();

            while (i < n) {
                const char c = line[i];
                switch (state) {
                    case LexState::Code:
                        if (c == '/' && i + 1 < n && line[i + 1] == '/') {
                            std::fill(line.begin() + static_cast<std::ptrdiff_t>(i), line.end(), ' ');
                            return LexState::Code;
                        }
                        if (c == '/' && i + 1 < n && line[i + 1] == '*') {
                            line[i] = ' ';
                            line[i + 1] = ' ';
                            i += 2;
                            state = LexState::BlockComment;
                            continue;
                        }
                        if (c == '/' && starts_regex(line, i)) {
                            const std::size_t close = regex_end(line, i);
                            if (close != std::string_view::npos) {
                                std::fill(line.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                          line.begin() + static_cast<std::ptrdiff_t>(close), ' ');
                                i = close + 1;
                                continue;
                            }
                        }
                        if (c == '\'') {
                            state = LexState::SingleQuote;
                        } else if (c == '"') {
                            state = LexState::DoubleQuote;
                        } else if (c == '`') {
                            state = LexState::Template;
                        }
                        ++i;
                        break;

                    case LexState::BlockComment:
                        if (c == '*' && i + 1 < n && line[i + 1] == '/') {
                            line[i] = ' ';
                            line[i + 1] = ' ';
                            i += 2;
                            state = LexState::Code;
                            continue;
                        }
                        line[i] = ' ';
                        ++i;
                        break;

                    case LexState::SingleQuote:
                    case LexState::DoubleQuote:
                    case LexState::Template: {
                        const char quote = state == LexState::SingleQuote ? '\''
                                         : state == LexState::DoubleQuote ? '"' : '`';
                        if (c == '\\') {
                            line[i] = ' ';
                            if (i + 1 < n) {
                                line[i + 1] = ' ';
                            }
                            i += 2;
                            continue;
                        }
                        if (c == quote) {
                            state = LexState::Code;
                            ++i;
                            continue;
                        }
                        line[i] = ' ';
                        ++i;
                        break;
                    }
                }
            }

            if (state == LexState::SingleQuote || state == LexState::DoubleQuote) {
                return LexState::Code;
            }
            return state;
        }

    }  // namespace

    SourceText::SourceText(std::string_view content)
        : lines_(string_utils::split_lines(content))
    {
        code_.reserve(lines_.size());
        auto state = LexState::Code;
        for (const auto& raw : lines_) {
            std::string masked = raw;
            state = mask_line(masked, state);
            code_.push_back(std::move(masked));
        }
    }

    bool SourceText::is_blank_code(const std::size_t index) const {
        return string_utils::trim(code_.at(index)).empty();
    }

    std::string SourceText::raw_span(const std::size_t first, const std::size_t last,
                                     const std::size_t first_column) const {
        return join_span(lines_, first, last, first_column);
    }

    std::string SourceText::code_span(const std::size_t first, const std::size_t last,
                                      const std::size_t first_column) const {
        return join_span(code_, first, last, first_column);
    }

    std::string SourceText::join_span(const std::vector<std::string>& source, const std::size_t first,
                                      const std::size_t last, const std::size_t first_column) {
        std::string result;
        if (first >= source.size()) {
            return result;
        }

        const std::size_t end = std::min(last, source.size() - 1);
        for (std::size_t i = first; i <= end; ++i) {
            if (i > first) {
                result.push_back('\n');
            }
            const std::string& line = source[i];
            if (i == first) {
                result.append(line, std::min(first_column, line.size()));
            } else {
                result.append(line);
            }
        }
        return result;
    }

}  // namespace hqa::extraction
