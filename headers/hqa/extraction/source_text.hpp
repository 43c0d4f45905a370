#ifndef HQA_SOURCE_TEXT_HPP
#define HQA_SOURCE_TEXT_HPP

/**
 * @file source_text.hpp
 * @brief Line view of a source file with a comment/string-masked twin.
 *
 * Every scanner needs the same two questions answered per line: what did
 * the author write, and which of those characters are code. SourceText
 * splits the content once and builds, for each line, a copy in which line
 * comments, block comments and the contents of string, template and
 * regular expression literals are replaced by spaces. Quote characters and
 * the delimiting slashes themselves are kept.
 * Both views have identical lengths, so a column found in the masked view
 * is a valid column in the raw view.
 *
 * Block comments and template literals may span lines; the masking state
 * is carried across line boundaries. A '/' opens a regular expression
 * literal when it starts an expression: at line start, after an operator
 * or opening punctuator, or after a keyword such as `return`.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hqa::extraction {

    class SourceText {
    public:
        explicit SourceText(std::string_view content);

        [[nodiscard]] std::size_t line_count() const noexcept { return lines_.size(); }

        /**
         * Raw text of a line. Index is 0-based.
         */
        [[nodiscard]] std::string_view line(std::size_t index) const { return lines_.at(index); }

        /**
         * Masked text of a line. Index is 0-based.
         */
        [[nodiscard]] std::string_view code(std::size_t index) const { return code_.at(index); }

        /**
         * True when the masked line holds nothing but whitespace, i.e. the
         * line is empty or entirely comment.
         */
        [[nodiscard]] bool is_blank_code(std::size_t index) const;

        [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }
        [[nodiscard]] const std::vector<std::string>& code_lines() const noexcept { return code_; }

        /**
         * Joins raw lines [first, last] with '\n', starting at first_column
         * (0-based) on the first line.
         */
        [[nodiscard]] std::string raw_span(std::size_t first, std::size_t last, std::size_t first_column = 0) const;

        /**
         * Same as raw_span() over the masked view.
         */
        [[nodiscard]] std::string code_span(std::size_t first, std::size_t last, std::size_t first_column = 0) const;

    private:
        static std::string join_span(const std::vector<std::string>& source, std::size_t first,
                                     std::size_t last, std::size_t first_column);

        std::vector<std::string> lines_;
        std::vector<std::string> code_;
    };

}  // namespace hqa::extraction

#endif // HQA_SOURCE_TEXT_HPP
