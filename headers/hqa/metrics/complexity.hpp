#ifndef HQA_COMPLEXITY_HPP
#define HQA_COMPLEXITY_HPP

/**
 * @file complexity.hpp
 * @brief Token counting primitives shared by calculators and checkers.
 *
 * Both functions expect masked code (comments and string contents blanked)
 * and run in a single linear pass without regular expressions, so their
 * cost is bounded by input size whatever the input looks like.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hqa::metrics {

    /**
     * Cyclomatic complexity proxy.
     *
     * Starts at 1 and adds one per `if`, `for`, `while`, `case`, `catch`,
     * `&&`, `||` and ternary `?`. Optional chaining (`?.`), nullish
     * coalescing (`??`) and optional markers (`?:`, `?)`, `?,`) are not
     * counted.
     *
     * @param code Masked code of one unit.
     * @param ceiling Result is capped at this value.
     */
    [[nodiscard]] std::size_t cyclomatic_complexity(std::string_view code, std::size_t ceiling = 999);

    struct NestingDepth {
        std::size_t depth = 0;
        std::size_t line = 1;  ///< 1-based line where depth was first reached
    };

    /**
     * Running brace-balance maximum over a whole file.
     *
     * Closing braces never take the depth below zero and opening braces
     * never push it above ceiling.
     *
     * @param code_lines Masked lines of the file.
     * @param ceiling Maximum depth reported.
     */
    [[nodiscard]] NestingDepth max_nesting_depth(const std::vector<std::string>& code_lines,
                                                 std::size_t ceiling = 50);

}  // namespace hqa::metrics

#endif // HQA_COMPLEXITY_HPP
