#ifndef HQA_VERSION_HPP
#define HQA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Heuristic Quality Analyzer version information.
 */

namespace hqa {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 4;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.4.0";

    constexpr auto PROJECT_NAME = "Heuristic Quality Analyzer";

    /**
     * Short project name, also used as the logger name.
     */
    constexpr auto PROJECT_SHORT_NAME = "hqa";

}  // namespace hqa

#endif // HQA_VERSION_HPP
