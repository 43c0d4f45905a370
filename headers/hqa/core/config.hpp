#ifndef HQA_CORE_CONFIG_HPP
#define HQA_CORE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Engine configuration loaded from TOML.
 *
 * Every section is optional; missing keys keep their defaults.
 * @code
 *     [limits]
 *     max_file_size = 1000000
 *     analysis_time_ms = 30000
 *
 *     [thresholds]
 *     complexity = 10
 *     nesting_depth = 4
 *
 *     [magic_numbers]
 *     allow_list = ["line", "port", "timeout"]
 *
 *     [principles.srp.method_count]
 *     low = 10
 *     medium = 15
 *     high = 20
 *
 *     [logging]
 *     level = "info"
 * @endcode
 */

#include "hqa/result.hpp"
#include "hqa/error.hpp"
#include "hqa/heuristics/config.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace hqa::core {

    namespace fs = std::filesystem;

    struct LoggingConfig {
        std::string level = "info";
        std::string file;
        bool console = true;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    };

    struct I18nConfig {
        /// Optional JSON catalog merged over the built-in English messages
        std::string catalog;
    };

    struct Config {
        heuristics::HeuristicsConfig heuristics;
        LoggingConfig logging;
        I18nConfig i18n;

        static Result<Config, Error> load_from_file(const fs::path& path);
        static Result<Config, Error> load_from_string(std::string_view content);
        static Config default_config();

        /**
         * Rejects zero ceilings, inverted severity thresholds and unknown
         * log levels.
         */
        [[nodiscard]] Result<void, Error> validate() const;
    };

}  // namespace hqa::core

#endif // HQA_CORE_CONFIG_HPP
