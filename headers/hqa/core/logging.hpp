#ifndef HQA_CORE_LOGGING_HPP
#define HQA_CORE_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief spdlog setup for the engine.
 *
 * The engine logs through spdlog's default logger. configure_logging()
 * replaces it with a logger named "hqa" that writes to stderr and,
 * optionally, to a file. Callers that never configure logging get
 * spdlog's stock console logger.
 */

#include "hqa/result.hpp"
#include "hqa/error.hpp"
#include "hqa/core/config.hpp"

namespace hqa::core {

    /**
     * Installs the "hqa" logger as the spdlog default logger.
     *
     * @param config Level, pattern and sinks to use.
     * @return ConfigError for an unknown level or a file sink that cannot
     *         be opened.
     */
    [[nodiscard]] Result<void, Error> configure_logging(const LoggingConfig& config);

}  // namespace hqa::core

#endif // HQA_CORE_LOGGING_HPP
