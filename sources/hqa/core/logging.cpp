#include "hqa/core/logging.hpp"
#include "hqa/version.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace hqa::core
{
    Result<void, Error> configure_logging(const LoggingConfig& config) {
        const auto level = spdlog::level::from_str(config.level);
        if (level == spdlog::level::off && config.level != "off") {
            return Result<void, Error>::failure(Error::config_error("Unknown log level", config.level));
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (config.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        if (!config.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
            } catch (const spdlog::spdlog_ex& e) {
                return Result<void, Error>::failure(Error::config_error("Cannot open log file", e.what()));
            }
        }

        auto logger = std::make_shared<spdlog::logger>(PROJECT_SHORT_NAME, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern(config.pattern);
        spdlog::set_default_logger(std::move(logger));

        return Result<void, Error>::success();
    }

}  // namespace hqa::core
