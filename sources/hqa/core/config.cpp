#include "hqa/core/config.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <sstream>
#include <utility>

namespace hqa::core
{
    namespace {

        constexpr std::array<std::string_view, 7> kLogLevels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"
        };

        void read_size(const toml::table& tbl, std::string_view key, std::size_t& target) {
            if (const auto value = tbl[key].value<int64_t>(); value && *value >= 0) {
                target = static_cast<std::size_t>(*value);
            }
        }

        void read_thresholds(const toml::table& tbl, std::string_view key, heuristics::SeverityThresholds& target) {
            const auto* section = tbl[key].as_table();
            if (section == nullptr) {
                return;
            }
            for (const auto& [name, bound] : {std::pair<std::string_view, double*>{"low", &target.low},
                                         std::pair<std::string_view, double*>{"medium", &target.medium},
                                         std::pair<std::string_view, double*>{"high", &target.high}}) {
                if (const auto value = (*section)[name].value<double>()) {
                    *bound = *value;
                }
            }
        }

        void read_strings(const toml::table& tbl, std::string_view key, std::vector<std::string>& target) {
            const auto* array = tbl[key].as_array();
            if (array == nullptr) {
                return;
            }
            target.clear();
            for (const auto& item : *array) {
                if (const auto value = item.value<std::string>()) {
                    target.push_back(*value);
                }
            }
        }

        Result<void, Error> check_thresholds(std::string_view name, const heuristics::SeverityThresholds& t) {
            if (t.low <= 0 || t.low > t.medium || t.medium > t.high) {
                return Result<void, Error>::failure(
                    Error::config_error("Thresholds must satisfy 0 < low <= medium <= high", std::string(name))
                );
            }
            return Result<void, Error>::success();
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        std::ifstream file(path);
        if (!file) {
            return Result<Config, Error>::failure(
                Error::not_found("Configuration file not found", path.filename().string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();
        return load_from_string(oss.str()).map_error([&path](const Error& error) {
            return error.with_context(path.filename().string());
        });
    }

    Result<Config, Error> Config::load_from_string(std::string_view content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& e) {
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse configuration", std::string(e.description()))
            );
        }

        Config config;
        auto& h = config.heuristics;

        if (const auto* limits = tbl["limits"].as_table()) {
            read_size(*limits, "max_file_size", h.limits.max_file_size);
            read_size(*limits, "max_path_length", h.limits.max_path_length);
            read_size(*limits, "max_line_length", h.limits.max_line_length);
            read_size(*limits, "max_lines_per_file", h.limits.max_lines_per_file);
            read_size(*limits, "max_units", h.limits.max_units);
            read_size(*limits, "max_body_chars", h.limits.max_body_chars);
            read_size(*limits, "max_body_lines", h.limits.max_body_lines);
            read_size(*limits, "max_brace_depth", h.limits.max_brace_depth);
            read_size(*limits, "max_findings_per_file", h.limits.max_findings_per_file);
            if (const auto ms = (*limits)["analysis_time_ms"].value<int64_t>(); ms && *ms >= 0) {
                h.limits.analysis_time = std::chrono::milliseconds(*ms);
            }
        }

        if (const auto* thresholds = tbl["thresholds"].as_table()) {
            read_size(*thresholds, "complexity", h.thresholds.complexity);
            read_size(*thresholds, "complexity_error", h.thresholds.complexity_error);
            read_size(*thresholds, "function_length", h.thresholds.function_length);
            read_size(*thresholds, "parameter_count", h.thresholds.parameter_count);
            read_size(*thresholds, "nesting_depth", h.thresholds.nesting_depth);
        }

        if (const auto* magic = tbl["magic_numbers"].as_table()) {
            read_strings(*magic, "allow_list", h.magic_numbers.allow_list);
        }

        if (const auto* srp = tbl.at_path("principles.srp").as_table()) {
            read_thresholds(*srp, "method_count", h.srp.method_count);
            read_thresholds(*srp, "complexity", h.srp.complexity);
            read_thresholds(*srp, "concerns", h.srp.concerns);
            read_thresholds(*srp, "class_lines", h.srp.class_lines);
            read_thresholds(*srp, "parameters", h.srp.parameters);
            read_thresholds(*srp, "classes_per_file", h.srp.classes_per_file);
        }

        if (const auto* dip = tbl.at_path("principles.dip").as_table()) {
            read_thresholds(*dip, "instantiations", h.dip.instantiations);
        }

        if (const auto* project = tbl["project"].as_table()) {
            read_strings(*project, "ignore_dirs", h.project.ignore_dirs);
            read_size(*project, "max_files", h.project.max_files);
        }

        if (const auto* logging = tbl["logging"].as_table()) {
            config.logging.level = (*logging)["level"].value_or(config.logging.level);
            config.logging.file = (*logging)["file"].value_or(config.logging.file);
            config.logging.console = (*logging)["console"].value_or(config.logging.console);
            config.logging.pattern = (*logging)["pattern"].value_or(config.logging.pattern);
        }

        if (const auto* i18n = tbl["i18n"].as_table()) {
            config.i18n.catalog = (*i18n)["catalog"].value_or(config.i18n.catalog);
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<Config, Error>::failure(valid.error());
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::validate() const {
        const auto& limits = heuristics.limits;
        if (limits.max_file_size == 0 || limits.max_path_length == 0 || limits.max_line_length == 0 ||
            limits.max_units == 0 || limits.max_body_chars == 0 || limits.max_body_lines == 0 ||
            limits.max_brace_depth == 0 || limits.max_findings_per_file == 0) {
            return Result<void, Error>::failure(Error::config_error("Limits must be greater than zero", "limits"));
        }

        const auto& thresholds = heuristics.thresholds;
        if (thresholds.complexity_error < thresholds.complexity) {
            return Result<void, Error>::failure(
                Error::config_error("complexity_error must not be below complexity", "thresholds")
            );
        }

        for (const auto& [name, t] : {
                 std::pair{"principles.srp.method_count", heuristics.srp.method_count},
                 std::pair{"principles.srp.complexity", heuristics.srp.complexity},
                 std::pair{"principles.srp.concerns", heuristics.srp.concerns},
                 std::pair{"principles.srp.class_lines", heuristics.srp.class_lines},
                 std::pair{"principles.srp.parameters", heuristics.srp.parameters},
                 std::pair{"principles.srp.classes_per_file", heuristics.srp.classes_per_file},
                 std::pair{"principles.dip.instantiations", heuristics.dip.instantiations}}) {
            if (auto checked = check_thresholds(name, t); checked.is_err()) {
                return checked;
            }
        }

        if (std::ranges::find(kLogLevels, logging.level) == kLogLevels.end()) {
            return Result<void, Error>::failure(Error::config_error("Unknown log level", logging.level));
        }

        return Result<void, Error>::success();
    }

}  // namespace hqa::core
