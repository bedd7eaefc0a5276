/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>

#include <toml++/toml.hpp>

namespace slot_reserver {

namespace {

/// Narrow a TOML integer into [min, max], or name the key that is out of range.
Result<uint32_t> checked_u32(int64_t value, std::string_view key, int64_t min = 0,
                             int64_t max = std::numeric_limits<uint32_t>::max()) {
    if (value < min || value > max) {
        return Error{std::string{key} + " must be within " + std::to_string(min) + " and "
                     + std::to_string(max) + ", got " + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.id = node["id"].value_or(std::string{"node-01"});
            auto executors = checked_u32(node["executors"].value_or(int64_t{1}),
                                         "node.executors");
            if (!executors) return executors.error();
            config.node.executors = *executors;
        }

        // [schedule]
        if (auto schedule = tbl["schedule"]; schedule.is_table()) {
            config.schedule.rules = schedule["rules"].value_or(std::string{});
            config.schedule.rules_file = schedule["rules_file"].value_or(std::string{});
            // Relative rule files are resolved against the config file's directory
            if (!config.schedule.rules_file.empty() && config.schedule.rules_file.is_relative()) {
                config.schedule.rules_file = path.parent_path() / config.schedule.rules_file;
            }
        }

        // [host]
        if (auto host = tbl["host"]; host.is_table()) {
            auto advance = checked_u32(host["min_poll_advance_ms"].value_or(int64_t{60000}),
                                       "host.min_poll_advance_ms");
            if (!advance) return advance.error();
            config.host.min_poll_advance_ms = *advance;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            auto max_size = checked_u32(telemetry["max_file_size_mb"].value_or(int64_t{50}),
                                        "telemetry.max_file_size_mb", 1, 1024 * 1024);
            if (!max_size) return max_size.error();
            config.telemetry.max_file_size_mb = *max_size;

            auto rotate = checked_u32(telemetry["rotate_count"].value_or(int64_t{5}),
                                      "telemetry.rotate_count", 0, kMaxRotateCount);
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = *rotate;
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            if (!parse_log_level(config.telemetry.log_level)) {
                return Error{"Unknown telemetry.log_level: " + config.telemetry.log_level};
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<std::string> resolve_rules(const ScheduleConfig& schedule) {
    if (!schedule.rules_file.empty()) {
        return read_text_file(schedule.rules_file);
    }
    return schedule.rules;
}

Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return Error{"Cannot open file: " + path.string()};
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

}  // namespace slot_reserver
