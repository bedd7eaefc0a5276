/**
 * @file config.hpp
 * @brief Tool and host configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace slot_reserver {

struct NodeConfig {
    NodeId id = "node-01";
    SlotCount executors = 1;
};

struct ScheduleConfig {
    std::string rules;                  ///< Inline rule text
    std::filesystem::path rules_file;   ///< Read instead of `rules` when set
};

struct HostConfig {
    uint32_t min_poll_advance_ms = 60000;   ///< Lower bound on the re-query interval
};

/// Upper bound on telemetry.rotate_count; rotation renames each kept file.
inline constexpr uint32_t kMaxRotateCount = 100;

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";   ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    NodeConfig node;
    ScheduleConfig schedule;
    HostConfig host;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Rule text named by the schedule section (reads rules_file if set).
 */
Result<std::string> resolve_rules(const ScheduleConfig& schedule);

/**
 * @brief Read a whole text file.
 */
Result<std::string> read_text_file(const std::filesystem::path& path);

}  // namespace slot_reserver
