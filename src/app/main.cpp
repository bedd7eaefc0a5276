/**
 * @file main.cpp
 * @brief slot_reserver command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one tool:
 *   Config → Logger → ReservationHost → (validate | evaluate | timeline | watch)
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/time_format.hpp"
#include "core/types.hpp"
#include "host/reservation_host.hpp"
#include "host/timeline.hpp"
#include "reservation/node.hpp"
#include "reservation/policy.hpp"
#include "reservation/validator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace slot_reserver;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path rules_path;
    std::string node_id;
    std::optional<SlotCount> executors;
    std::string at;
    std::optional<uint32_t> timeline_hours;
    bool validate_only = false;
    bool watch = false;
};

void print_usage() {
    std::cout << "Usage: slot_reserver [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --rules <path>       Reservation rule file (overrides the config)\n"
              << "  --node-id <id>       Node identifier\n"
              << "  --executors <n>      Executor count of the node\n"
              << "  --at <time>          Query instant: epoch ms or YYYY-MM-DDTHH:MM[:SS] (UTC)\n"
              << "  --validate           Check the rules and exit\n"
              << "  --timeline <hours>   Print every reservation change in the next <hours>\n"
              << "  --watch              Re-evaluate whenever the reservation may change\n"
              << "  --help, -h           Show this help message\n";
}

template <typename Int>
std::optional<Int> parse_count(std::string_view text) {
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--rules" && i + 1 < argc) {
            args.rules_path = argv[++i];
        } else if (arg == "--node-id" && i + 1 < argc) {
            args.node_id = argv[++i];
        } else if (arg == "--executors" && i + 1 < argc) {
            args.executors = parse_count<SlotCount>(argv[++i]);
            if (!args.executors) {
                std::cerr << "--executors expects a non-negative integer\n";
                return std::nullopt;
            }
        } else if (arg == "--at" && i + 1 < argc) {
            args.at = argv[++i];
        } else if (arg == "--timeline" && i + 1 < argc) {
            args.timeline_hours = parse_count<uint32_t>(argv[++i]);
            if (!args.timeline_hours) {
                std::cerr << "--timeline expects a number of hours\n";
                return std::nullopt;
            }
        } else if (arg == "--validate") {
            args.validate_only = true;
        } else if (arg == "--watch") {
            args.watch = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

EpochMillis now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void print_reservation(const NodeReservation& r, EpochMillis at) {
    std::cout << "node:        " << r.node_id << "\n"
              << "at:          " << format_timestamp(at) << "\n"
              << "executors:   " << r.executors << "\n"
              << "reserved:    " << r.reserved
              << (r.over_reserved() ? " (over-reserved)" : "") << "\n"
              << "available:   " << r.available << "\n"
              << "next change: " << format_timestamp(r.next_change) << "\n";
}

int run_timeline(const CronReservationPolicy& policy, const INode& node,
                 EpochMillis from, uint32_t hours, Logger& logger) {
    const EpochMillis until = saturating_add(
        from, std::chrono::duration_cast<Millis>(std::chrono::hours{hours}));

    auto timeline = build_timeline(policy, node, from, until);
    if (!timeline) {
        logger.error("Timeline failed: " + timeline.error().message);
        std::cerr << timeline.error().message << "\n";
        return 1;
    }
    for (const auto& transition : *timeline) {
        std::cout << format_timestamp(transition.at) << "  reserved="
                  << transition.reserved << "\n";
    }
    return 0;
}

int run_watch(const ReservationHost& host, const NodeId& id, const INode& node,
              Logger& logger) {
    logger.info("Watching node " + id + ". Press Ctrl+C to stop.");

    std::optional<SlotCount> last_reserved;
    while (!g_shutdown_requested) {
        const EpochMillis now = now_millis();
        auto result = host.evaluate(id, node, now);
        if (!result) {
            std::cerr << result.error().message << "\n";
            return 1;
        }
        if (last_reserved != result->reserved) {
            logger.info("Node " + id + ": " + std::to_string(result->reserved)
                        + " reserved, " + std::to_string(result->available)
                        + " available, next change "
                        + format_timestamp(result->next_change));
            last_reserved = result->reserved;
        }

        // Sleep in short slices so signals are honoured promptly.
        while (!g_shutdown_requested && now_millis() < result->next_poll) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }
    logger.info("Watch stopped.");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed_args = parse_args(argc, argv);
    if (!parsed_args) return 2;
    auto args = *parsed_args;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.node_id.empty()) config.node.id = args.node_id;
    if (args.executors) config.node.executors = *args.executors;
    if (!args.rules_path.empty()) config.schedule.rules_file = args.rules_path;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "slot_reserver",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    logger.info("slot_reserver starting, node " + config.node.id + " with "
                + std::to_string(config.node.executors) + " executors");

    // ── Rule text ────────────────────────────
    auto rules = resolve_rules(config.schedule);
    if (!rules) {
        logger.error(rules.error().message);
        std::cerr << rules.error().message << std::endl;
        return 1;
    }

    if (args.validate_only) {
        auto verdict = validate(*rules);
        if (!verdict) {
            std::cerr << "line " << verdict.line << ": " << verdict.message << std::endl;
            return 1;
        }
        std::cout << "OK" << std::endl;
        return 0;
    }

    EpochMillis at = now_millis();
    if (!args.at.empty()) {
        auto parsed_at = parse_timestamp(args.at);
        if (!parsed_at) {
            std::cerr << parsed_at.error().message << std::endl;
            return 2;
        }
        at = *parsed_at;
    }

    // ── Host ─────────────────────────────────
    MetricsCollector metrics(std::make_unique<NullSink>());
    ReservationHost host(logger, metrics, Millis{config.host.min_poll_advance_ms});
    StaticNode node(config.node.executors);

    auto loaded = host.load_cron_schedule(config.node.id, *rules);
    if (!loaded) {
        std::cerr << loaded.error().what() << std::endl;
        return 1;
    }

    if (args.timeline_hours) {
        auto policy = CronReservationPolicy::from_format(*rules);
        if (!policy) {
            std::cerr << policy.error().what() << std::endl;
            return 1;
        }
        return run_timeline(*policy, node, at, *args.timeline_hours, logger);
    }

    if (args.watch) {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        return run_watch(host, config.node.id, node, logger);
    }

    auto result = host.evaluate(config.node.id, node, at);
    if (!result) {
        std::cerr << result.error().message << std::endl;
        return 1;
    }
    print_reservation(*result, at);
    return 0;
}
