/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>

namespace slot_reserver {

struct NodeReservation;

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_schedule_loaded(const NodeId& node, size_t entries);
    void record_schedule_rejected(const NodeId& node, size_t line, std::string_view message);
    void record_reservation(const NodeReservation& reservation, EpochMillis at);
    void record_query_error(const NodeId& node, EpochMillis at, std::string_view message);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace slot_reserver
