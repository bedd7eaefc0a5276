/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include "host/reservation_host.hpp"

#include <sstream>

namespace slot_reserver {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_schedule_loaded(const NodeId& node, size_t entries) {
    std::ostringstream oss;
    oss << R"({"event":"schedule_loaded")"
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"entries":)" << entries
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_schedule_rejected(const NodeId& node, size_t line,
                                                std::string_view message) {
    std::ostringstream oss;
    oss << R"({"event":"schedule_rejected")"
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"line":)" << line
        << R"(,"reason":")" << json_escape(message) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_reservation(const NodeReservation& reservation, EpochMillis at) {
    std::ostringstream oss;
    oss << R"({"event":"reservation")"
        << R"(,"node":")" << json_escape(reservation.node_id) << "\""
        << R"(,"at_ms":)" << at
        << R"(,"executors":)" << reservation.executors
        << R"(,"reserved":)" << reservation.reserved
        << R"(,"available":)" << reservation.available;
    if (reservation.next_change == kNever) {
        oss << R"(,"next_change_ms":null)";
    } else {
        oss << R"(,"next_change_ms":)" << reservation.next_change;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_query_error(const NodeId& node, EpochMillis at,
                                          std::string_view message) {
    std::ostringstream oss;
    oss << R"({"event":"query_error")"
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"at_ms":)" << at
        << R"(,"reason":")" << json_escape(message) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace slot_reserver
