/**
 * @file types.hpp
 * @brief Fundamental types used throughout slot_reserver.
 * @author Dimitris Kafetzis
 *
 * Defines NodeId, EpochMillis, SlotCount and the minute-granularity time
 * point used by the recurrence matcher.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace slot_reserver {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;

// ─────────────────────────────────────────────
// Time
// ─────────────────────────────────────────────

/// Milliseconds since the Unix epoch, UTC. The query interface speaks this.
using EpochMillis = int64_t;
using Millis = std::chrono::milliseconds;

/// A calendar instant at whole-minute precision (UTC).
using MinutePoint = std::chrono::sys_time<std::chrono::minutes>;

/// "No change ever", returned by an empty schedule.
inline constexpr EpochMillis kNever = std::numeric_limits<EpochMillis>::max();

inline constexpr int64_t kMillisPerMinute = 60'000;

[[nodiscard]] constexpr MinutePoint floor_to_minute(EpochMillis t) noexcept {
    return std::chrono::floor<std::chrono::minutes>(
        std::chrono::sys_time<Millis>{Millis{t}});
}

[[nodiscard]] constexpr MinutePoint ceil_to_minute(EpochMillis t) noexcept {
    return std::chrono::ceil<std::chrono::minutes>(
        std::chrono::sys_time<Millis>{Millis{t}});
}

[[nodiscard]] constexpr EpochMillis to_epoch_millis(MinutePoint t) noexcept {
    return std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
}

/// t + d, clamped to kNever instead of overflowing.
[[nodiscard]] constexpr EpochMillis saturating_add(EpochMillis t, Millis d) noexcept {
    if (d.count() > 0 && t > kNever - d.count()) return kNever;
    return t + d.count();
}

// ─────────────────────────────────────────────
// Slots
// ─────────────────────────────────────────────

/// Number of executor slots on a node.
using SlotCount = uint32_t;

[[nodiscard]] constexpr SlotCount saturating_add(SlotCount a, SlotCount b) noexcept {
    if (a > std::numeric_limits<SlotCount>::max() - b) {
        return std::numeric_limits<SlotCount>::max();
    }
    return a + b;
}

}  // namespace slot_reserver
