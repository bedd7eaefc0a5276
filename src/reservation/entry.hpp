/**
 * @file entry.hpp
 * @brief One reservation rule: size, recurrence, window duration.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "cron/cron_pattern.hpp"
#include "reservation/node.hpp"

#include <compare>
#include <string>

namespace slot_reserver {

// ─────────────────────────────────────────────
// Reservation Size
// ─────────────────────────────────────────────

/**
 * @brief A fixed number of slots, or every slot the node has at query time.
 */
class ReservationSize {
public:
    [[nodiscard]] static constexpr ReservationSize all() noexcept {
        return ReservationSize{true, 0};
    }

    [[nodiscard]] static constexpr ReservationSize exactly(SlotCount count) noexcept {
        return ReservationSize{false, count};
    }

    [[nodiscard]] constexpr bool is_all() const noexcept { return all_; }

    /// Fixed count; 0 when is_all().
    [[nodiscard]] constexpr SlotCount count() const noexcept { return count_; }

    /// The concrete number of slots on `node`.
    [[nodiscard]] SlotCount resolve(const INode& node) const noexcept {
        return all_ ? node.executor_count() : count_;
    }

    /// "*" or the decimal count, as written in rule text.
    [[nodiscard]] std::string to_string() const {
        return all_ ? "*" : std::to_string(count_);
    }

    auto operator<=>(const ReservationSize&) const = default;

private:
    constexpr ReservationSize(bool all, SlotCount count) noexcept : all_(all), count_(count) {}

    bool all_;
    SlotCount count_;
};

// ─────────────────────────────────────────────
// Reservation Entry
// ─────────────────────────────────────────────

/**
 * @brief A rule that reserves `size` slots for `duration` starting at every
 *        occurrence of `pattern`.
 *
 * Each occurrence opens a half-open window [occurrence, occurrence + duration).
 * Windows of the same entry may overlap; they are not merged.
 */
class ReservationEntry {
public:
    ReservationEntry(ReservationSize size, CronPattern pattern, Millis duration);

    /**
     * @brief resolve(size) if t lies inside the window opened by floor(t), else 0.
     */
    Result<SlotCount, InvalidPatternError> size_of_reservation(const INode& node,
                                                               EpochMillis t) const;

    /**
     * @brief Earliest instant >= t at which size_of_reservation may change.
     *
     * May equal t when t is itself an occurrence.
     */
    Result<EpochMillis, InvalidPatternError> time_of_next_change(EpochMillis t) const;

    [[nodiscard]] const ReservationSize& size() const noexcept { return size_; }
    [[nodiscard]] const CronPattern& pattern() const noexcept { return pattern_; }
    [[nodiscard]] Millis duration() const noexcept { return duration_; }

    /// Canonical "<size>:<pattern>:<minutes>" form.
    [[nodiscard]] std::string to_string() const;

private:
    ReservationSize size_;
    CronPattern pattern_;
    Millis duration_;
};

}  // namespace slot_reserver
