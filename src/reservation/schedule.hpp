/**
 * @file schedule.hpp
 * @brief A parsed reservation schedule: ordered entries from rule text.
 * @author Dimitris Kafetzis
 *
 * Rule text format, one rule per line:
 *
 *     <size>:<cron-pattern>:<duration-minutes>
 *
 * `size` is a non-negative integer or `*` (all executors). Blank lines and
 * lines starting with `#` are ignored. Lines may end in `\n` or `\r\n`.
 */

#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "reservation/entry.hpp"
#include "reservation/node.hpp"

#include <string_view>
#include <vector>

namespace slot_reserver {

/**
 * @brief Immutable, ordered collection of reservation entries.
 *
 * Queries are const and touch no shared mutable state, so one schedule may
 * be queried from any number of threads once it has been published.
 */
class ReservationSchedule {
public:
    /// An empty schedule: reserves nothing, never changes.
    ReservationSchedule() = default;
    explicit ReservationSchedule(std::vector<ReservationEntry> entries);

    /**
     * @brief Parse rule text. The first malformed line fails the whole parse.
     */
    static Result<ReservationSchedule, MalformedRuleError> parse(std::string_view text);

    /**
     * @brief Sum of every entry's contribution at t.
     *
     * Not capped at the node's executor count; saturates at the SlotCount
     * maximum.
     */
    Result<SlotCount, InvalidPatternError> size_of_reservation(const INode& node,
                                                               EpochMillis t) const;

    /**
     * @brief Minimum over entries of their next change; kNever when empty.
     */
    Result<EpochMillis, InvalidPatternError> time_of_next_change(EpochMillis t) const;

    [[nodiscard]] const std::vector<ReservationEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<ReservationEntry> entries_;
};

}  // namespace slot_reserver
