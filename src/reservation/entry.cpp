/**
 * @file entry.cpp
 * @brief Window arithmetic for a single reservation rule.
 * @author Dimitris Kafetzis
 */

#include "reservation/entry.hpp"

#include <algorithm>

namespace slot_reserver {

ReservationEntry::ReservationEntry(ReservationSize size, CronPattern pattern, Millis duration)
    : size_(size), pattern_(std::move(pattern)), duration_(duration) {}

Result<SlotCount, InvalidPatternError> ReservationEntry::size_of_reservation(
    const INode& node, EpochMillis t) const {
    auto start = pattern_.floor(t);
    if (!start) return start.error();

    if (*start <= t && t < saturating_add(*start, duration_)) {
        return size_.resolve(node);
    }
    return SlotCount{0};
}

Result<EpochMillis, InvalidPatternError> ReservationEntry::time_of_next_change(
    EpochMillis t) const {
    auto previous = pattern_.floor(t);
    if (!previous) return previous.error();
    auto next = pattern_.ceil(t);
    if (!next) return next.error();

    const EpochMillis end = saturating_add(*previous, duration_);
    const EpochMillis start = *next;

    // Inside a window: it closes at `end`, unless a new one opens first.
    if (t < end) return std::min(end, start);
    return start;
}

std::string ReservationEntry::to_string() const {
    return size_.to_string() + ":" + pattern_.text() + ":"
           + std::to_string(duration_.count() / kMillisPerMinute);
}

}  // namespace slot_reserver
