/**
 * @file policy.cpp
 * @brief CronReservationPolicy implementation.
 * @author Dimitris Kafetzis
 */

#include "reservation/policy.hpp"

namespace slot_reserver {

CronReservationPolicy::CronReservationPolicy(std::string format, ReservationSchedule schedule)
    : format_(std::move(format)), schedule_(std::move(schedule)) {}

Result<CronReservationPolicy, MalformedRuleError> CronReservationPolicy::from_format(
    std::string format) {
    auto parsed = ReservationSchedule::parse(format);
    if (!parsed) return parsed.error();
    return CronReservationPolicy{std::move(format), std::move(*parsed)};
}

Result<SlotCount, InvalidPatternError> CronReservationPolicy::size_of_reservation(
    const INode& node, EpochMillis t) const {
    return schedule_.size_of_reservation(node, t);
}

Result<EpochMillis, InvalidPatternError> CronReservationPolicy::time_of_next_change(
    const INode& /*node*/, EpochMillis t) const {
    return schedule_.time_of_next_change(t);
}

}  // namespace slot_reserver
