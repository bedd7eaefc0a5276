/**
 * @file policy.hpp
 * @brief Reservation policy capability and the cron-driven implementation.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "reservation/node.hpp"
#include "reservation/schedule.hpp"

#include <string>
#include <string_view>

namespace slot_reserver {

/**
 * @brief Anything that can tell a host how many slots of a node are held back.
 *
 * Hosts register implementations per node and combine them (ReservationHost).
 * Complements the ReservationPolicyLike concept with a virtual interface for
 * type-erased registration.
 */
class IReservationPolicy {
public:
    virtual ~IReservationPolicy() = default;

    virtual Result<SlotCount, InvalidPatternError> size_of_reservation(
        const INode& node, EpochMillis t) const = 0;

    virtual Result<EpochMillis, InvalidPatternError> time_of_next_change(
        const INode& node, EpochMillis t) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Reservations described by cron rule text.
 *
 * Only the source text is canonical. Entries are always re-derived from it by
 * from_format(); a changed text means building a new policy.
 */
class CronReservationPolicy : public IReservationPolicy {
public:
    static Result<CronReservationPolicy, MalformedRuleError> from_format(std::string format);

    Result<SlotCount, InvalidPatternError> size_of_reservation(
        const INode& node, EpochMillis t) const override;

    Result<EpochMillis, InvalidPatternError> time_of_next_change(
        const INode& node, EpochMillis t) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "cron"; }

    [[nodiscard]] const std::string& format() const noexcept { return format_; }
    [[nodiscard]] const ReservationSchedule& schedule() const noexcept { return schedule_; }

private:
    CronReservationPolicy(std::string format, ReservationSchedule schedule);

    std::string format_;
    ReservationSchedule schedule_;
};

}  // namespace slot_reserver
