/**
 * @file timeline.hpp
 * @brief Walk a policy's reservation changes across a time range.
 * @author Dimitris Kafetzis
 *
 * time_of_next_change() may return the query instant itself (a window that
 * opens exactly at t). The walker therefore advances by at least
 * `min_advance` whenever the reported change is not strictly later.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "reservation/node.hpp"

#include <vector>

namespace slot_reserver {

struct Transition {
    EpochMillis at;
    SlotCount reserved;

    bool operator==(const Transition&) const = default;
};

/**
 * @brief Reservation level at `from`, then every instant in (from, until]
 *        where it differs from the previous level.
 */
template <ReservationPolicyLike Policy>
Result<std::vector<Transition>, InvalidPatternError> build_timeline(
    const Policy& policy, const INode& node, EpochMillis from, EpochMillis until,
    Millis min_advance = std::chrono::minutes{1}) {
    std::vector<Transition> timeline;

    auto initial = policy.size_of_reservation(node, from);
    if (!initial) return initial.error();
    timeline.push_back({from, *initial});

    const Millis step = min_advance.count() > 0 ? min_advance : Millis{1};
    EpochMillis t = from;
    while (t < until) {
        auto next = policy.time_of_next_change(node, t);
        if (!next) return next.error();
        if (*next == kNever) break;

        EpochMillis probe = *next > t ? *next : saturating_add(t, step);
        if (probe > until) break;

        auto size = policy.size_of_reservation(node, probe);
        if (!size) return size.error();
        if (*size != timeline.back().reserved) {
            timeline.push_back({probe, *size});
        }
        t = probe;
    }
    return timeline;
}

}  // namespace slot_reserver
