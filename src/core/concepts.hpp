/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for slot_reserver interfaces.
 * @author Dimitris Kafetzis
 *
 * Compile-time counterparts of the virtual interfaces, for callers that
 * query one known policy type in a tight loop (benchmarks, timelines).
 */

#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <string_view>

namespace slot_reserver {

class INode;

// ─────────────────────────────────────────────
// ReservationPolicyLike
// ─────────────────────────────────────────────

/**
 * @concept ReservationPolicyLike
 * @brief Constrains types that answer "how many slots are reserved at t"
 *        and "when could that answer change".
 */
template <typename T>
concept ReservationPolicyLike = requires(const T& policy, const INode& node, EpochMillis t) {
    { policy.size_of_reservation(node, t) } -> std::same_as<Result<SlotCount, InvalidPatternError>>;
    { policy.time_of_next_change(node, t) } -> std::same_as<Result<EpochMillis, InvalidPatternError>>;
    { policy.name() } -> std::convertible_to<std::string_view>;
};

}  // namespace slot_reserver
