/**
 * @file reservation_host.hpp
 * @brief Per-node registry of reservation policies, as seen by a scheduler.
 * @author Dimitris Kafetzis
 *
 * The host side of the evaluator: it owns the published policies for every
 * node, combines them, and applies the two caller-side policies the
 * evaluator deliberately leaves out:
 *   - capping: available = executors - reserved, floored at zero
 *   - minimum advance: never ask to be polled again sooner than
 *     now + min_poll_advance
 */

#pragma once

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "reservation/node.hpp"
#include "reservation/policy.hpp"
#include "telemetry/metrics_collector.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace slot_reserver {

/**
 * @brief Combined answer for one node at one instant.
 */
struct NodeReservation {
    NodeId node_id;
    SlotCount executors{0};
    SlotCount reserved{0};       ///< Sum over policies, not capped
    SlotCount available{0};      ///< executors - reserved, floored at 0
    EpochMillis next_change{kNever};
    EpochMillis next_poll{kNever};

    [[nodiscard]] bool over_reserved() const noexcept { return reserved > executors; }
};

/**
 * @brief Thread-safe registry of reservation policies per node.
 *
 * Policy sets are immutable snapshots swapped under a shared_mutex: readers
 * copy the shared_ptr and evaluate without holding the lock.
 */
class ReservationHost {
public:
    ReservationHost(Logger& logger, MetricsCollector& metrics,
                    Millis min_poll_advance = Millis{60000});

    /// Register an additional policy for a node.
    void attach(const NodeId& id, std::shared_ptr<const IReservationPolicy> policy);

    /**
     * @brief Parse rule text and make it the node's cron policy.
     *
     * On failure nothing is replaced; the previous cron policy (if any)
     * remains in effect.
     */
    Result<void, MalformedRuleError> load_cron_schedule(const NodeId& id, std::string format);

    /// Remove every policy registered for a node.
    void detach(const NodeId& id);

    [[nodiscard]] size_t policy_count(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeId> nodes() const;

    /// Source text of the node's cron policy, if one is loaded.
    [[nodiscard]] std::optional<std::string> cron_format(const NodeId& id) const;

    /**
     * @brief Combine every policy of `id` for `node` at `now`.
     */
    Result<NodeReservation, InvalidPatternError> evaluate(const NodeId& id,
                                                          const INode& node,
                                                          EpochMillis now) const;

    [[nodiscard]] Millis min_poll_advance() const noexcept { return min_poll_advance_; }

private:
    struct PolicySet {
        std::vector<std::shared_ptr<const IReservationPolicy>> policies;
        std::shared_ptr<const CronReservationPolicy> cron;
    };
    using PolicySetPtr = std::shared_ptr<const PolicySet>;

    [[nodiscard]] PolicySetPtr snapshot(const NodeId& id) const;

    Logger& logger_;
    MetricsCollector& metrics_;
    Millis min_poll_advance_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<NodeId, PolicySetPtr> nodes_;
};

}  // namespace slot_reserver
