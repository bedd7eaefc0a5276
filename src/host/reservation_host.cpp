/**
 * @file reservation_host.cpp
 * @brief ReservationHost implementation.
 * @author Dimitris Kafetzis
 */

#include "host/reservation_host.hpp"

#include "core/time_format.hpp"

#include <algorithm>
#include <mutex>

namespace slot_reserver {

ReservationHost::ReservationHost(Logger& logger, MetricsCollector& metrics,
                                 Millis min_poll_advance)
    : logger_(logger), metrics_(metrics), min_poll_advance_(min_poll_advance) {}

void ReservationHost::attach(const NodeId& id,
                             std::shared_ptr<const IReservationPolicy> policy) {
    std::string name{policy->name()};
    {
        std::unique_lock lock(mutex_);
        auto next = std::make_shared<PolicySet>();
        if (auto it = nodes_.find(id); it != nodes_.end()) {
            *next = *it->second;
        }
        next->policies.push_back(std::move(policy));
        nodes_[id] = std::move(next);
    }
    logger_.info("Attached " + name + " reservation policy to node " + id);
}

Result<void, MalformedRuleError> ReservationHost::load_cron_schedule(const NodeId& id,
                                                                     std::string format) {
    // Parse outside the lock; only a fully built policy is ever published.
    auto parsed = CronReservationPolicy::from_format(std::move(format));
    if (!parsed) {
        const auto& err = parsed.error();
        logger_.warn("Rejected reservation schedule for node " + id + ": " + err.what());
        metrics_.record_schedule_rejected(id, err.line, err.message);
        return err;
    }

    auto cron = std::make_shared<const CronReservationPolicy>(std::move(*parsed));
    const size_t entries = cron->schedule().size();
    {
        std::unique_lock lock(mutex_);
        auto next = std::make_shared<PolicySet>();
        if (auto it = nodes_.find(id); it != nodes_.end()) {
            *next = *it->second;
        }
        auto& policies = next->policies;
        auto old = std::find(policies.begin(), policies.end(), next->cron);
        if (next->cron && old != policies.end()) {
            *old = cron;
        } else {
            policies.push_back(cron);
        }
        next->cron = std::move(cron);
        nodes_[id] = std::move(next);
    }

    logger_.info("Loaded reservation schedule for node " + id + ": "
                 + std::to_string(entries) + " entries");
    metrics_.record_schedule_loaded(id, entries);
    return Result<void, MalformedRuleError>{};
}

void ReservationHost::detach(const NodeId& id) {
    bool removed = false;
    {
        std::unique_lock lock(mutex_);
        removed = nodes_.erase(id) > 0;
    }
    if (removed) {
        logger_.info("Detached all reservation policies from node " + id);
    }
}

size_t ReservationHost::policy_count(const NodeId& id) const {
    auto set = snapshot(id);
    return set ? set->policies.size() : 0;
}

std::vector<NodeId> ReservationHost::nodes() const {
    std::shared_lock lock(mutex_);
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, set] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<std::string> ReservationHost::cron_format(const NodeId& id) const {
    auto set = snapshot(id);
    if (!set || !set->cron) return std::nullopt;
    return set->cron->format();
}

ReservationHost::PolicySetPtr ReservationHost::snapshot(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second;
}

Result<NodeReservation, InvalidPatternError> ReservationHost::evaluate(
    const NodeId& id, const INode& node, EpochMillis now) const {
    NodeReservation result;
    result.node_id = id;
    result.executors = node.executor_count();

    if (auto set = snapshot(id)) {
        for (const auto& policy : set->policies) {
            auto size = policy->size_of_reservation(node, now);
            if (!size) {
                logger_.error("Reservation query failed for node " + id + ": "
                              + size.error().message);
                metrics_.record_query_error(id, now, size.error().message);
                return size.error();
            }
            auto next = policy->time_of_next_change(node, now);
            if (!next) {
                logger_.error("Reservation query failed for node " + id + ": "
                              + next.error().message);
                metrics_.record_query_error(id, now, next.error().message);
                return next.error();
            }
            result.reserved = saturating_add(result.reserved, *size);
            result.next_change = std::min(result.next_change, *next);
        }
    }

    result.available = result.executors > result.reserved
        ? result.executors - result.reserved : 0;

    if (result.next_change != kNever) {
        result.next_poll = std::max(result.next_change,
                                    saturating_add(now, min_poll_advance_));
    }

    if (result.over_reserved()) {
        logger_.debug("Node " + id + " is over-reserved: "
                      + std::to_string(result.reserved) + " of "
                      + std::to_string(result.executors) + " executors");
    }
    metrics_.record_reservation(result, now);
    return result;
}

}  // namespace slot_reserver
