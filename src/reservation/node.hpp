/**
 * @file node.hpp
 * @brief Minimal read-only view of a compute node.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <atomic>

namespace slot_reserver {

/**
 * @brief The one capability the evaluator needs from a node: how many
 *        executor slots it has right now.
 *
 * The evaluator never owns a node; it only reads it during a query.
 */
class INode {
public:
    virtual ~INode() = default;

    [[nodiscard]] virtual SlotCount executor_count() const noexcept = 0;
};

/**
 * @brief A node whose executor count is set by the host (config, CLI, tests).
 *
 * The count may change while other threads query it.
 */
class StaticNode : public INode {
public:
    explicit StaticNode(SlotCount executors) noexcept : executors_(executors) {}

    [[nodiscard]] SlotCount executor_count() const noexcept override {
        return executors_.load(std::memory_order_relaxed);
    }

    void set_executor_count(SlotCount executors) noexcept {
        executors_.store(executors, std::memory_order_relaxed);
    }

private:
    std::atomic<SlotCount> executors_;
};

}  // namespace slot_reserver
