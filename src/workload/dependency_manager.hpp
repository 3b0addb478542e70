/**
 * @file dependency_manager.hpp
 * @brief Hard/soft dependency graph and readiness frontier.
 *
 * Tracks dependsOn (hard, blocking) and prefers (soft, advisory) edges and
 * computes which tasks may run. Cycles are never rejected on insertion;
 * they are reported on request by has_circular_dependency() and
 * detect_cycles().
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/model.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "events/notifier.hpp"

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace conductor {

class TaskDependencyManager {
public:
    explicit TaskDependencyManager(IEventNotifier& notifier,
                                   RemovedDependencyPolicy policy = RemovedDependencyPolicy::Block,
                                   Logger* logger = nullptr);

    // ── Construction ──────────────────────────
    Status add_task(const Task& task);

    /**
     * @brief Stop tracking a task. Dependents keep their edge to it.
     *
     * Under RemovedDependencyPolicy::Satisfy, dependents whose last
     * outstanding dependency was the removed task become ready and a
     * task.ready event is published for each. Returns those ids.
     */
    Result<std::vector<TaskId>> remove_task(const TaskId& id);

    // ── Edge Editing ──────────────────────────

    /**
     * @brief Add the hard edge id -> depends_on. Adding an existing edge
     *        is a no-op. Cycles are not checked here.
     */
    Status add_dependency(const TaskId& id, const TaskId& depends_on);

    /**
     * @brief Drop the hard edge id -> depends_on. Publishes task.ready and
     *        returns {id} when that edge was the last thing blocking it.
     */
    Result<std::vector<TaskId>> remove_dependency(const TaskId& id, const TaskId& depends_on);

    // ── Completion ────────────────────────────

    /**
     * @brief Mark a task complete and publish task.ready for every
     *        dependent it unblocks. Idempotent. Returns the unblocked ids.
     */
    Result<std::vector<TaskId>> mark_task_complete(const TaskId& id);

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::vector<TaskId> get_ready_tasks() const;
    [[nodiscard]] bool is_ready(const TaskId& id) const;
    [[nodiscard]] bool is_complete(const TaskId& id) const;
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

    [[nodiscard]] Result<std::vector<TaskId>> get_dependencies(const TaskId& id) const;
    [[nodiscard]] Result<std::vector<TaskId>> get_soft_dependencies(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> get_dependents(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> get_soft_dependents(const TaskId& id) const;

    /// Transitive hard dependencies of id, nearest first.
    [[nodiscard]] Result<std::vector<TaskId>> get_dependency_chain(const TaskId& id) const;

    // ── Cycles & Ordering ─────────────────────
    [[nodiscard]] Result<bool> has_circular_dependency(const TaskId& id) const;
    [[nodiscard]] bool would_create_cycle(const TaskId& id,
                                          const std::vector<TaskId>& depends_on) const;
    [[nodiscard]] std::vector<std::vector<TaskId>> detect_cycles() const;

    /// Dependencies before dependents; ties keep insertion order.
    [[nodiscard]] Result<std::vector<TaskId>> topological_order() const;

    [[nodiscard]] RemovedDependencyPolicy removed_dependency_policy() const noexcept {
        return policy_;
    }

private:
    struct Node {
        std::vector<TaskId> depends_on;
        std::vector<TaskId> prefers;
    };

    [[nodiscard]] bool is_satisfied(const TaskId& dependency) const;
    [[nodiscard]] bool node_ready(const TaskId& id, const Node& node) const;
    [[nodiscard]] const std::vector<TaskId>& hard_edges(const TaskId& id) const;
    void publish_ready(const std::vector<TaskId>& ids);

    IEventNotifier& notifier_;
    RemovedDependencyPolicy policy_;
    Logger* logger_;

    std::unordered_map<TaskId, Node> nodes_;
    std::vector<TaskId> order_;                                          // insertion order
    std::unordered_map<TaskId, std::vector<TaskId>> dependents_;        // reverse hard edges
    std::unordered_map<TaskId, std::vector<TaskId>> soft_dependents_;   // reverse soft edges
    std::unordered_set<TaskId> completed_;
    std::unordered_set<TaskId> removed_;
};

}  // namespace conductor
