/**
 * @file task_orchestrator.hpp
 * @brief Top-level TaskOrchestrator facade: ties the engine components to
 *        the host's Worker Pool, Event Notifier and Clock.
 *
 * Owns the task table. The four sub-components share nothing but task ids:
 *   TaskStateMachine       lifecycle state and history
 *   TaskDependencyManager  hard/soft edges and readiness
 *   PriorityScheduler      dispatch order
 *   CapabilityMatcher      worker fit
 *
 * Every public call runs to completion before its events are delivered,
 * in published order, to the host notifier. Listeners may call back into
 * the orchestrator; their events are appended to the same delivery.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/model.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "events/notifier.hpp"
#include "lifecycle/task_state_machine.hpp"
#include "scheduler/capability_matcher.hpp"
#include "scheduler/priority_scheduler.hpp"
#include "workers/worker_pool.hpp"
#include "workload/dependency_manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace conductor {

class TaskOrchestrator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;     ///< nullptr discards log output
        LogLevel log_level = LogLevel::Info;
    };

    TaskOrchestrator(Options opts,
                     IWorkerPool& workers,
                     IEventNotifier& notifier,
                     const IClock& clock);

    // Non-copyable, non-movable
    TaskOrchestrator(const TaskOrchestrator&) = delete;
    TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

    // ── Task Table ───────────────────────────

    /**
     * @brief Register a task at state pending.
     *
     * Engine-owned fields of @p task (status, assigned_to, created_at,
     * history, retry_count) are reset. Publishes task.added, followed by
     * task.ready when the task has no outstanding dependency.
     */
    Status add_task(Task task);

    /**
     * @brief Forget a task everywhere. Its id is retired for good.
     *
     * Dependents are not touched; whether they stay blocked follows
     * OrchestratorConfig::removed_dependency_policy.
     */
    Status remove_task(const TaskId& id);

    /// Failure (when the task holds a worker) followed by removal.
    Status cancel_task(const TaskId& id, const std::string& reason);

    [[nodiscard]] std::vector<Task> get_tasks() const;
    [[nodiscard]] Result<Task> get_task(const TaskId& id) const;
    Status update_task_priority(const TaskId& id, Priority priority);

    /// Tasks currently held by @p worker_id (assigned or in progress).
    [[nodiscard]] std::vector<Task> tasks_for_worker(const WorkerId& worker_id) const;

    /// Remove every completed task. Returns how many were removed.
    size_t clear_completed();

    // ── Dependencies ─────────────────────────
    [[nodiscard]] std::vector<TaskId> get_ready_tasks() const;
    [[nodiscard]] Result<std::vector<TaskId>> get_dependencies(const TaskId& id) const;
    [[nodiscard]] Result<std::vector<TaskId>> get_dependents(const TaskId& id) const;

    /**
     * @brief Add the hard edge id -> depends_on to a pending task.
     *
     * Both ids must be tracked. With reject_cycles_on_add an edge that
     * closes a cycle fails with CircularDependency. Publishes
     * task.dependencyAdded; an existing edge is a no-op.
     */
    Status add_dependency(const TaskId& id, const TaskId& depends_on);

    /**
     * @brief Drop the hard edge id -> depends_on. Publishes
     *        task.dependencyRemoved, then task.ready if the task is no
     *        longer blocked. A missing edge is a no-op.
     */
    Status remove_dependency(const TaskId& id, const TaskId& depends_on);

    /**
     * @brief Active (assigned or in progress) tasks that @p id declares a
     *        conflict with, or that declare one with @p id.
     *
     * Advisory only: assignment does not consult it.
     */
    [[nodiscard]] Result<std::vector<TaskId>> conflicts_of(const TaskId& id) const;

    [[nodiscard]] Result<bool> has_circular_dependency(const TaskId& id) const;
    [[nodiscard]] std::vector<std::vector<TaskId>> detect_cycles() const;

    // ── Matching ─────────────────────────────
    [[nodiscard]] double match_score(const CapabilitySet& required,
                                     const CapabilitySet& available) const;
    [[nodiscard]] std::optional<Worker> find_best_match(const CapabilitySet& required,
                                                        const std::vector<Worker>& candidates) const;

    // ── Lifecycle ────────────────────────────

    /**
     * @brief Drive a task to @p target through the matching operation.
     *
     * assigned is rejected with InvalidTransition: an assignment needs a
     * worker, see assign_next() and assign_task().
     */
    Status transition(const TaskId& id, TaskStatus target);
    [[nodiscard]] Result<TaskStatus> get_state(const TaskId& id) const;
    [[nodiscard]] Result<std::vector<HistoryEntry>> get_history(const TaskId& id) const;

    // ── Assignment ───────────────────────────

    /**
     * @brief Assign the highest-priority ready pending task to its best
     *        idle worker.
     *
     * Returns nullopt when nothing is ready, no worker is idle, or no idle
     * worker shares a capability with the chosen task. In the last case
     * the task stays pending and is considered again on the next call.
     */
    std::optional<Assignment> assign_next();

    /// assign_next() until it yields nothing.
    std::vector<Assignment> assign_all();

    /// Manual assignment of a ready pending task to a specific idle worker.
    Result<Assignment> assign_task(const TaskId& id, const WorkerId& worker_id);

    Status on_task_started(const TaskId& id);
    Status on_task_completed(const TaskId& id);
    Status on_task_failed(const TaskId& id, const std::string& reason);

    /// Supervisor hook: forces in_progress -> failed with reason "timeout".
    Status on_task_timed_out(const TaskId& id);

    /// Explicit failed -> pending.
    Status retry_task(const TaskId& id);

    // ── Accessors ────────────────────────────
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    Logger& logger() noexcept { return logger_; }
    [[nodiscard]] const TaskStateMachine& state_machine() const noexcept { return state_machine_; }
    [[nodiscard]] const TaskDependencyManager& dependency_manager() const noexcept { return dependencies_; }
    [[nodiscard]] const PriorityScheduler& scheduler() const noexcept { return scheduler_; }
    [[nodiscard]] const CapabilityMatcher& matcher() const noexcept { return matcher_; }
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }

private:
    Status validate_new_task(const Task& task) const;
    Result<Task*> find_task(const TaskId& id);
    [[nodiscard]] std::optional<TaskId> next_assignable() const;
    [[nodiscard]] std::vector<Worker> available_workers() const;
    Assignment assign(Task& task, const Worker& worker, double score);
    Status fail(Task& task, const std::string& reason, bool allow_retry);
    Status change_state(Task& task, TaskStatus target);

    Config config_;
    Logger logger_;
    IWorkerPool& workers_;
    DeferredNotifier events_;
    const IClock& clock_;

    TaskStateMachine state_machine_;
    TaskDependencyManager dependencies_;
    PriorityScheduler scheduler_;
    CapabilityMatcher matcher_;

    std::unordered_map<TaskId, Task> tasks_;
    std::vector<TaskId> task_order_;
    std::unordered_set<TaskId> retired_ids_;
};

}  // namespace conductor
