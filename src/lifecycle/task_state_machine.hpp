/**
 * @file task_state_machine.hpp
 * @brief Task lifecycle transitions with an append-only audit history.
 *
 * Legal edges:
 *
 *   pending ──► assigned ──► in_progress ──► completed
 *                  │              │
 *                  └──► failed ◄──┘
 *                         │
 *                         └──► pending   (retry)
 *
 * completed is terminal. Each accepted transition appends one history
 * entry and publishes task.stateChanged; a rejected transition has no
 * effect at all.
 */

#pragma once

#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/model.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "events/notifier.hpp"

#include <unordered_map>
#include <vector>

namespace conductor {

class TaskStateMachine {
public:
    TaskStateMachine(IEventNotifier& notifier, const IClock& clock, Logger* logger = nullptr);

    // ── Registration ──────────────────────────
    Status add_task(const TaskId& id);
    bool remove_task(const TaskId& id);
    [[nodiscard]] bool contains(const TaskId& id) const;

    // ── Transitions ───────────────────────────
    Status transition(const TaskId& id, TaskStatus target);

    // ── Queries ───────────────────────────────
    [[nodiscard]] Result<TaskStatus> get_state(const TaskId& id) const;
    [[nodiscard]] Result<std::vector<HistoryEntry>> get_history(const TaskId& id) const;
    [[nodiscard]] size_t size() const noexcept { return records_.size(); }

    // ── Transition table ──────────────────────
    [[nodiscard]] static bool can_transition(TaskStatus from, TaskStatus to) noexcept;
    [[nodiscard]] static std::vector<TaskStatus> valid_transitions(TaskStatus from);
    [[nodiscard]] static bool is_terminal(TaskStatus state) noexcept;

private:
    struct Record {
        TaskStatus state = TaskStatus::Pending;
        std::vector<HistoryEntry> history;
    };

    IEventNotifier& notifier_;
    const IClock& clock_;
    Logger* logger_;
    std::unordered_map<TaskId, Record> records_;
};

}  // namespace conductor
