/**
 * @file task_state_machine.cpp
 * @brief TaskStateMachine implementation.
 */

#include "lifecycle/task_state_machine.hpp"

namespace conductor {

TaskStateMachine::TaskStateMachine(IEventNotifier& notifier, const IClock& clock, Logger* logger)
    : notifier_(notifier), clock_(clock), logger_(logger) {}

// ─────────────────────────────────────────────
// Transition Table
// ─────────────────────────────────────────────

bool TaskStateMachine::can_transition(TaskStatus from, TaskStatus to) noexcept {
    switch (from) {
        case TaskStatus::Pending:
            return to == TaskStatus::Assigned;
        case TaskStatus::Assigned:
            return to == TaskStatus::InProgress || to == TaskStatus::Failed;
        case TaskStatus::InProgress:
            return to == TaskStatus::Completed || to == TaskStatus::Failed;
        case TaskStatus::Completed:
            return false;
        case TaskStatus::Failed:
            return to == TaskStatus::Pending;
    }
    return false;
}

std::vector<TaskStatus> TaskStateMachine::valid_transitions(TaskStatus from) {
    static constexpr TaskStatus kAll[] = {
        TaskStatus::Pending, TaskStatus::Assigned, TaskStatus::InProgress,
        TaskStatus::Completed, TaskStatus::Failed};

    std::vector<TaskStatus> targets;
    for (auto to : kAll) {
        if (can_transition(from, to)) targets.push_back(to);
    }
    return targets;
}

bool TaskStateMachine::is_terminal(TaskStatus state) noexcept {
    return valid_transitions(state).empty();
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

Status TaskStateMachine::add_task(const TaskId& id) {
    if (records_.contains(id)) {
        return Error{ErrorCode::DuplicateTask, "Task already tracked: " + id};
    }

    Record record;
    record.history.push_back({TaskStatus::Pending, clock_.now()});
    records_.emplace(id, std::move(record));
    return {};
}

bool TaskStateMachine::remove_task(const TaskId& id) {
    return records_.erase(id) > 0;
}

bool TaskStateMachine::contains(const TaskId& id) const {
    return records_.contains(id);
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

Status TaskStateMachine::transition(const TaskId& id, TaskStatus target) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }

    auto& record = it->second;
    const TaskStatus previous = record.state;

    if (!can_transition(previous, target)) {
        return Error{ErrorCode::InvalidTransition,
                     "Invalid transition for task " + id + " from "
                     + std::string{to_string(previous)} + " to "
                     + std::string{to_string(target)}};
    }

    record.state = target;
    record.history.push_back({target, clock_.now()});

    if (logger_) {
        logger_->info("Task " + id + " transitioned from " + std::string{to_string(previous)}
                      + " to " + std::string{to_string(target)});
    }

    safe_publish(notifier_, logger_, events::kTaskStateChanged, {
        {"taskId", id},
        {"oldState", std::string{to_string(previous)}},
        {"newState", std::string{to_string(target)}},
    });

    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<TaskStatus> TaskStateMachine::get_state(const TaskId& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }
    return it->second.state;
}

Result<std::vector<HistoryEntry>> TaskStateMachine::get_history(const TaskId& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }
    return it->second.history;
}

}  // namespace conductor
