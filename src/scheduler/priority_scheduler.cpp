/**
 * @file priority_scheduler.cpp
 * @brief PriorityScheduler implementation.
 */

#include "scheduler/priority_scheduler.hpp"

namespace conductor {

Status PriorityScheduler::add_task(const TaskId& id, Priority priority) {
    if (index_.contains(id)) {
        return Error{ErrorCode::DuplicateTask, "Task already queued: " + id};
    }

    auto& b = bucket(priority);
    auto pos = b.insert(b.end(), id);
    index_.emplace(id, Slot{priority, pos});

    if (logger_) {
        logger_->debug("Queued task " + id + " at priority " + std::string{to_string(priority)}
                       + " (depth " + std::to_string(b.size()) + ")");
    }
    return {};
}

std::optional<TaskId> PriorityScheduler::next_task() const {
    for (auto p : kPrioritiesHighestFirst) {
        const auto& b = bucket(p);
        if (!b.empty()) return b.front();
    }
    return std::nullopt;
}

void PriorityScheduler::remove_task(const TaskId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return;

    bucket(it->second.priority).erase(it->second.position);
    index_.erase(it);
}

bool PriorityScheduler::update_task_priority(const TaskId& id, Priority new_priority) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    auto& slot = it->second;
    if (slot.priority == new_priority) return true;

    bucket(slot.priority).erase(slot.position);
    auto& target = bucket(new_priority);

    if (logger_) {
        logger_->debug("Task " + id + " moved from " + std::string{to_string(slot.priority)}
                       + " to " + std::string{to_string(new_priority)});
    }

    slot.position = target.insert(target.end(), id);
    slot.priority = new_priority;
    return true;
}

std::optional<Priority> PriorityScheduler::priority_of(const TaskId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second.priority;
}

std::vector<TaskId> PriorityScheduler::ordered() const {
    std::vector<TaskId> result;
    result.reserve(index_.size());
    for (auto p : kPrioritiesHighestFirst) {
        const auto& b = bucket(p);
        result.insert(result.end(), b.begin(), b.end());
    }
    return result;
}

SchedulerStats PriorityScheduler::stats() const {
    SchedulerStats s;
    s.total = index_.size();
    for (size_t i = 0; i < kPriorityCount; ++i) {
        s.per_priority[i] = buckets_[i].size();
    }
    return s;
}

}  // namespace conductor
