/**
 * @file priority_scheduler.hpp
 * @brief Priority buckets with strict FIFO order inside each bucket.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

namespace conductor {

struct SchedulerStats {
    size_t total = 0;
    std::array<size_t, kPriorityCount> per_priority{};   ///< Indexed by Priority value

    [[nodiscard]] size_t depth(Priority p) const noexcept {
        return per_priority[static_cast<size_t>(p)];
    }
};

/**
 * @brief Decides which queued task is handed out next.
 *
 * critical > high > normal > low; within a priority, insertion order.
 * All operations are O(1) except ordered() and next_task(), which scan at
 * most kPriorityCount buckets before the first hit.
 */
class PriorityScheduler {
public:
    explicit PriorityScheduler(Logger* logger = nullptr) : logger_(logger) {}

    Status add_task(const TaskId& id, Priority priority);

    /// Head of the highest non-empty bucket, not removed.
    [[nodiscard]] std::optional<TaskId> next_task() const;

    /// No-op when id is not queued.
    void remove_task(const TaskId& id);

    /**
     * @brief Move id to the tail of the bucket for new_priority.
     *
     * Insertion order at the old priority is not preserved. Setting the
     * current priority again leaves the position unchanged.
     * @return false when id is not queued.
     */
    bool update_task_priority(const TaskId& id, Priority new_priority);

    [[nodiscard]] bool contains(const TaskId& id) const { return index_.contains(id); }
    [[nodiscard]] std::optional<Priority> priority_of(const TaskId& id) const;
    [[nodiscard]] size_t size() const noexcept { return index_.size(); }
    [[nodiscard]] bool empty() const noexcept { return index_.empty(); }

    /// Every queued id in dispatch order.
    [[nodiscard]] std::vector<TaskId> ordered() const;
    [[nodiscard]] SchedulerStats stats() const;

private:
    using Bucket = std::list<TaskId>;

    struct Slot {
        Priority priority;
        Bucket::iterator position;
    };

    [[nodiscard]] Bucket& bucket(Priority p) { return buckets_[static_cast<size_t>(p)]; }
    [[nodiscard]] const Bucket& bucket(Priority p) const { return buckets_[static_cast<size_t>(p)]; }

    std::array<Bucket, kPriorityCount> buckets_;
    std::unordered_map<TaskId, Slot> index_;
    Logger* logger_;
};

}  // namespace conductor
