/**
 * @file model.hpp
 * @brief Task and Worker records exchanged with the host.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace conductor {

/**
 * @brief One audit entry of a task's lifecycle.
 */
struct HistoryEntry {
    TaskStatus state;
    Timestamp timestamp;

    bool operator==(const HistoryEntry&) const = default;
};

/**
 * @brief A unit of work to be assigned to a worker.
 *
 * The host fills the descriptive fields and the dependency lists before
 * calling AddTask; status, assigned_to, created_at, history and
 * retry_count are owned by the engine and ignored on input.
 */
struct Task {
    TaskId id;
    std::string title;
    std::string description;
    Priority priority = Priority::Normal;
    CapabilitySet required_capabilities;
    std::vector<TaskId> depends_on;        ///< Hard dependencies, order preserved
    std::vector<TaskId> prefers;           ///< Soft dependencies, never blocking
    std::vector<TaskId> conflicts_with;    ///< Advisory only

    TaskStatus status = TaskStatus::Pending;
    std::optional<WorkerId> assigned_to;
    Timestamp created_at{};
    std::vector<HistoryEntry> history;
    uint32_t retry_count = 0;
};

/**
 * @brief An external execution unit. Read-only to the engine.
 */
struct Worker {
    WorkerId id;
    CapabilitySet capabilities;
    bool available = true;

    bool operator==(const Worker&) const = default;
};

/**
 * @brief Outcome of a successful assignment.
 */
struct Assignment {
    TaskId task_id;
    WorkerId worker_id;
    double score = 0.0;
};

}  // namespace conductor
