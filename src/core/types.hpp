/**
 * @file types.hpp
 * @brief Fundamental types used throughout Conductor.
 *
 * Defines TaskId, WorkerId, Priority, TaskStatus and the capability set
 * vocabulary shared by every engine component.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace conductor {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using WorkerId = std::string;
using Capability = std::string;
using CapabilitySet = std::set<Capability>;
using Timestamp = std::chrono::system_clock::time_point;

// ─────────────────────────────────────────────
// Priority
// ─────────────────────────────────────────────

enum class Priority : uint8_t {
    Low,
    Normal,
    High,
    Critical
};

inline constexpr size_t kPriorityCount = 4;

/// Dispatch order, highest first.
inline constexpr std::array<Priority, kPriorityCount> kPrioritiesHighestFirst{
    Priority::Critical, Priority::High, Priority::Normal, Priority::Low};

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low:      return "low";
        case Priority::Normal:   return "normal";
        case Priority::High:     return "high";
        case Priority::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Priority> parse_priority(std::string_view text) noexcept {
    if (text == "low")      return Priority::Low;
    if (text == "normal")   return Priority::Normal;
    if (text == "high")     return Priority::High;
    if (text == "critical") return Priority::Critical;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Registered, waiting for assignment
    Assigned,      ///< Handed to a worker, not yet started
    InProgress,    ///< Worker reported start
    Completed,     ///< Finished successfully (terminal)
    Failed         ///< Execution failed, may be retried
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::Assigned:   return "assigned";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed:  return "completed";
        case TaskStatus::Failed:     return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    if (text == "pending")     return TaskStatus::Pending;
    if (text == "assigned")    return TaskStatus::Assigned;
    if (text == "in_progress") return TaskStatus::InProgress;
    if (text == "completed")   return TaskStatus::Completed;
    if (text == "failed")      return TaskStatus::Failed;
    return std::nullopt;
}

/// True for the states in which a task holds a worker.
[[nodiscard]] constexpr bool holds_worker(TaskStatus status) noexcept {
    return status == TaskStatus::Assigned || status == TaskStatus::InProgress;
}

}  // namespace conductor
