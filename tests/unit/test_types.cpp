/**
 * @file test_types.cpp
 * @brief Unit tests for core vocabulary types.
 */

#include "core/model.hpp"
#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace conductor;

TEST(TypesTest, PriorityToString) {
    EXPECT_EQ(to_string(Priority::Low), "low");
    EXPECT_EQ(to_string(Priority::Normal), "normal");
    EXPECT_EQ(to_string(Priority::High), "high");
    EXPECT_EQ(to_string(Priority::Critical), "critical");
}

TEST(TypesTest, ParsePriority) {
    EXPECT_EQ(parse_priority("critical"), Priority::Critical);
    EXPECT_EQ(parse_priority("low"), Priority::Low);
    EXPECT_FALSE(parse_priority("urgent").has_value());
    EXPECT_FALSE(parse_priority("High").has_value());
}

TEST(TypesTest, PriorityDispatchOrder) {
    EXPECT_EQ(kPrioritiesHighestFirst.front(), Priority::Critical);
    EXPECT_EQ(kPrioritiesHighestFirst.back(), Priority::Low);
}

TEST(TypesTest, TaskStatusToString) {
    EXPECT_EQ(to_string(TaskStatus::Pending), "pending");
    EXPECT_EQ(to_string(TaskStatus::Assigned), "assigned");
    EXPECT_EQ(to_string(TaskStatus::InProgress), "in_progress");
    EXPECT_EQ(to_string(TaskStatus::Completed), "completed");
    EXPECT_EQ(to_string(TaskStatus::Failed), "failed");
}

TEST(TypesTest, ParseTaskStatus) {
    for (auto s : {TaskStatus::Pending, TaskStatus::Assigned, TaskStatus::InProgress,
                   TaskStatus::Completed, TaskStatus::Failed}) {
        EXPECT_EQ(parse_task_status(to_string(s)), s);
    }
    EXPECT_FALSE(parse_task_status("cancelled").has_value());
}

TEST(TypesTest, HoldsWorker) {
    EXPECT_FALSE(holds_worker(TaskStatus::Pending));
    EXPECT_TRUE(holds_worker(TaskStatus::Assigned));
    EXPECT_TRUE(holds_worker(TaskStatus::InProgress));
    EXPECT_FALSE(holds_worker(TaskStatus::Completed));
    EXPECT_FALSE(holds_worker(TaskStatus::Failed));
}

TEST(TypesTest, TaskDefaults) {
    Task task{.id = "t1", .title = "First"};
    EXPECT_EQ(task.priority, Priority::Normal);
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_FALSE(task.assigned_to.has_value());
    EXPECT_EQ(task.retry_count, 0u);
    EXPECT_TRUE(task.history.empty());
}

TEST(TypesTest, WorkerDefaultsAvailable) {
    Worker w{.id = "w1", .capabilities = {"python"}};
    EXPECT_TRUE(w.available);
    EXPECT_TRUE(w.capabilities.contains("python"));
}
