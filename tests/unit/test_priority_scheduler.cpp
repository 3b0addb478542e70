/**
 * @file test_priority_scheduler.cpp
 * @brief Unit tests for PriorityScheduler ordering.
 */

#include "scheduler/priority_scheduler.hpp"

#include <gtest/gtest.h>

using namespace conductor;

using Ids = std::vector<TaskId>;

class PrioritySchedulerTest : public ::testing::Test {
protected:
    PriorityScheduler scheduler_;

    void add(const TaskId& id, Priority p) {
        ASSERT_TRUE(scheduler_.add_task(id, p).has_value());
    }

    /// Repeatedly take next_task and remove it.
    Ids drain() {
        Ids out;
        while (auto next = scheduler_.next_task()) {
            out.push_back(*next);
            scheduler_.remove_task(*next);
        }
        return out;
    }
};

TEST_F(PrioritySchedulerTest, EmptySchedulerHasNoNext) {
    EXPECT_FALSE(scheduler_.next_task().has_value());
    EXPECT_TRUE(scheduler_.empty());
}

TEST_F(PrioritySchedulerTest, HighestPriorityFirstThenFifo) {
    add("L1", Priority::Low);
    add("C1", Priority::Critical);
    add("N1", Priority::Normal);
    add("H1", Priority::High);

    EXPECT_EQ(drain(), (Ids{"C1", "H1", "N1", "L1"}));
}

TEST_F(PrioritySchedulerTest, FifoWithinBucket) {
    add("n1", Priority::Normal);
    add("n2", Priority::Normal);
    add("n3", Priority::Normal);
    EXPECT_EQ(*scheduler_.next_task(), "n1");
    EXPECT_EQ(scheduler_.ordered(), (Ids{"n1", "n2", "n3"}));
}

TEST_F(PrioritySchedulerTest, NextTaskDoesNotRemove) {
    add("a", Priority::High);
    EXPECT_EQ(*scheduler_.next_task(), "a");
    EXPECT_EQ(*scheduler_.next_task(), "a");
    EXPECT_EQ(scheduler_.size(), 1u);
}

TEST_F(PrioritySchedulerTest, DuplicateRejected) {
    add("a", Priority::Low);
    auto again = scheduler_.add_task("a", Priority::Critical);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::DuplicateTask);
    EXPECT_EQ(scheduler_.priority_of("a"), Priority::Low);
}

TEST_F(PrioritySchedulerTest, RemoveAbsentIsNoOp) {
    add("a", Priority::Normal);
    scheduler_.remove_task("ghost");
    EXPECT_EQ(scheduler_.size(), 1u);
}

TEST_F(PrioritySchedulerTest, PromotedTaskComesFirst) {
    add("N1", Priority::Normal);
    add("N2", Priority::Normal);

    EXPECT_TRUE(scheduler_.update_task_priority("N1", Priority::High));
    EXPECT_EQ(*scheduler_.next_task(), "N1");
    EXPECT_EQ(scheduler_.priority_of("N1"), Priority::High);
}

TEST_F(PrioritySchedulerTest, ReprioritizedTaskGoesToTail) {
    add("h1", Priority::High);
    add("n1", Priority::Normal);
    add("h2", Priority::High);

    ASSERT_TRUE(scheduler_.update_task_priority("h1", Priority::Normal));
    ASSERT_TRUE(scheduler_.update_task_priority("h1", Priority::High));
    EXPECT_EQ(scheduler_.ordered(), (Ids{"h2", "h1", "n1"}));
}

TEST_F(PrioritySchedulerTest, SamePriorityKeepsPosition) {
    add("a", Priority::Normal);
    add("b", Priority::Normal);
    EXPECT_TRUE(scheduler_.update_task_priority("a", Priority::Normal));
    EXPECT_EQ(scheduler_.ordered(), (Ids{"a", "b"}));
}

TEST_F(PrioritySchedulerTest, UpdateAbsentReturnsFalse) {
    EXPECT_FALSE(scheduler_.update_task_priority("ghost", Priority::High));
    EXPECT_FALSE(scheduler_.contains("ghost"));
}

TEST_F(PrioritySchedulerTest, Stats) {
    add("a", Priority::Low);
    add("b", Priority::Low);
    add("c", Priority::Critical);

    auto s = scheduler_.stats();
    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(s.depth(Priority::Low), 2u);
    EXPECT_EQ(s.depth(Priority::Critical), 1u);
    EXPECT_EQ(s.depth(Priority::Normal), 0u);
}
