/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for StaticWorkerPool.
 */

#include "workers/worker_pool.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace conductor;

TEST(WorkerPoolTest, IdleWorkersInRegistrationOrder) {
    StaticWorkerPool pool;
    pool.add_worker({.id = "b", .capabilities = {"x"}});
    pool.add_worker({.id = "a", .capabilities = {"y"}});

    auto idle = pool.idle_workers();
    ASSERT_EQ(idle.size(), 2u);
    EXPECT_EQ(idle[0].id, "b");
    EXPECT_EQ(idle[1].id, "a");
}

TEST(WorkerPoolTest, UnavailableWorkersAreNotIdle) {
    StaticWorkerPool pool;
    pool.add_worker({.id = "w1"});
    pool.add_worker({.id = "w2", .available = false});

    auto idle = pool.idle_workers();
    ASSERT_EQ(idle.size(), 1u);
    EXPECT_EQ(idle[0].id, "w1");
    EXPECT_EQ(pool.workers().size(), 2u);
}

TEST(WorkerPoolTest, SetAvailability) {
    StaticWorkerPool pool;
    pool.add_worker({.id = "w1"});

    EXPECT_TRUE(pool.set_available("w1", false));
    EXPECT_TRUE(pool.idle_workers().empty());
    EXPECT_TRUE(pool.set_available("w1", true));
    EXPECT_EQ(pool.idle_workers().size(), 1u);
    EXPECT_FALSE(pool.set_available("ghost", true));
}

TEST(WorkerPoolTest, ReplaceKeepsPosition) {
    StaticWorkerPool pool;
    pool.add_worker({.id = "w1", .capabilities = {"old"}});
    pool.add_worker({.id = "w2"});
    pool.add_worker({.id = "w1", .capabilities = {"new"}});

    auto all = pool.workers();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, "w1");
    EXPECT_TRUE(all[0].capabilities.contains("new"));
}

TEST(WorkerPoolTest, RemoveFindAndClear) {
    StaticWorkerPool pool;
    pool.add_worker({.id = "w1"});
    pool.add_worker({.id = "w2"});

    EXPECT_TRUE(pool.find("w2").has_value());
    EXPECT_TRUE(pool.remove_worker("w2"));
    EXPECT_FALSE(pool.remove_worker("w2"));
    EXPECT_FALSE(pool.find("w2").has_value());
    EXPECT_EQ(pool.size(), 1u);

    pool.clear();
    EXPECT_EQ(pool.size(), 0u);
}

TEST(WorkerPoolTest, ConcurrentAvailabilityFlips) {
    StaticWorkerPool pool;
    for (int i = 0; i < 8; ++i) {
        pool.add_worker({.id = "w" + std::to_string(i)});
    }

    std::thread writer([&] {
        for (int round = 0; round < 1000; ++round) {
            pool.set_available("w" + std::to_string(round % 8), round % 2 == 0);
        }
    });
    for (int round = 0; round < 1000; ++round) {
        EXPECT_LE(pool.idle_workers().size(), 8u);
    }
    writer.join();
    EXPECT_EQ(pool.size(), 8u);
}
