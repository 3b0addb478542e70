/**
 * @file test_generator.cpp
 * @brief Tests for the synthetic workload generators.
 */

#include "support/recording_notifier.hpp"
#include "workload/dependency_manager.hpp"
#include "workload/generator.hpp"

#include <gtest/gtest.h>
#include <unordered_set>

using namespace conductor;
using conductor::testing::RecordingNotifier;

namespace {

/// Every dependency must refer to a task listed earlier.
void expect_dependencies_first(const std::vector<Task>& tasks) {
    std::unordered_set<TaskId> seen;
    for (const auto& task : tasks) {
        for (const auto& dep : task.depends_on) {
            EXPECT_TRUE(seen.contains(dep)) << task.id << " depends on later " << dep;
        }
        seen.insert(task.id);
    }
}

void expect_acyclic(const std::vector<Task>& tasks) {
    RecordingNotifier notifier;
    TaskDependencyManager deps(notifier);
    for (const auto& task : tasks) {
        ASSERT_TRUE(deps.add_task(task).has_value());
    }
    EXPECT_TRUE(deps.detect_cycles().empty());
    EXPECT_TRUE(deps.topological_order().has_value());
}

}  // namespace

TEST(GeneratorTest, LinearChain) {
    auto tasks = WorkloadGenerator::linear_chain(5, {"cpu"});
    ASSERT_EQ(tasks.size(), 5u);
    EXPECT_TRUE(tasks[0].depends_on.empty());
    EXPECT_EQ(tasks[4].depends_on, std::vector<TaskId>{"chain_3"});
    EXPECT_TRUE(tasks[2].required_capabilities.contains("cpu"));
    expect_dependencies_first(tasks);
    expect_acyclic(tasks);
}

TEST(GeneratorTest, FanOutFanIn) {
    auto tasks = WorkloadGenerator::fan_out_fan_in(4);
    ASSERT_EQ(tasks.size(), 6u);
    EXPECT_EQ(tasks.front().id, "fan_src");
    EXPECT_EQ(tasks.back().id, "fan_sink");
    EXPECT_EQ(tasks.back().depends_on.size(), 4u);
    expect_dependencies_first(tasks);
    expect_acyclic(tasks);
}

TEST(GeneratorTest, Diamond) {
    auto tasks = WorkloadGenerator::diamond(3, 2);
    // hub + width branches + merge per level
    ASSERT_EQ(tasks.size(), 3u * (2 + 2));
    expect_dependencies_first(tasks);
    expect_acyclic(tasks);
}

TEST(GeneratorTest, RandomDagIsAcyclicAndDeterministic) {
    std::mt19937 rng_a(42);
    std::mt19937 rng_b(42);
    auto a = WorkloadGenerator::random_dag(40, 0.2f, {"cpu", "gpu"}, rng_a);
    auto b = WorkloadGenerator::random_dag(40, 0.2f, {"cpu", "gpu"}, rng_b);

    ASSERT_EQ(a.size(), 40u);
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].depends_on, b[i].depends_on);
        EXPECT_EQ(a[i].priority, b[i].priority);
        EXPECT_EQ(a[i].required_capabilities.size(), 1u);
    }
    expect_dependencies_first(a);
    expect_acyclic(a);
}

TEST(GeneratorTest, UniformWorkers) {
    auto workers = WorkloadGenerator::uniform_workers(3, {"cpu", "io"});
    ASSERT_EQ(workers.size(), 3u);
    EXPECT_EQ(workers[2].id, "worker-2");
    EXPECT_EQ(workers[0].capabilities, (CapabilitySet{"cpu", "io"}));
    EXPECT_TRUE(workers[0].available);
}
