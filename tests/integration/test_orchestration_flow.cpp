/**
 * @file test_orchestration_flow.cpp
 * @brief Integration tests driving whole workloads through the engine.
 */

#include "core/clock.hpp"
#include "core/config.hpp"
#include "events/notifier.hpp"
#include "orchestrator/task_orchestrator.hpp"
#include "support/recording_notifier.hpp"
#include "telemetry/event_journal.hpp"
#include "telemetry/json_sink.hpp"
#include "workers/worker_pool.hpp"
#include "workload/generator.hpp"
#include "workload/workload_file.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <unordered_map>
#include <unordered_set>

using namespace conductor;
using conductor::testing::RecordingNotifier;
using namespace std::chrono_literals;

namespace {

constexpr const char* kPipelineWorkload = R"(
    [[worker]]
    id = "cpu-1"
    capabilities = ["python", "io"]

    [[worker]]
    id = "gpu-1"
    capabilities = ["python", "cuda"]

    [[task]]
    id = "prepare"
    title = "Prepare dataset"
    priority = "high"
    requires = ["python", "io"]

    [[task]]
    id = "train"
    title = "Train model"
    priority = "critical"
    requires = ["cuda"]
    depends_on = ["prepare"]

    [[task]]
    id = "evaluate"
    title = "Evaluate model"
    requires = ["python"]
    depends_on = ["train"]

    [[task]]
    id = "export"
    title = "Export weights"
    priority = "low"
    requires = ["io"]
    depends_on = ["train"]
    prefers = ["evaluate"]

    [[task]]
    id = "publish"
    title = "Publish release"
    requires = ["io"]
    depends_on = ["evaluate", "export"]
)";

/// Host wiring used by every scenario: recorder + journal behind a fanout.
struct Harness {
    RecordingNotifier recorder;
    MemorySink* journal_lines = nullptr;
    std::unique_ptr<EventJournal> journal;
    FanoutNotifier fanout;
    StaticWorkerPool pool;
    ManualClock clock{Timestamp{} + 24h};
    std::unique_ptr<TaskOrchestrator> orchestrator;

    explicit Harness(Config config = {}) {
        auto sink = std::make_unique<MemorySink>();
        journal_lines = sink.get();
        journal = std::make_unique<EventJournal>(std::move(sink));
        fanout.add(recorder);
        fanout.add(*journal);

        orchestrator = std::make_unique<TaskOrchestrator>(
            TaskOrchestrator::Options{.config = std::move(config)},
            pool, fanout, clock);
    }

    void load(const Workload& workload) {
        for (const auto& worker : workload.workers) pool.add_worker(worker);
        for (const auto& task : workload.tasks) {
            auto added = orchestrator->add_task(task);
            ASSERT_TRUE(added.has_value()) << added.error().message;
        }
    }

    /**
     * Tick until no progress. @p should_fail decides whether a running
     * task fails instead of completing.
     */
    size_t drive(const std::function<bool(const Task&)>& should_fail = nullptr) {
        size_t ticks = 0;
        while (ticks < 1000) {
            size_t progressed = orchestrator->assign_all().size();

            for (const auto& task : orchestrator->get_tasks()) {
                if (task.status == TaskStatus::Assigned) {
                    EXPECT_TRUE(orchestrator->on_task_started(task.id).has_value());
                }
            }
            clock.advance(1s);

            for (const auto& task : orchestrator->get_tasks()) {
                if (task.status != TaskStatus::InProgress) continue;
                if (should_fail && should_fail(task)) {
                    EXPECT_TRUE(orchestrator->on_task_failed(task.id, "injected").has_value());
                } else {
                    EXPECT_TRUE(orchestrator->on_task_completed(task.id).has_value());
                }
                ++progressed;
            }

            ++ticks;
            if (progressed == 0) break;
        }
        return ticks;
    }

    [[nodiscard]] bool all_completed() const {
        auto tasks = orchestrator->get_tasks();
        return std::all_of(tasks.begin(), tasks.end(),
                           [](const Task& t) { return t.status == TaskStatus::Completed; });
    }

    /// Every dependency completed before its dependent.
    void expect_completion_respects_dependencies() const {
        auto order = recorder.task_ids(events::kTaskCompleted);
        std::unordered_map<TaskId, size_t> position;
        for (size_t i = 0; i < order.size(); ++i) position[order[i]] = i;

        for (const auto& task : orchestrator->get_tasks()) {
            for (const auto& dep : task.depends_on) {
                ASSERT_TRUE(position.contains(dep)) << dep;
                EXPECT_LT(position.at(dep), position.at(task.id))
                    << dep << " should complete before " << task.id;
            }
        }
    }
};

}  // namespace

// ═══════════════════════════════════════════════
// End-to-end Scenarios
// ═══════════════════════════════════════════════

TEST(OrchestrationFlow, PipelineWorkloadRunsToCompletion) {
    auto workload = parse_workload(kPipelineWorkload);
    ASSERT_TRUE(workload.has_value()) << workload.error().message;

    Harness h;
    h.load(*workload);
    EXPECT_EQ(h.orchestrator->get_ready_tasks(), std::vector<TaskId>{"prepare"});

    h.drive();

    EXPECT_TRUE(h.all_completed());
    h.expect_completion_respects_dependencies();
    EXPECT_EQ(h.recorder.task_ids(events::kTaskCompleted).front(), "prepare");
    EXPECT_EQ(h.recorder.task_ids(events::kTaskCompleted).back(), "publish");

    // train needs cuda, so it can only have gone to the gpu worker.
    for (const auto& e : h.recorder.named(events::kTaskAssigned)) {
        if (e.payload.at("taskId") == "train") {
            EXPECT_EQ(e.payload.at("workerId"), "gpu-1");
        }
    }
}

TEST(OrchestrationFlow, JournalMirrorsPublishedEvents) {
    auto workload = parse_workload(kPipelineWorkload);
    ASSERT_TRUE(workload.has_value());

    Harness h;
    h.load(*workload);
    h.drive();

    EXPECT_EQ(h.journal->events_written(), h.recorder.events.size());
    auto lines = h.journal_lines->lines();
    ASSERT_EQ(lines.size(), h.recorder.events.size());
    EXPECT_EQ(lines.front().rfind(R"({"event":"task.added")", 0), 0u);
}

TEST(OrchestrationFlow, HistoryMatchesStateChangeEvents) {
    auto workload = parse_workload(kPipelineWorkload);
    ASSERT_TRUE(workload.has_value());

    Harness h;
    h.load(*workload);
    h.drive();

    for (const auto& task : h.orchestrator->get_tasks()) {
        std::vector<std::string> from_events{"pending"};
        for (const auto& e : h.recorder.named(events::kTaskStateChanged)) {
            if (e.payload.at("taskId") == task.id) from_events.push_back(e.payload.at("newState"));
        }

        std::vector<std::string> from_history;
        for (const auto& entry : task.history) {
            from_history.emplace_back(to_string(entry.state));
        }
        EXPECT_EQ(from_history, from_events) << task.id;
        EXPECT_EQ(from_history.back(), "completed");
    }
}

TEST(OrchestrationFlow, ChainBecomesReadyOneStepAtATime) {
    Harness h;
    h.pool.add_worker({.id = "w"});
    h.load(Workload{.tasks = {
        Task{.id = "A", .title = "A"},
        Task{.id = "B", .title = "B", .depends_on = {"A"}},
        Task{.id = "C", .title = "C", .depends_on = {"B"}},
    }});

    EXPECT_EQ(h.orchestrator->get_ready_tasks(), std::vector<TaskId>{"A"});
    h.drive();

    EXPECT_TRUE(h.all_completed());
    EXPECT_EQ(h.recorder.task_ids(events::kTaskReady), (std::vector<TaskId>{"A", "B", "C"}));
    EXPECT_EQ(h.recorder.task_ids(events::kTaskCompleted),
              (std::vector<TaskId>{"A", "B", "C"}));
}

TEST(OrchestrationFlow, DiamondSurvivesTransientFailures) {
    Config config;
    config.orchestrator.retry.auto_retry = true;
    config.orchestrator.retry.max_retries = 2;

    Harness h(config);
    Workload workload;
    workload.workers = WorkloadGenerator::uniform_workers(2, {"cpu"});
    workload.tasks = WorkloadGenerator::diamond(2, 3, {"cpu"});
    h.load(workload);

    // Each task fails on its first attempt only.
    std::unordered_set<TaskId> attempted;
    h.drive([&](const Task& task) { return attempted.insert(task.id).second; });

    EXPECT_TRUE(h.all_completed());
    h.expect_completion_respects_dependencies();
    for (const auto& task : h.orchestrator->get_tasks()) {
        EXPECT_EQ(task.retry_count, 1u) << task.id;
    }
    EXPECT_EQ(h.recorder.named(events::kTaskFailed).size(), workload.tasks.size());
}

TEST(OrchestrationFlow, ExhaustedRetriesBlockDependents) {
    Config config;
    config.orchestrator.retry.auto_retry = true;
    config.orchestrator.retry.max_retries = 1;

    Harness h(config);
    h.pool.add_worker({.id = "w"});
    h.load(Workload{.tasks = {
        Task{.id = "flaky", .title = "Always fails"},
        Task{.id = "after", .title = "Needs flaky", .depends_on = {"flaky"}},
    }});

    h.drive([](const Task& task) { return task.id == "flaky"; });

    EXPECT_EQ(h.orchestrator->get_task("flaky")->status, TaskStatus::Failed);
    EXPECT_EQ(h.orchestrator->get_task("flaky")->retry_count, 1u);
    EXPECT_EQ(h.orchestrator->get_task("after")->status, TaskStatus::Pending);
    EXPECT_EQ(h.recorder.named(events::kTaskFailed).size(), 2u);
}

TEST(OrchestrationFlow, CyclicTasksNeverRun) {
    Harness h;
    h.pool.add_worker({.id = "w"});
    h.load(Workload{.tasks = {
        Task{.id = "ok", .title = "Independent"},
        Task{.id = "x", .title = "X", .depends_on = {"y"}},
        Task{.id = "y", .title = "Y", .depends_on = {"x"}},
    }});

    h.drive();

    EXPECT_EQ(h.orchestrator->get_task("ok")->status, TaskStatus::Completed);
    EXPECT_EQ(h.orchestrator->get_task("x")->status, TaskStatus::Pending);
    EXPECT_TRUE(*h.orchestrator->has_circular_dependency("x"));
    EXPECT_EQ(h.orchestrator->detect_cycles().size(), 1u);
}

TEST(OrchestrationFlow, RandomWorkloadCompletes) {
    std::mt19937 rng(7);
    const std::vector<Capability> caps{"cpu", "gpu", "io"};

    Harness h;
    Workload workload;
    workload.workers = WorkloadGenerator::uniform_workers(4, caps);
    workload.tasks = WorkloadGenerator::random_dag(60, 0.1f, caps, rng);
    h.load(workload);

    h.drive();

    EXPECT_TRUE(h.all_completed());
    h.expect_completion_respects_dependencies();
    EXPECT_EQ(h.recorder.named(events::kTaskCompleted).size(), 60u);
}
