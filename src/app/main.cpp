/**
 * @file main.cpp
 * @brief conductor command-line entry point.
 *
 * Wires the engine to an in-memory worker pool and runs a workload to
 * completion in simulated ticks:
 *   Config → Logger → Event journal → Worker pool → Orchestrator → Tick loop
 */

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "events/notifier.hpp"
#include "orchestrator/task_orchestrator.hpp"
#include "telemetry/event_journal.hpp"
#include "telemetry/json_sink.hpp"
#include "workers/worker_pool.hpp"
#include "workload/generator.hpp"
#include "workload/workload_file.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace conductor;

namespace {

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            Conductor v1.0.0               ║
  ║   Capability-aware Task Orchestration     ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path workload_path;
    std::string log_level;
    bool demo_mode = false;
    std::optional<int> exit_code;   ///< Set when main should return immediately
};

void print_usage() {
    std::cout << "Usage: conductor [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --workload <path>    Workload file with [[worker]] and [[task]] entries\n"
              << "  --demo               Run a generated diamond workload, then exit\n"
              << "  --log-level <level>  debug, info, warn or error (overrides config)\n"
              << "  --help, -h           Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--workload" && i + 1 < argc) {
            args.workload_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            args.exit_code = 0;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            args.exit_code = 2;
            break;
        }
    }
    return args;
}

Workload demo_workload() {
    const std::vector<Capability> pool{"cpu", "io"};
    Workload workload;
    workload.workers = WorkloadGenerator::uniform_workers(3, pool);
    workload.tasks = WorkloadGenerator::diamond(2, 3, {"cpu"});

    // One capability nobody has, so the summary shows a stuck task.
    workload.tasks.push_back(Task{
        .id = "render",
        .title = "Render report",
        .priority = Priority::High,
        .required_capabilities = {"gpu"},
        .depends_on = {"merge_1"},
    });
    return workload;
}

struct RunSummary {
    size_t ticks = 0;
    size_t assigned = 0;
    size_t completed = 0;
};

/**
 * @brief Drive every task as far as it can go.
 *
 * Each tick assigns what it can, starts every assigned task and completes
 * every running one. Stops once a tick makes no progress.
 */
RunSummary simulate(TaskOrchestrator& orchestrator, Logger& logger) {
    RunSummary summary;

    while (true) {
        auto assignments = orchestrator.assign_all();
        size_t progressed = assignments.size();
        summary.assigned += assignments.size();

        for (const auto& task : orchestrator.get_tasks()) {
            if (task.status == TaskStatus::Assigned) {
                if (auto started = orchestrator.on_task_started(task.id); !started) {
                    logger.error(started.error().message);
                }
            }
        }

        for (const auto& task : orchestrator.get_tasks()) {
            if (task.status != TaskStatus::InProgress) continue;
            if (auto done = orchestrator.on_task_completed(task.id); done) {
                ++summary.completed;
                ++progressed;
            } else {
                logger.error(done.error().message);
            }
        }

        ++summary.ticks;
        if (progressed == 0) break;
    }

    return summary;
}

void report(const TaskOrchestrator& orchestrator, const RunSummary& summary, Logger& logger) {
    size_t pending = 0;
    size_t failed = 0;
    for (const auto& task : orchestrator.get_tasks()) {
        if (task.status == TaskStatus::Pending) ++pending;
        if (task.status == TaskStatus::Failed) ++failed;

        if (task.status != TaskStatus::Completed) {
            auto cyclic = orchestrator.has_circular_dependency(task.id);
            if (cyclic && *cyclic) {
                logger.warn("Task " + task.id + " is part of a dependency cycle");
            } else {
                logger.info("Task " + task.id + " left " + std::string{to_string(task.status)});
            }
        }
    }

    for (const auto& cycle : orchestrator.detect_cycles()) {
        std::string path;
        for (const auto& id : cycle) path += id + " -> ";
        logger.warn("Cycle: " + path + cycle.front());
    }

    logger.info("Run finished after " + std::to_string(summary.ticks) + " tick(s): "
                + std::to_string(summary.assigned) + " assigned, "
                + std::to_string(summary.completed) + " completed, "
                + std::to_string(pending) + " pending, "
                + std::to_string(failed) + " failed");
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.exit_code) return *args.exit_code;

    print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        if (!config_result.error().is(ErrorCode::Io)) return 1;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_level.empty()) config.logging.level = args.log_level;

    auto level = parse_log_level(config.logging.level);
    if (!level) {
        std::cerr << level.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    auto make_sink = [&](const std::string& prefix) -> std::unique_ptr<ILogSink> {
        if (!config.logging.log_dir.empty()) {
            return std::make_unique<JsonFileSink>(config.logging.log_dir, prefix,
                                                  config.logging.max_file_size_mb,
                                                  config.logging.rotate_count);
        }
        return std::make_unique<StdoutSink>();
    };

    Logger logger(make_sink("conductor_host"), *level, "host");
    logger.info("Conductor starting...");
    logger.info("Retry policy: auto_retry=" + std::string{config.orchestrator.retry.auto_retry ? "true" : "false"}
                + ", max_retries=" + std::to_string(config.orchestrator.retry.max_retries));
    logger.info("Removed dependency policy: "
                + std::string{to_string(config.orchestrator.removed_dependency_policy)});

    // ── Load Workload ────────────────────────
    Workload workload;
    if (args.demo_mode || args.workload_path.empty()) {
        logger.info("=== Demo Mode ===");
        workload = demo_workload();
    } else {
        auto loaded = load_workload(args.workload_path);
        if (!loaded) {
            logger.error("Failed to load workload: " + loaded.error().message);
            logger.flush();
            return 1;
        }
        workload = std::move(loaded).value();
    }
    logger.info("Workload: " + std::to_string(workload.workers.size()) + " worker(s), "
                + std::to_string(workload.tasks.size()) + " task(s)");

    // ── Initialize Events ────────────────────
    FanoutNotifier notifier(&logger);
    std::unique_ptr<EventJournal> journal;
    if (config.events.journal) {
        journal = std::make_unique<EventJournal>(make_sink("conductor_events"));
        notifier.add(*journal);
    }

    // ── Initialize Engine ────────────────────
    StaticWorkerPool pool;
    for (auto& worker : workload.workers) {
        pool.add_worker(std::move(worker));
    }

    SystemClock clock;
    TaskOrchestrator orchestrator(
        TaskOrchestrator::Options{
            .config = config,
            .log_sink = make_sink("conductor"),
            .log_level = *level,
        },
        pool, notifier, clock);

    size_t rejected = 0;
    for (auto& task : workload.tasks) {
        const auto id = task.id;
        if (auto added = orchestrator.add_task(std::move(task)); !added) {
            logger.warn("Task " + id + " rejected: " + added.error().message);
            ++rejected;
        }
    }
    if (rejected > 0) {
        logger.warn(std::to_string(rejected) + " task(s) rejected");
    }

    // ── Run ──────────────────────────────────
    auto summary = simulate(orchestrator, logger);
    report(orchestrator, summary, logger);

    if (journal) {
        journal->flush();
        logger.info("Event journal: " + std::to_string(journal->events_written()) + " event(s)");
    }
    orchestrator.logger().flush();
    logger.info("Conductor stopped.");
    logger.flush();
    return 0;
}
