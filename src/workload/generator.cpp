/**
 * @file generator.cpp
 * @brief Synthetic task graph generators.
 *
 * Topologies:
 * - Linear chains (strictly sequential pipelines)
 * - Fan-out/fan-in (one producer, parallel branches, one consumer)
 * - Diamond (stacked fan-out/fan-in levels)
 * - Random DAGs (stress testing and benchmarking)
 */

#include "workload/generator.hpp"

#include <format>

namespace conductor {

namespace {

Task make_task(TaskId id, std::string title, const CapabilitySet& capabilities,
               std::vector<TaskId> depends_on = {}) {
    return Task{
        .id = std::move(id),
        .title = std::move(title),
        .required_capabilities = capabilities,
        .depends_on = std::move(depends_on),
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

std::vector<Task> WorkloadGenerator::linear_chain(size_t num_tasks,
                                                  const CapabilitySet& capabilities) {
    std::vector<Task> tasks;
    tasks.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        std::vector<TaskId> deps;
        if (i > 0) deps.push_back(tasks.back().id);
        tasks.push_back(make_task(std::format("chain_{}", i),
                                  std::format("Chain Task {}", i),
                                  capabilities, std::move(deps)));
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          fan_src
//       /     |     \    (backslash)
//   branch_0 ... branch_{width-1}
//       \     |     /
//          fan_sink
// ─────────────────────────────────────────────

std::vector<Task> WorkloadGenerator::fan_out_fan_in(size_t width,
                                                    const CapabilitySet& capabilities) {
    std::vector<Task> tasks;
    tasks.reserve(width + 2);

    tasks.push_back(make_task("fan_src", "Fan-Out Source", capabilities));

    std::vector<TaskId> branch_ids;
    for (size_t i = 0; i < width; ++i) {
        auto branch_id = std::format("fan_branch_{}", i);
        tasks.push_back(make_task(branch_id, std::format("Branch {}", i),
                                  capabilities, {"fan_src"}));
        branch_ids.push_back(std::move(branch_id));
    }

    tasks.push_back(make_task("fan_sink", "Fan-In Sink", capabilities, std::move(branch_ids)));
    return tasks;
}

// ─────────────────────────────────────────────
// Diamond: repeated fan-out/fan-in at each depth level.
//
//   hub_0 → {diamond_0_*} → merge_0 → hub_1 → {diamond_1_*} → merge_1 ...
// ─────────────────────────────────────────────

std::vector<Task> WorkloadGenerator::diamond(size_t depth, size_t width,
                                             const CapabilitySet& capabilities) {
    std::vector<Task> tasks;
    TaskId prev_merge;

    for (size_t d = 0; d < depth; ++d) {
        auto hub_id = std::format("hub_{}", d);
        std::vector<TaskId> hub_deps;
        if (d > 0) hub_deps.push_back(prev_merge);
        tasks.push_back(make_task(hub_id, std::format("Hub {}", d), capabilities,
                                  std::move(hub_deps)));

        std::vector<TaskId> branch_ids;
        for (size_t w = 0; w < width; ++w) {
            auto branch_id = std::format("diamond_{}_{}", d, w);
            tasks.push_back(make_task(branch_id, std::format("Diamond D{} B{}", d, w),
                                      capabilities, {hub_id}));
            branch_ids.push_back(std::move(branch_id));
        }

        auto merge_id = std::format("merge_{}", d);
        tasks.push_back(make_task(merge_id, std::format("Merge {}", d), capabilities,
                                  std::move(branch_ids)));
        prev_merge = merge_id;
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Random DAG:
// Erdős–Rényi-style edges, only from higher to lower index, which
// guarantees acyclicity.
// ─────────────────────────────────────────────

std::vector<Task> WorkloadGenerator::random_dag(size_t num_tasks,
                                                float edge_probability,
                                                const std::vector<Capability>& capability_pool,
                                                std::mt19937& rng) {
    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    std::uniform_int_distribution<size_t> priority_dist(0, kPriorityCount - 1);

    std::vector<Task> tasks;
    tasks.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        CapabilitySet caps;
        if (!capability_pool.empty()) {
            std::uniform_int_distribution<size_t> cap_dist(0, capability_pool.size() - 1);
            caps.insert(capability_pool[cap_dist(rng)]);
        }

        std::vector<TaskId> deps;
        for (size_t j = 0; j < i; ++j) {
            if (edge_dist(rng) < edge_probability) {
                deps.push_back(tasks[j].id);
            }
        }

        auto task = make_task(std::format("rand_{}", i), std::format("Random Task {}", i),
                              caps, std::move(deps));
        task.priority = static_cast<Priority>(priority_dist(rng));
        tasks.push_back(std::move(task));
    }
    return tasks;
}

std::vector<Worker> WorkloadGenerator::uniform_workers(size_t count,
                                                       const std::vector<Capability>& pool) {
    std::vector<Worker> workers;
    workers.reserve(count);

    CapabilitySet caps(pool.begin(), pool.end());
    for (size_t i = 0; i < count; ++i) {
        workers.push_back(Worker{.id = std::format("worker-{}", i), .capabilities = caps});
    }
    return workers;
}

}  // namespace conductor
