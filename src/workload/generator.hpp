/**
 * @file generator.hpp
 * @brief Synthetic task graphs for demos, tests and benchmarking.
 */

#pragma once

#include "core/model.hpp"
#include "core/types.hpp"

#include <random>
#include <vector>

namespace conductor {

/**
 * @brief Factory for task lists with common dependency topologies.
 *
 * Every task is returned in an order where dependencies come first, so
 * the list can be fed to TaskOrchestrator::add_task as-is. All tasks
 * require @p capabilities.
 */
class WorkloadGenerator {
public:
    /// chain_0 → chain_1 → ... → chain_{n-1}
    static std::vector<Task> linear_chain(size_t num_tasks,
                                          const CapabilitySet& capabilities = {});

    /// fan_src → {fan_branch_0 .. fan_branch_{w-1}} → fan_sink
    static std::vector<Task> fan_out_fan_in(size_t width,
                                            const CapabilitySet& capabilities = {});

    /// Repeated fan-out/fan-in, each level's merge feeding the next hub
    static std::vector<Task> diamond(size_t depth, size_t width,
                                     const CapabilitySet& capabilities = {});

    /**
     * @brief Random acyclic graph with mixed priorities.
     *
     * Edges only point from higher to lower index. Each task requires one
     * capability drawn from @p capability_pool (none when the pool is empty).
     */
    static std::vector<Task> random_dag(size_t num_tasks,
                                        float edge_probability,
                                        const std::vector<Capability>& capability_pool,
                                        std::mt19937& rng);

    /// Workers "worker-0".."worker-{n-1}", each with every capability in @p pool.
    static std::vector<Worker> uniform_workers(size_t count,
                                               const std::vector<Capability>& pool);
};

}  // namespace conductor
