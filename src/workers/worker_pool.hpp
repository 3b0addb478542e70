/**
 * @file worker_pool.hpp
 * @brief Worker Pool collaborator interface and an in-memory registry.
 */

#pragma once

#include "core/model.hpp"
#include "core/types.hpp"

#include <optional>
#include <shared_mutex>
#include <vector>

namespace conductor {

/**
 * @brief Source of idle workers. The engine only reads from it.
 */
class IWorkerPool {
public:
    virtual ~IWorkerPool() = default;
    [[nodiscard]] virtual std::vector<Worker> idle_workers() const = 0;
};

/**
 * @brief Registry of workers kept by the host, in registration order.
 *
 * Thread-safe via shared_mutex so a host may flip availability from
 * its own threads while the engine reads a snapshot.
 */
class StaticWorkerPool : public IWorkerPool {
public:
    /// Registers or replaces a worker, keeping its original position.
    void add_worker(Worker worker);
    bool remove_worker(const WorkerId& id);
    bool set_available(const WorkerId& id, bool available);
    void clear();

    [[nodiscard]] std::vector<Worker> idle_workers() const override;
    [[nodiscard]] std::vector<Worker> workers() const;
    [[nodiscard]] std::optional<Worker> find(const WorkerId& id) const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<Worker> workers_;
};

}  // namespace conductor
