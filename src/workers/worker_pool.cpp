/**
 * @file worker_pool.cpp
 * @brief StaticWorkerPool implementation.
 */

#include "workers/worker_pool.hpp"

#include <algorithm>
#include <mutex>

namespace conductor {

namespace {

auto by_id(const WorkerId& id) {
    return [&id](const Worker& w) { return w.id == id; };
}

}  // anonymous namespace

void StaticWorkerPool::add_worker(Worker worker) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(workers_.begin(), workers_.end(), by_id(worker.id));
    if (it != workers_.end()) {
        *it = std::move(worker);
    } else {
        workers_.push_back(std::move(worker));
    }
}

bool StaticWorkerPool::remove_worker(const WorkerId& id) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(workers_.begin(), workers_.end(), by_id(id));
    if (it == workers_.end()) return false;
    workers_.erase(it);
    return true;
}

bool StaticWorkerPool::set_available(const WorkerId& id, bool available) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(workers_.begin(), workers_.end(), by_id(id));
    if (it == workers_.end()) return false;
    it->available = available;
    return true;
}

void StaticWorkerPool::clear() {
    std::unique_lock lock(mutex_);
    workers_.clear();
}

std::vector<Worker> StaticWorkerPool::idle_workers() const {
    std::shared_lock lock(mutex_);
    std::vector<Worker> result;
    for (const auto& w : workers_) {
        if (w.available) result.push_back(w);
    }
    return result;
}

std::vector<Worker> StaticWorkerPool::workers() const {
    std::shared_lock lock(mutex_);
    return workers_;
}

std::optional<Worker> StaticWorkerPool::find(const WorkerId& id) const {
    std::shared_lock lock(mutex_);
    auto it = std::find_if(workers_.begin(), workers_.end(), by_id(id));
    if (it == workers_.end()) return std::nullopt;
    return *it;
}

size_t StaticWorkerPool::size() const {
    std::shared_lock lock(mutex_);
    return workers_.size();
}

}  // namespace conductor
