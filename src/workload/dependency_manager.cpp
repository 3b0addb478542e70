/**
 * @file dependency_manager.cpp
 * @brief TaskDependencyManager implementation: readiness, cycle detection,
 *        dependency chains and topological ordering.
 *
 * Edges point from a task to the tasks it depends on. All traversals are
 * iterative with visited-set guards and terminate on cyclic graphs.
 */

#include "workload/dependency_manager.hpp"

#include <algorithm>
#include <queue>
#include <set>

namespace conductor {

namespace {

const std::vector<TaskId> kNoEdges;

void append_unique(std::vector<TaskId>& list, const TaskId& id) {
    if (std::find(list.begin(), list.end(), id) == list.end()) {
        list.push_back(id);
    }
}

void erase_value(std::vector<TaskId>& list, const TaskId& id) {
    list.erase(std::remove(list.begin(), list.end(), id), list.end());
}

}  // anonymous namespace

TaskDependencyManager::TaskDependencyManager(IEventNotifier& notifier,
                                             RemovedDependencyPolicy policy,
                                             Logger* logger)
    : notifier_(notifier), policy_(policy), logger_(logger) {}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Status TaskDependencyManager::add_task(const Task& task) {
    if (nodes_.contains(task.id)) {
        return Error{ErrorCode::DuplicateTask, "Task already tracked: " + task.id};
    }

    Node node{task.depends_on, task.prefers};
    for (const auto& dep : node.depends_on) {
        append_unique(dependents_[dep], task.id);
    }
    for (const auto& pref : node.prefers) {
        append_unique(soft_dependents_[pref], task.id);
    }

    nodes_.emplace(task.id, std::move(node));
    order_.push_back(task.id);
    removed_.erase(task.id);

    if (logger_ && !task.depends_on.empty()) {
        logger_->debug("Task " + task.id + " depends on "
                       + std::to_string(task.depends_on.size()) + " task(s)");
    }
    return {};
}

Result<std::vector<TaskId>> TaskDependencyManager::remove_task(const TaskId& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }

    // Snapshot dependents that are blocked right now.
    std::vector<TaskId> blocked_dependents;
    for (const auto& dependent : get_dependents(id)) {
        if (!is_ready(dependent)) blocked_dependents.push_back(dependent);
    }

    for (const auto& dep : it->second.depends_on) {
        if (auto rev = dependents_.find(dep); rev != dependents_.end()) {
            erase_value(rev->second, id);
        }
    }
    for (const auto& pref : it->second.prefers) {
        if (auto rev = soft_dependents_.find(pref); rev != soft_dependents_.end()) {
            erase_value(rev->second, id);
        }
    }

    nodes_.erase(it);
    erase_value(order_, id);
    removed_.insert(id);

    std::vector<TaskId> unblocked;
    if (policy_ == RemovedDependencyPolicy::Satisfy) {
        for (const auto& dependent : blocked_dependents) {
            if (is_ready(dependent)) unblocked.push_back(dependent);
        }
        publish_ready(unblocked);
    }

    if (logger_) {
        logger_->debug("Task " + id + " removed from dependency graph ("
                       + std::to_string(blocked_dependents.size()) + " blocked dependent(s), policy "
                       + std::string{to_string(policy_)} + ")");
    }
    return unblocked;
}

// ─────────────────────────────────────────────
// Edge Editing
// ─────────────────────────────────────────────

Status TaskDependencyManager::add_dependency(const TaskId& id, const TaskId& depends_on) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }

    auto& edges = it->second.depends_on;
    if (std::find(edges.begin(), edges.end(), depends_on) != edges.end()) {
        return {};
    }
    edges.push_back(depends_on);
    append_unique(dependents_[depends_on], id);

    if (logger_) {
        logger_->debug("Added dependency " + id + " -> " + depends_on);
    }
    return {};
}

Result<std::vector<TaskId>> TaskDependencyManager::remove_dependency(const TaskId& id,
                                                                     const TaskId& depends_on) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }

    const bool was_ready = node_ready(id, it->second);
    erase_value(it->second.depends_on, depends_on);
    if (auto rev = dependents_.find(depends_on); rev != dependents_.end()) {
        erase_value(rev->second, id);
    }

    std::vector<TaskId> unblocked;
    if (!was_ready && node_ready(id, it->second)) {
        unblocked.push_back(id);
        publish_ready(unblocked);
    }

    if (logger_) {
        logger_->debug("Removed dependency " + id + " -> " + depends_on);
    }
    return unblocked;
}

// ─────────────────────────────────────────────
// Completion
// ─────────────────────────────────────────────

Result<std::vector<TaskId>> TaskDependencyManager::mark_task_complete(const TaskId& id) {
    if (!nodes_.contains(id)) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }
    if (completed_.contains(id)) {
        return std::vector<TaskId>{};
    }

    completed_.insert(id);

    std::vector<TaskId> unblocked;
    for (const auto& dependent : get_dependents(id)) {
        if (is_ready(dependent)) unblocked.push_back(dependent);
    }
    publish_ready(unblocked);

    if (logger_) {
        logger_->debug("Task " + id + " complete, unblocked "
                       + std::to_string(unblocked.size()) + " dependent(s)");
    }
    return unblocked;
}

void TaskDependencyManager::publish_ready(const std::vector<TaskId>& ids) {
    for (const auto& ready : ids) {
        safe_publish(notifier_, logger_, events::kTaskReady, {{"taskId", ready}});
    }
}

// ─────────────────────────────────────────────
// Readiness
// ─────────────────────────────────────────────

bool TaskDependencyManager::is_satisfied(const TaskId& dependency) const {
    if (completed_.contains(dependency)) return true;
    return policy_ == RemovedDependencyPolicy::Satisfy && removed_.contains(dependency);
}

bool TaskDependencyManager::node_ready(const TaskId& id, const Node& node) const {
    if (completed_.contains(id)) return false;
    return std::all_of(node.depends_on.begin(), node.depends_on.end(),
                       [this](const TaskId& dep) { return is_satisfied(dep); });
}

std::vector<TaskId> TaskDependencyManager::get_ready_tasks() const {
    std::vector<TaskId> ready;
    for (const auto& id : order_) {
        if (node_ready(id, nodes_.at(id))) {
            ready.push_back(id);
        }
    }
    return ready;
}

bool TaskDependencyManager::is_ready(const TaskId& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() && node_ready(id, it->second);
}

bool TaskDependencyManager::is_complete(const TaskId& id) const {
    return completed_.contains(id);
}

bool TaskDependencyManager::contains(const TaskId& id) const {
    return nodes_.contains(id);
}

// ─────────────────────────────────────────────
// Edge Queries
// ─────────────────────────────────────────────

const std::vector<TaskId>& TaskDependencyManager::hard_edges(const TaskId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? kNoEdges : it->second.depends_on;
}

Result<std::vector<TaskId>> TaskDependencyManager::get_dependencies(const TaskId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }
    return it->second.depends_on;
}

Result<std::vector<TaskId>> TaskDependencyManager::get_soft_dependencies(const TaskId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }
    return it->second.prefers;
}

std::vector<TaskId> TaskDependencyManager::get_dependents(const TaskId& id) const {
    std::vector<TaskId> result;
    if (auto it = dependents_.find(id); it != dependents_.end()) {
        for (const auto& dependent : it->second) {
            if (nodes_.contains(dependent)) result.push_back(dependent);
        }
    }
    return result;
}

std::vector<TaskId> TaskDependencyManager::get_soft_dependents(const TaskId& id) const {
    std::vector<TaskId> result;
    if (auto it = soft_dependents_.find(id); it != soft_dependents_.end()) {
        for (const auto& dependent : it->second) {
            if (nodes_.contains(dependent)) result.push_back(dependent);
        }
    }
    return result;
}

Result<std::vector<TaskId>> TaskDependencyManager::get_dependency_chain(const TaskId& id) const {
    if (!nodes_.contains(id)) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }

    std::vector<TaskId> chain;
    std::unordered_set<TaskId> visited{id};
    std::queue<TaskId> frontier;
    frontier.push(id);

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        for (const auto& dep : hard_edges(current)) {
            if (visited.insert(dep).second) {
                chain.push_back(dep);
                frontier.push(dep);
            }
        }
    }
    return chain;
}

// ─────────────────────────────────────────────
// Cycle Detection
// ─────────────────────────────────────────────

Result<bool> TaskDependencyManager::has_circular_dependency(const TaskId& id) const {
    if (!nodes_.contains(id)) {
        return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
    }

    std::unordered_set<TaskId> visited;
    std::vector<TaskId> stack(hard_edges(id).begin(), hard_edges(id).end());

    while (!stack.empty()) {
        auto current = std::move(stack.back());
        stack.pop_back();

        if (current == id) return true;
        if (!visited.insert(current).second) continue;

        for (const auto& dep : hard_edges(current)) {
            if (!visited.contains(dep)) stack.push_back(dep);
        }
    }
    return false;
}

bool TaskDependencyManager::would_create_cycle(const TaskId& id,
                                               const std::vector<TaskId>& depends_on) const {
    std::unordered_set<TaskId> visited;
    std::vector<TaskId> stack(depends_on.begin(), depends_on.end());

    while (!stack.empty()) {
        auto current = std::move(stack.back());
        stack.pop_back();

        if (current == id) return true;
        if (!visited.insert(current).second) continue;

        for (const auto& dep : hard_edges(current)) {
            if (!visited.contains(dep)) stack.push_back(dep);
        }
    }
    return false;
}

std::vector<std::vector<TaskId>> TaskDependencyManager::detect_cycles() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;
    for (const auto& id : order_) {
        color[id] = Color::White;
    }

    std::vector<std::vector<TaskId>> cycles;
    std::set<std::vector<TaskId>> seen;

    struct Frame {
        TaskId node;
        size_t edge_idx;
    };

    for (const auto& start_id : order_) {
        if (color[start_id] != Color::White) continue;

        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({start_id, 0});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();
            const auto& edges = hard_edges(frame.node);

            if (frame.edge_idx >= edges.size()) {
                color[frame.node] = Color::Black;
                dfs_stack.pop_back();
                continue;
            }

            const auto next = edges[frame.edge_idx++];
            if (!nodes_.contains(next)) continue;

            if (color[next] == Color::Gray) {
                // Back edge: the cycle is the stack suffix starting at next.
                auto from = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                         [&](const Frame& f) { return f.node == next; });
                std::vector<TaskId> cycle;
                for (auto f = from; f != dfs_stack.end(); ++f) {
                    cycle.push_back(f->node);
                }

                auto canonical = cycle;
                std::rotate(canonical.begin(),
                            std::min_element(canonical.begin(), canonical.end()),
                            canonical.end());
                if (seen.insert(canonical).second) {
                    cycles.push_back(std::move(cycle));
                }
            } else if (color[next] == Color::White) {
                color[next] = Color::Gray;
                dfs_stack.push_back({next, 0});
            }
        }
    }

    return cycles;
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

Result<std::vector<TaskId>> TaskDependencyManager::topological_order() const {
    std::unordered_map<TaskId, size_t> in_degree;
    for (const auto& id : order_) {
        size_t degree = 0;
        for (const auto& dep : nodes_.at(id).depends_on) {
            if (nodes_.contains(dep)) ++degree;
        }
        in_degree[id] = degree;
    }

    std::queue<TaskId> zero_in;
    for (const auto& id : order_) {
        if (in_degree[id] == 0) zero_in.push(id);
    }

    std::vector<TaskId> order;
    order.reserve(nodes_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        order.push_back(current);

        for (const auto& dependent : get_dependents(current)) {
            // A task listing the same dependency twice is counted once per edge.
            const auto& deps = nodes_.at(dependent).depends_on;
            auto edges = static_cast<size_t>(std::count(deps.begin(), deps.end(), current));
            auto& degree = in_degree[dependent];
            degree -= std::min(degree, edges);
            if (degree == 0) zero_in.push(dependent);
        }
    }

    if (order.size() != nodes_.size()) {
        return Error{ErrorCode::CircularDependency,
                     "Dependency graph contains a cycle; "
                     + std::to_string(nodes_.size() - order.size()) + " task(s) unordered"};
    }
    return order;
}

}  // namespace conductor
