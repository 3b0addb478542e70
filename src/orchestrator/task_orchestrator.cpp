/**
 * @file task_orchestrator.cpp
 * @brief TaskOrchestrator implementation.
 */

#include "orchestrator/task_orchestrator.hpp"

#include "telemetry/json_sink.hpp"

#include <algorithm>

namespace conductor {

namespace {

/// Delivers queued events when the outermost public operation returns.
class EventFlush {
public:
    explicit EventFlush(DeferredNotifier& events) : events_(events) { events_.begin_batch(); }
    ~EventFlush() { events_.end_batch(); }

    EventFlush(const EventFlush&) = delete;
    EventFlush& operator=(const EventFlush&) = delete;

private:
    DeferredNotifier& events_;
};

std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

Error unknown_task(const TaskId& id) {
    return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
}

}  // anonymous namespace

TaskOrchestrator::TaskOrchestrator(Options opts,
                                   IWorkerPool& workers,
                                   IEventNotifier& notifier,
                                   const IClock& clock)
    : config_(std::move(opts.config))
    , logger_(sink_or_null(std::move(opts.log_sink)), opts.log_level, "orchestrator", &clock)
    , workers_(workers)
    , events_(notifier, &logger_)
    , clock_(clock)
    , state_machine_(events_, clock_, &logger_)
    , dependencies_(events_, config_.orchestrator.removed_dependency_policy, &logger_)
    , scheduler_(&logger_)
    , matcher_(config_.matcher) {
}

// ─────────────────────────────────────────────
// Task Table
// ─────────────────────────────────────────────

Status TaskOrchestrator::validate_new_task(const Task& task) const {
    if (task.id.empty()) {
        return Error{ErrorCode::InvalidTask, "Task id must not be empty"};
    }
    if (task.title.empty()) {
        return Error{ErrorCode::InvalidTask, "Task " + task.id + " has no title"};
    }
    if (tasks_.contains(task.id)) {
        return Error{ErrorCode::DuplicateTask, "Task already exists: " + task.id};
    }
    if (retired_ids_.contains(task.id)) {
        return Error{ErrorCode::DuplicateTask, "Task id was used before and removed: " + task.id};
    }
    if (config_.orchestrator.reject_cycles_on_add
        && dependencies_.would_create_cycle(task.id, task.depends_on)) {
        return Error{ErrorCode::CircularDependency,
                     "Task " + task.id + " would close a dependency cycle"};
    }
    return {};
}

Status TaskOrchestrator::add_task(Task task) {
    EventFlush flush(events_);

    if (auto valid = validate_new_task(task); !valid) {
        logger_.warn("Rejected task " + task.id + ": " + valid.error().message);
        return valid;
    }

    task.status = TaskStatus::Pending;
    task.assigned_to.reset();
    task.created_at = clock_.now();
    task.history.clear();
    task.retry_count = 0;

    if (auto added = dependencies_.add_task(task); !added) {
        return added;
    }
    if (auto queued = scheduler_.add_task(task.id, task.priority); !queued) {
        (void)dependencies_.remove_task(task.id);
        return queued;
    }
    if (auto tracked = state_machine_.add_task(task.id); !tracked) {
        scheduler_.remove_task(task.id);
        (void)dependencies_.remove_task(task.id);
        return tracked;
    }

    const TaskId id = task.id;
    events_.publish(events::kTaskAdded, {
        {"taskId", id},
        {"title", task.title},
        {"priority", std::string{to_string(task.priority)}},
    });

    logger_.info("Task added: " + id + " \"" + task.title + "\" priority="
                 + std::string{to_string(task.priority)}
                 + " deps=" + std::to_string(task.depends_on.size()),
                 {{"taskId", id}});

    tasks_.emplace(id, std::move(task));
    task_order_.push_back(id);

    if (dependencies_.is_ready(id)) {
        events_.publish(events::kTaskReady, {{"taskId", id}});
    }
    return {};
}

Status TaskOrchestrator::remove_task(const TaskId& id) {
    EventFlush flush(events_);

    if (!tasks_.contains(id)) {
        return unknown_task(id);
    }

    events_.publish(events::kTaskRemoved, {{"taskId", id}});

    state_machine_.remove_task(id);
    if (auto removed = dependencies_.remove_task(id); removed && !removed->empty()) {
        logger_.info("Removal of " + id + " unblocked " + std::to_string(removed->size())
                     + " dependent(s)");
    }
    scheduler_.remove_task(id);

    tasks_.erase(id);
    task_order_.erase(std::remove(task_order_.begin(), task_order_.end(), id), task_order_.end());
    retired_ids_.insert(id);

    logger_.info("Task removed: " + id, {{"taskId", id}});
    return {};
}

Status TaskOrchestrator::cancel_task(const TaskId& id, const std::string& reason) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    Task& task = **found;

    if (holds_worker(task.status)) {
        if (auto failed = fail(task, reason, false); !failed) {
            return failed;
        }
    }
    return remove_task(id);
}

std::vector<Task> TaskOrchestrator::get_tasks() const {
    std::vector<Task> result;
    result.reserve(task_order_.size());
    for (const auto& id : task_order_) {
        auto task = get_task(id);
        if (task) result.push_back(std::move(task).value());
    }
    return result;
}

Result<Task> TaskOrchestrator::get_task(const TaskId& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return unknown_task(id);
    }

    Task snapshot = it->second;
    if (auto history = state_machine_.get_history(id)) {
        snapshot.history = std::move(history).value();
    }
    return snapshot;
}

Status TaskOrchestrator::update_task_priority(const TaskId& id, Priority priority) {
    auto found = find_task(id);
    if (!found) return found.error();

    (*found)->priority = priority;
    scheduler_.update_task_priority(id, priority);
    return {};
}

std::vector<Task> TaskOrchestrator::tasks_for_worker(const WorkerId& worker_id) const {
    std::vector<Task> result;
    for (const auto& id : task_order_) {
        const auto& task = tasks_.at(id);
        if (task.assigned_to == worker_id) {
            auto snapshot = get_task(id);
            if (snapshot) result.push_back(std::move(snapshot).value());
        }
    }
    return result;
}

size_t TaskOrchestrator::clear_completed() {
    EventFlush flush(events_);

    std::vector<TaskId> completed;
    for (const auto& id : task_order_) {
        if (tasks_.at(id).status == TaskStatus::Completed) completed.push_back(id);
    }

    size_t removed = 0;
    for (const auto& id : completed) {
        if (auto status = remove_task(id); status) {
            ++removed;
        } else {
            logger_.error("Clearing " + id + " failed: " + status.error().message);
        }
    }

    if (removed > 0) {
        logger_.info("Cleared " + std::to_string(removed) + " completed task(s)");
    }
    return removed;
}

Result<Task*> TaskOrchestrator::find_task(const TaskId& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return unknown_task(id);
    }
    return &it->second;
}

// ─────────────────────────────────────────────
// Dependencies & Matching
// ─────────────────────────────────────────────

std::vector<TaskId> TaskOrchestrator::get_ready_tasks() const {
    return dependencies_.get_ready_tasks();
}

Result<std::vector<TaskId>> TaskOrchestrator::get_dependencies(const TaskId& id) const {
    return dependencies_.get_dependencies(id);
}

Result<std::vector<TaskId>> TaskOrchestrator::get_dependents(const TaskId& id) const {
    if (!tasks_.contains(id)) {
        return unknown_task(id);
    }
    return dependencies_.get_dependents(id);
}

Status TaskOrchestrator::add_dependency(const TaskId& id, const TaskId& depends_on) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    Task& task = **found;

    if (!tasks_.contains(depends_on)) {
        return Error{ErrorCode::UnknownTask, "Unknown dependency: " + depends_on};
    }
    if (task.status != TaskStatus::Pending) {
        return Error{ErrorCode::InvalidTask,
                     "Task " + id + " is " + std::string{to_string(task.status)}
                     + "; dependencies can only be added while pending"};
    }
    if (std::find(task.depends_on.begin(), task.depends_on.end(), depends_on)
        != task.depends_on.end()) {
        return {};
    }
    if (config_.orchestrator.reject_cycles_on_add
        && dependencies_.would_create_cycle(id, {depends_on})) {
        return Error{ErrorCode::CircularDependency,
                     "Dependency " + id + " -> " + depends_on + " would close a cycle"};
    }

    if (auto added = dependencies_.add_dependency(id, depends_on); !added) {
        return added;
    }
    task.depends_on.push_back(depends_on);

    events_.publish(events::kDependencyAdded, {{"taskId", id}, {"dependsOn", depends_on}});
    logger_.info("Dependency added: " + id + " -> " + depends_on,
                 {{"taskId", id}, {"dependsOn", depends_on}});
    return {};
}

Status TaskOrchestrator::remove_dependency(const TaskId& id, const TaskId& depends_on) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    Task& task = **found;

    auto& edges = task.depends_on;
    if (std::find(edges.begin(), edges.end(), depends_on) == edges.end()) {
        return {};
    }

    events_.publish(events::kDependencyRemoved, {{"taskId", id}, {"dependsOn", depends_on}});
    if (auto removed = dependencies_.remove_dependency(id, depends_on); !removed) {
        return removed.error();
    }
    edges.erase(std::remove(edges.begin(), edges.end(), depends_on), edges.end());

    logger_.info("Dependency removed: " + id + " -> " + depends_on,
                 {{"taskId", id}, {"dependsOn", depends_on}});
    return {};
}

Result<std::vector<TaskId>> TaskOrchestrator::conflicts_of(const TaskId& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return unknown_task(id);
    }
    const auto& declared = it->second.conflicts_with;

    std::vector<TaskId> conflicts;
    for (const auto& other_id : task_order_) {
        if (other_id == id) continue;
        const auto& other = tasks_.at(other_id);
        if (!holds_worker(other.status)) continue;

        bool listed = std::find(declared.begin(), declared.end(), other_id) != declared.end()
            || std::find(other.conflicts_with.begin(), other.conflicts_with.end(), id)
                   != other.conflicts_with.end();
        if (listed) conflicts.push_back(other_id);
    }
    return conflicts;
}

Result<bool> TaskOrchestrator::has_circular_dependency(const TaskId& id) const {
    return dependencies_.has_circular_dependency(id);
}

std::vector<std::vector<TaskId>> TaskOrchestrator::detect_cycles() const {
    return dependencies_.detect_cycles();
}

double TaskOrchestrator::match_score(const CapabilitySet& required,
                                     const CapabilitySet& available) const {
    return matcher_.match_score(required, available);
}

std::optional<Worker> TaskOrchestrator::find_best_match(const CapabilitySet& required,
                                                        const std::vector<Worker>& candidates) const {
    return matcher_.find_best_match(required, candidates);
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Status TaskOrchestrator::change_state(Task& task, TaskStatus target) {
    if (auto moved = state_machine_.transition(task.id, target); !moved) {
        return moved;
    }
    task.status = target;
    if (!holds_worker(target)) {
        task.assigned_to.reset();
    }
    return {};
}

Status TaskOrchestrator::transition(const TaskId& id, TaskStatus target) {
    switch (target) {
        case TaskStatus::Assigned:
            if (!tasks_.contains(id)) return unknown_task(id);
            return Error{ErrorCode::InvalidTransition,
                         "Task " + id + " cannot be assigned without a worker"};
        case TaskStatus::InProgress:
            return on_task_started(id);
        case TaskStatus::Completed:
            return on_task_completed(id);
        case TaskStatus::Failed:
            return on_task_failed(id, "transition requested");
        case TaskStatus::Pending:
            return retry_task(id);
    }
    return Error{ErrorCode::InvalidTransition, "Unsupported target state"};
}

Result<TaskStatus> TaskOrchestrator::get_state(const TaskId& id) const {
    return state_machine_.get_state(id);
}

Result<std::vector<HistoryEntry>> TaskOrchestrator::get_history(const TaskId& id) const {
    return state_machine_.get_history(id);
}

Status TaskOrchestrator::on_task_started(const TaskId& id) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    return change_state(**found, TaskStatus::InProgress);
}

Status TaskOrchestrator::on_task_completed(const TaskId& id) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    Task& task = **found;

    const auto worker = task.assigned_to.value_or("");
    if (auto moved = change_state(task, TaskStatus::Completed); !moved) {
        logger_.warn("Completion of " + id + " rejected: " + moved.error().message);
        return moved;
    }

    events_.publish(events::kTaskCompleted, {{"taskId", id}});

    if (auto unblocked = dependencies_.mark_task_complete(id); !unblocked) {
        logger_.error("Dependency graph out of sync for " + id + ": " + unblocked.error().message);
    }
    scheduler_.remove_task(id);

    logger_.info("Task completed: " + id + (worker.empty() ? "" : " by " + worker),
                 {{"taskId", id}, {"workerId", worker}});
    return {};
}

Status TaskOrchestrator::on_task_failed(const TaskId& id, const std::string& reason) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    return fail(**found, reason, true);
}

Status TaskOrchestrator::fail(Task& task, const std::string& reason, bool allow_retry) {
    if (auto moved = change_state(task, TaskStatus::Failed); !moved) {
        return moved;
    }

    events_.publish(events::kTaskFailed, {{"taskId", task.id}, {"reason", reason}});
    logger_.warn("Task failed: " + task.id + (reason.empty() ? "" : " - " + reason),
                 {{"taskId", task.id}, {"reason", reason}});

    const auto& retry = config_.orchestrator.retry;
    if (allow_retry && retry.auto_retry && task.retry_count < retry.max_retries) {
        if (auto requeued = change_state(task, TaskStatus::Pending); !requeued) {
            return requeued;
        }
        ++task.retry_count;
        logger_.info("Task " + task.id + " re-queued for retry "
                     + std::to_string(task.retry_count) + "/" + std::to_string(retry.max_retries));
    }
    return {};
}

Status TaskOrchestrator::on_task_timed_out(const TaskId& id) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    Task& task = **found;

    if (task.status != TaskStatus::InProgress) {
        return Error{ErrorCode::InvalidTransition,
                     "Task " + id + " cannot time out while "
                     + std::string{to_string(task.status)}};
    }
    return fail(task, "timeout", true);
}

Status TaskOrchestrator::retry_task(const TaskId& id) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    Task& task = **found;

    if (auto moved = change_state(task, TaskStatus::Pending); !moved) {
        return moved;
    }
    ++task.retry_count;
    logger_.info("Task " + id + " retried (attempt " + std::to_string(task.retry_count) + ")");
    return {};
}

// ─────────────────────────────────────────────
// Assignment
// ─────────────────────────────────────────────

std::optional<TaskId> TaskOrchestrator::next_assignable() const {
    for (const auto& id : scheduler_.ordered()) {
        auto it = tasks_.find(id);
        if (it == tasks_.end() || it->second.status != TaskStatus::Pending) continue;
        if (dependencies_.is_ready(id)) return id;
    }
    return std::nullopt;
}

std::vector<Worker> TaskOrchestrator::available_workers() const {
    std::unordered_set<WorkerId> busy;
    for (const auto& [id, task] : tasks_) {
        if (holds_worker(task.status) && task.assigned_to) {
            busy.insert(*task.assigned_to);
        }
    }

    auto idle = workers_.idle_workers();
    idle.erase(std::remove_if(idle.begin(), idle.end(),
                              [&](const Worker& w) { return !w.available || busy.contains(w.id); }),
               idle.end());
    return idle;
}

Assignment TaskOrchestrator::assign(Task& task, const Worker& worker, double score) {
    // Pending -> assigned is always legal here; callers checked the state.
    if (auto moved = state_machine_.transition(task.id, TaskStatus::Assigned); !moved) {
        logger_.error("Assignment of " + task.id + " rejected: " + moved.error().message);
        return Assignment{};
    }
    task.status = TaskStatus::Assigned;
    task.assigned_to = worker.id;

    events_.publish(events::kTaskAssigned, {{"taskId", task.id}, {"workerId", worker.id}});
    logger_.info("Task assigned: " + task.id + " -> " + worker.id
                 + " (score " + std::to_string(score) + ")",
                 {{"taskId", task.id}, {"workerId", worker.id}});

    return Assignment{task.id, worker.id, score};
}

std::optional<Assignment> TaskOrchestrator::assign_next() {
    EventFlush flush(events_);

    auto next = next_assignable();
    if (!next) {
        logger_.debug("No ready task to assign");
        return std::nullopt;
    }

    auto idle = available_workers();
    if (idle.empty()) {
        logger_.debug("Task " + *next + " waiting: no idle workers");
        return std::nullopt;
    }

    Task& task = tasks_.at(*next);
    auto best = matcher_.find_best_match(task.required_capabilities, idle);
    if (!best) {
        logger_.debug("Task " + task.id + " waiting: no viable worker among "
                      + std::to_string(idle.size()) + " idle");
        return std::nullopt;
    }

    auto assignment = assign(task, *best, matcher_.match_score(task.required_capabilities,
                                                               best->capabilities));
    if (assignment.task_id.empty()) return std::nullopt;
    return assignment;
}

std::vector<Assignment> TaskOrchestrator::assign_all() {
    EventFlush flush(events_);

    std::vector<Assignment> assignments;
    while (auto assignment = assign_next()) {
        assignments.push_back(std::move(*assignment));
    }
    return assignments;
}

Result<Assignment> TaskOrchestrator::assign_task(const TaskId& id, const WorkerId& worker_id) {
    EventFlush flush(events_);

    auto found = find_task(id);
    if (!found) return found.error();
    Task& task = **found;

    if (task.status != TaskStatus::Pending) {
        return Error{ErrorCode::InvalidTransition,
                     "Task " + id + " is " + std::string{to_string(task.status)}
                     + ", only pending tasks can be assigned"};
    }
    if (!dependencies_.is_ready(id)) {
        return Error{ErrorCode::InvalidTransition,
                     "Task " + id + " has unfinished dependencies"};
    }

    auto idle = available_workers();
    auto worker = std::find_if(idle.begin(), idle.end(),
                               [&](const Worker& w) { return w.id == worker_id; });
    if (worker == idle.end()) {
        return Error{ErrorCode::NoViableWorker, "Worker " + worker_id + " is not idle"};
    }

    double score = matcher_.match_score(task.required_capabilities, worker->capabilities);
    if (score <= 0.0) {
        return Error{ErrorCode::NoViableWorker,
                     "Worker " + worker_id + " has no capability required by " + id};
    }

    auto assignment = assign(task, *worker, score);
    if (assignment.task_id.empty()) {
        return Error{ErrorCode::InvalidTransition, "Task " + id + " could not be assigned"};
    }
    return assignment;
}

}  // namespace conductor
