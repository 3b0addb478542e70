/**
 * @file notifier.hpp
 * @brief Event Notifier interface and the notifiers the engine composes.
 *
 * Components publish lifecycle events through an injected IEventNotifier;
 * they never know who listens. Publication is fire-and-forget: a failing
 * listener must never fail the operation that raised the event.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

// ─────────────────────────────────────────────
// Event Names
// ─────────────────────────────────────────────

namespace events {

inline constexpr std::string_view kTaskAdded        = "task.added";
inline constexpr std::string_view kTaskReady        = "task.ready";
inline constexpr std::string_view kTaskAssigned     = "task.assigned";
inline constexpr std::string_view kTaskCompleted    = "task.completed";
inline constexpr std::string_view kTaskFailed       = "task.failed";
inline constexpr std::string_view kTaskStateChanged = "task.stateChanged";
inline constexpr std::string_view kTaskRemoved      = "task.removed";
inline constexpr std::string_view kDependencyAdded   = "task.dependencyAdded";
inline constexpr std::string_view kDependencyRemoved = "task.dependencyRemoved";

}  // namespace events

/// Flat key/value payload, ordered by key.
using EventPayload = std::map<std::string, std::string>;

struct Event {
    std::string name;
    EventPayload payload;
};

// ─────────────────────────────────────────────
// IEventNotifier
// ─────────────────────────────────────────────

class IEventNotifier {
public:
    virtual ~IEventNotifier() = default;
    virtual void publish(std::string_view event_name, const EventPayload& payload) = 0;
};

/**
 * @brief Publish and contain listener failures.
 *
 * Exceptions thrown by the notifier are logged at warn and dropped.
 */
void safe_publish(IEventNotifier& notifier, Logger* logger,
                  std::string_view event_name, const EventPayload& payload);

/**
 * @brief Discards every event.
 */
class NullNotifier : public IEventNotifier {
public:
    void publish(std::string_view /*event_name*/, const EventPayload& /*payload*/) override {}
};

/**
 * @brief Forwards each event to every registered notifier in order.
 */
class FanoutNotifier : public IEventNotifier {
public:
    explicit FanoutNotifier(Logger* logger = nullptr) : logger_(logger) {}

    void add(IEventNotifier& target) { targets_.push_back(&target); }
    void publish(std::string_view event_name, const EventPayload& payload) override;

private:
    std::vector<IEventNotifier*> targets_;
    Logger* logger_;
};

/**
 * @brief Queues events until flush() delivers them to the target.
 *
 * The orchestrator routes sub-component events through this queue and
 * flushes once its own mutations are done, so a listener that calls back
 * into the orchestrator always observes consistent state. A flush started
 * from inside a listener returns immediately; the outer flush delivers
 * the newly queued events in published order.
 */
class DeferredNotifier : public IEventNotifier {
public:
    explicit DeferredNotifier(IEventNotifier& target, Logger* logger = nullptr);

    void publish(std::string_view event_name, const EventPayload& payload) override;
    void flush();

    /**
     * @brief Batches nest: end_batch() flushes only when the outermost
     *        batch closes, so a public call that invokes other public
     *        calls delivers everything once, after it returns.
     */
    void begin_batch() noexcept { ++batch_depth_; }
    void end_batch();

    [[nodiscard]] size_t pending() const noexcept { return queue_.size(); }
    [[nodiscard]] size_t batch_depth() const noexcept { return batch_depth_; }

private:
    IEventNotifier& target_;
    Logger* logger_;
    std::deque<Event> queue_;
    size_t batch_depth_{0};
    bool flushing_{false};
};

}  // namespace conductor
