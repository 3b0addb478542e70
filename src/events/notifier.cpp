/**
 * @file notifier.cpp
 * @brief Fan-out and deferred notifier implementations.
 */

#include "events/notifier.hpp"

#include <exception>

namespace conductor {

namespace {

/// Clears the reentrancy flag however the flush loop exits.
class FlushGuard {
public:
    explicit FlushGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~FlushGuard() { flag_ = false; }

    FlushGuard(const FlushGuard&) = delete;
    FlushGuard& operator=(const FlushGuard&) = delete;

private:
    bool& flag_;
};

}  // namespace

void safe_publish(IEventNotifier& notifier, Logger* logger,
                  std::string_view event_name, const EventPayload& payload) {
    try {
        notifier.publish(event_name, payload);
    } catch (const std::exception& ex) {
        if (logger) {
            logger->warn("Listener for " + std::string{event_name} + " failed: " + ex.what());
        }
    } catch (...) {
        if (logger) {
            logger->warn("Listener for " + std::string{event_name}
                         + " failed: unknown exception");
        }
    }
}

// ── FanoutNotifier ───────────────────────────

void FanoutNotifier::publish(std::string_view event_name, const EventPayload& payload) {
    for (auto* target : targets_) {
        safe_publish(*target, logger_, event_name, payload);
    }
}

// ── DeferredNotifier ─────────────────────────

DeferredNotifier::DeferredNotifier(IEventNotifier& target, Logger* logger)
    : target_(target), logger_(logger) {}

void DeferredNotifier::publish(std::string_view event_name, const EventPayload& payload) {
    queue_.push_back(Event{std::string{event_name}, payload});
}

void DeferredNotifier::end_batch() {
    if (batch_depth_ > 0) --batch_depth_;
    if (batch_depth_ == 0) flush();
}

void DeferredNotifier::flush() {
    if (flushing_) return;
    FlushGuard guard(flushing_);

    while (!queue_.empty()) {
        Event event = std::move(queue_.front());
        queue_.pop_front();
        safe_publish(target_, logger_, event.name, event.payload);
    }
}

}  // namespace conductor
