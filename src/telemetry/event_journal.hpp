/**
 * @file event_journal.hpp
 * @brief Event notifier that records every engine event as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "events/notifier.hpp"

#include <memory>
#include <mutex>

namespace conductor {

/**
 * @brief Writes `{"event":<name>,<payload fields...>}` lines to a sink.
 *
 * Hosts register it with a FanoutNotifier beside their own listeners to
 * obtain an audit trail from which task history can be rebuilt.
 */
class EventJournal : public IEventNotifier {
public:
    explicit EventJournal(std::unique_ptr<ILogSink> sink);

    void publish(std::string_view event_name, const EventPayload& payload) override;
    void flush();

    [[nodiscard]] uint64_t events_written() const noexcept { return events_written_; }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    uint64_t events_written_{0};
};

}  // namespace conductor
