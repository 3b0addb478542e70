/**
 * @file event_journal.cpp
 * @brief EventJournal implementation.
 */

#include "telemetry/event_journal.hpp"

#include <sstream>

namespace conductor {

EventJournal::EventJournal(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventJournal::publish(std::string_view event_name, const EventPayload& payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event_name) << "\"";
    for (const auto& [key, value] : payload) {
        oss << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
    }
    oss << "}";

    std::lock_guard lock(write_mutex_);
    sink_->write(oss.str());
    ++events_written_;
}

void EventJournal::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace conductor
