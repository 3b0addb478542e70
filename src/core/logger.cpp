/**
 * @file logger.cpp
 * @brief Logger implementation: NDJSON records with ISO 8601 timestamps.
 */

#include "core/logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace conductor {

Result<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return Error{ErrorCode::InvalidConfig, "Unknown log level: " + std::string{text}};
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string format_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level,
               std::string component, const IClock* clock)
    : sink_(std::move(sink))
    , min_level_(min_level)
    , component_(std::move(component))
    , clock_(clock) {}

void Logger::debug(std::string_view message, const LogFields& fields) { log(LogLevel::Debug, message, fields); }
void Logger::info(std::string_view message, const LogFields& fields)  { log(LogLevel::Info, message, fields); }
void Logger::warn(std::string_view message, const LogFields& fields)  { log(LogLevel::Warn, message, fields); }
void Logger::error(std::string_view message, const LogFields& fields) { log(LogLevel::Error, message, fields); }

void Logger::log(LogLevel level, std::string_view message, const LogFields& fields) {
    if (!enabled(level)) return;

    auto record = format_record(level, message, fields);

    std::lock_guard lock(mutex_);
    sink_->write(record);
}

std::string Logger::format_record(LogLevel level, std::string_view message,
                                  const LogFields& fields) const {
    auto now = clock_ ? clock_->now() : std::chrono::system_clock::now();

    std::string out;
    out.reserve(96 + message.size());
    out += R"({"level":")";
    out += to_string(level);
    out += R"(","ts":")";
    out += format_timestamp(now);
    out += '"';
    if (!component_.empty()) {
        out += R"(,"component":")";
        out += json_escape(component_);
        out += '"';
    }
    out += R"(,"msg":")";
    out += json_escape(message);
    out += '"';
    for (const auto& [key, value] : fields) {
        out += ",\"";
        out += json_escape(key);
        out += "\":\"";
        out += json_escape(value);
        out += '"';
    }
    out += '}';
    return out;
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

}  // namespace conductor
