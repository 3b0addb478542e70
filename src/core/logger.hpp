/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end emitting one NDJSON
 * line per record:
 *
 *   {"level":"info","ts":"...Z","component":"orchestrator","msg":"...","taskId":"t1"}
 *
 * `component` is omitted when empty; structured fields follow `msg` in the
 * order given. Timestamps come from the engine clock when one is attached,
 * so records line up with task history.
 */

#pragma once

#include "core/clock.hpp"
#include "core/result.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conductor {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/**
 * @brief Parse a configuration level name ("debug", "info", "warn", "error").
 */
Result<LogLevel> parse_log_level(std::string_view text);

/// Escape a string for embedding inside a JSON string literal.
std::string json_escape(std::string_view text);

/// ISO 8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.250Z".
std::string format_timestamp(Timestamp ts);

/// Extra string fields appended to a record, e.g. {{"taskId", id}}.
using LogFields = std::vector<std::pair<std::string, std::string>>;

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * @p clock may be null, in which case records are stamped with the system
 * clock. It must outlive the logger.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    std::string component = {},
                    const IClock* clock = nullptr);

    void debug(std::string_view message, const LogFields& fields = {});
    void info(std::string_view message, const LogFields& fields = {});
    void warn(std::string_view message, const LogFields& fields = {});
    void error(std::string_view message, const LogFields& fields = {});

    void log(LogLevel level, std::string_view message, const LogFields& fields = {});
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level >= min_level_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] const std::string& component() const noexcept { return component_; }

private:
    [[nodiscard]] std::string format_record(LogLevel level, std::string_view message,
                                            const LogFields& fields) const;

    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::string component_;
    const IClock* clock_;
    mutable std::mutex mutex_;
};

}  // namespace conductor
