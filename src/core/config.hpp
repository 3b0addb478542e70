/**
 * @file config.hpp
 * @brief Engine and host configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace conductor {

/**
 * @brief What readiness means for a task whose dependency was removed.
 */
enum class RemovedDependencyPolicy : uint8_t {
    Block,     ///< Dependent stays blocked until the host intervenes
    Satisfy    ///< Removed dependency counts as complete
};

[[nodiscard]] constexpr std::string_view to_string(RemovedDependencyPolicy policy) noexcept {
    switch (policy) {
        case RemovedDependencyPolicy::Block:   return "block";
        case RemovedDependencyPolicy::Satisfy: return "satisfy";
    }
    return "unknown";
}

struct RetryPolicyConfig {
    bool auto_retry = false;        ///< Re-enter pending after a failure
    uint32_t max_retries = 0;       ///< Automatic retries allowed per task
};

struct OrchestratorConfig {
    RetryPolicyConfig retry;
    bool reject_cycles_on_add = false;
    RemovedDependencyPolicy removed_dependency_policy = RemovedDependencyPolicy::Block;
};

struct MatcherConfig {
    double empty_requirement_score = 1.0;
    bool case_insensitive = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path log_dir;      ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

struct EventsConfig {
    bool journal = true;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    OrchestratorConfig orchestrator;
    MatcherConfig matcher;
    LoggingConfig logging;
    EventsConfig events;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Keys that are absent keep their defaults. Out-of-range or unknown enum
 * values are rejected with ErrorCode::InvalidConfig.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace conductor
