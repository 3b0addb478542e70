/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace conductor {

namespace {

constexpr int64_t kMaxRetriesLimit   = 1000;
constexpr int64_t kMaxFileSizeMbLimit = 1024 * 1024;
constexpr int64_t kRotateCountLimit  = 1000;

/// Integer field of @p table within [min, max], or @p fallback when absent.
Result<uint32_t> bounded_uint(const toml::node_view<const toml::node>& table,
                              std::string_view section, std::string_view key,
                              int64_t fallback, int64_t min, int64_t max) {
    auto value = table[key].value_or(fallback);
    if (value < min || value > max) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{section} + "." + std::string{key} + " must be within ["
                     + std::to_string(min) + ", " + std::to_string(max) + "], got "
                     + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

Result<Config> build_config(const toml::table& tbl) {
    Config config;

    // [orchestrator]
    if (auto orch = tbl["orchestrator"]; orch.is_table()) {
        config.orchestrator.retry.auto_retry = orch["auto_retry"].value_or(false);

        auto max_retries = bounded_uint(orch, "orchestrator", "max_retries",
                                        0, 0, kMaxRetriesLimit);
        if (!max_retries) return max_retries.error();
        config.orchestrator.retry.max_retries = *max_retries;

        config.orchestrator.reject_cycles_on_add =
            orch["reject_cycles_on_add"].value_or(false);

        auto policy = orch["removed_dependency_policy"].value_or(std::string{"block"});
        if (policy == "block") {
            config.orchestrator.removed_dependency_policy = RemovedDependencyPolicy::Block;
        } else if (policy == "satisfy") {
            config.orchestrator.removed_dependency_policy = RemovedDependencyPolicy::Satisfy;
        } else {
            return Error{ErrorCode::InvalidConfig,
                         "orchestrator.removed_dependency_policy must be \"block\" or "
                         "\"satisfy\", got \"" + policy + "\""};
        }
    }

    // [matcher]
    if (auto matcher = tbl["matcher"]; matcher.is_table()) {
        auto score = matcher["empty_requirement_score"].value_or(1.0);
        if (score < 0.0 || score > 1.0) {
            return Error{ErrorCode::InvalidConfig,
                         "matcher.empty_requirement_score must be within [0, 1]"};
        }
        config.matcher.empty_requirement_score = score;
        config.matcher.case_insensitive = matcher["case_insensitive"].value_or(false);
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        config.logging.level = logging["level"].value_or(std::string{"info"});
        if (auto level = parse_log_level(config.logging.level); !level) {
            return level.error();
        }
        config.logging.log_dir = logging["log_dir"].value_or(std::string{});

        auto max_size = bounded_uint(logging, "logging", "max_file_size_mb",
                                     50, 1, kMaxFileSizeMbLimit);
        if (!max_size) return max_size.error();
        config.logging.max_file_size_mb = *max_size;

        auto rotate = bounded_uint(logging, "logging", "rotate_count",
                                   5, 1, kRotateCountLimit);
        if (!rotate) return rotate.error();
        config.logging.rotate_count = *rotate;
    }

    // [events]
    if (auto events = tbl["events"]; events.is_table()) {
        config.events.journal = events["journal"].value_or(true);
    }

    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace conductor
