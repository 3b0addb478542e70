/**
 * @file workload_file.cpp
 * @brief Workload loading from TOML files using toml++.
 */

#include "workload/workload_file.hpp"

#include <toml++/toml.hpp>

namespace conductor {

namespace {

/// Reads an optional array of strings. Non-string elements are rejected.
Result<std::vector<std::string>> string_list(const toml::table& entry,
                                             std::string_view key,
                                             const std::string& owner) {
    std::vector<std::string> out;
    auto node = entry[key];
    if (!node) return out;

    const auto* arr = node.as_array();
    if (arr == nullptr) {
        return Error{ErrorCode::InvalidConfig,
                     owner + ": '" + std::string{key} + "' must be an array of strings"};
    }

    for (const auto& element : *arr) {
        auto value = element.value<std::string>();
        if (!value) {
            return Error{ErrorCode::InvalidConfig,
                         owner + ": '" + std::string{key} + "' must only contain strings"};
        }
        out.push_back(std::move(*value));
    }
    return out;
}

Result<Worker> build_worker(const toml::table& entry, size_t index) {
    Worker worker;
    worker.id = entry["id"].value_or(std::string{});
    if (worker.id.empty()) {
        return Error{ErrorCode::InvalidConfig,
                     "worker #" + std::to_string(index) + " has no id"};
    }

    auto caps = string_list(entry, "capabilities", "worker " + worker.id);
    if (!caps) return caps.error();
    worker.capabilities = CapabilitySet(caps->begin(), caps->end());
    worker.available = entry["available"].value_or(true);
    return worker;
}

Result<Task> build_task(const toml::table& entry, size_t index) {
    Task task;
    task.id = entry["id"].value_or(std::string{});
    if (task.id.empty()) {
        return Error{ErrorCode::InvalidConfig,
                     "task #" + std::to_string(index) + " has no id"};
    }
    const std::string owner = "task " + task.id;

    task.title = entry["title"].value_or(task.id);
    task.description = entry["description"].value_or(std::string{});

    auto priority_name = entry["priority"].value_or(std::string{"normal"});
    auto priority = parse_priority(priority_name);
    if (!priority) {
        return Error{ErrorCode::InvalidConfig,
                     owner + ": unknown priority \"" + priority_name + "\""};
    }
    task.priority = *priority;

    auto requires_list = string_list(entry, "requires", owner);
    if (!requires_list) return requires_list.error();
    task.required_capabilities = CapabilitySet(requires_list->begin(), requires_list->end());

    auto depends_on = string_list(entry, "depends_on", owner);
    if (!depends_on) return depends_on.error();
    task.depends_on = std::move(depends_on).value();

    auto prefers = string_list(entry, "prefers", owner);
    if (!prefers) return prefers.error();
    task.prefers = std::move(prefers).value();

    auto conflicts = string_list(entry, "conflicts_with", owner);
    if (!conflicts) return conflicts.error();
    task.conflicts_with = std::move(conflicts).value();

    return task;
}

Result<Workload> build_workload(const toml::table& tbl) {
    Workload workload;

    if (auto node = tbl["worker"]; node) {
        const auto* arr = node.as_array();
        if (arr == nullptr) {
            return Error{ErrorCode::InvalidConfig, "'worker' must be an array of tables"};
        }
        for (size_t i = 0; i < arr->size(); ++i) {
            const auto* entry = (*arr)[i].as_table();
            if (entry == nullptr) {
                return Error{ErrorCode::InvalidConfig,
                             "worker #" + std::to_string(i) + " is not a table"};
            }
            auto worker = build_worker(*entry, i);
            if (!worker) return worker.error();
            workload.workers.push_back(std::move(worker).value());
        }
    }

    if (auto node = tbl["task"]; node) {
        const auto* arr = node.as_array();
        if (arr == nullptr) {
            return Error{ErrorCode::InvalidConfig, "'task' must be an array of tables"};
        }
        for (size_t i = 0; i < arr->size(); ++i) {
            const auto* entry = (*arr)[i].as_table();
            if (entry == nullptr) {
                return Error{ErrorCode::InvalidConfig,
                             "task #" + std::to_string(i) + " is not a table"};
            }
            auto task = build_task(*entry, i);
            if (!task) return task.error();
            workload.tasks.push_back(std::move(task).value());
        }
    }

    return workload;
}

}  // anonymous namespace

Result<Workload> load_workload(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Workload file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return build_workload(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Workload> parse_workload(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return build_workload(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace conductor
