/**
 * @file workload_file.hpp
 * @brief Worker and task declarations loaded from TOML.
 *
 * Format:
 * @code
 * [[worker]]
 * id = "gpu-1"
 * capabilities = ["cuda", "python"]
 * available = true            # optional, default true
 *
 * [[task]]
 * id = "train"
 * title = "Train model"
 * description = "..."         # optional
 * priority = "high"           # optional, default "normal"
 * requires = ["cuda"]         # optional
 * depends_on = ["prepare"]    # optional
 * prefers = []                # optional
 * conflicts_with = []         # optional
 * @endcode
 */

#pragma once

#include "core/model.hpp"
#include "core/result.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace conductor {

struct Workload {
    std::vector<Worker> workers;
    std::vector<Task> tasks;     ///< File order
};

Result<Workload> load_workload(const std::filesystem::path& path);
Result<Workload> parse_workload(std::string_view toml_text);

}  // namespace conductor
