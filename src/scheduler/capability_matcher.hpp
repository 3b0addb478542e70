/**
 * @file capability_matcher.hpp
 * @brief Worker fit scoring and best-candidate selection.
 */

#pragma once

#include "core/config.hpp"
#include "core/model.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace conductor {

struct WorkerScore {
    WorkerId worker_id;
    double score;
};

/**
 * @brief Pure capability matcher.
 *
 * score = |required ∩ available| / |required|, in [0, 1]. An empty
 * requirement scores MatcherConfig::empty_requirement_score. Selection
 * keeps the first of equally scored candidates, so results depend only
 * on the inputs and their order.
 */
class CapabilityMatcher {
public:
    CapabilityMatcher() = default;
    explicit CapabilityMatcher(MatcherConfig config) : config_(config) {}

    [[nodiscard]] double match_score(const CapabilitySet& required,
                                     const CapabilitySet& available) const;

    /**
     * @brief Highest scoring candidate, or nullopt when every candidate
     *        scores exactly zero (or there are none).
     *
     * A partial match is still returned.
     */
    [[nodiscard]] std::optional<Worker> find_best_match(const CapabilitySet& required,
                                                        const std::vector<Worker>& candidates) const;

    /// Every candidate with its score, best first; equal scores keep input order.
    [[nodiscard]] std::vector<WorkerScore> rank(const CapabilitySet& required,
                                                const std::vector<Worker>& candidates) const;

    [[nodiscard]] const MatcherConfig& config() const noexcept { return config_; }

private:
    MatcherConfig config_;
};

}  // namespace conductor
