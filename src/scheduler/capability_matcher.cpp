/**
 * @file capability_matcher.cpp
 * @brief CapabilityMatcher: set-overlap scoring over worker candidates.
 *
 * Algorithm:
 *   For each candidate in input order:
 *     score(worker) = |required ∩ worker.capabilities| / |required|
 *   Return argmax(score), first wins on ties, nothing if max == 0.
 *
 * Complexity: O(W × R log C) for W workers, R required and C declared
 * capabilities per worker.
 */

#include "scheduler/capability_matcher.hpp"

#include <algorithm>
#include <cctype>

namespace conductor {

namespace {

std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

CapabilitySet lowercase_all(const CapabilitySet& caps) {
    CapabilitySet out;
    for (const auto& cap : caps) {
        out.insert(lowercase(cap));
    }
    return out;
}

size_t count_overlap(const CapabilitySet& required, const CapabilitySet& available) {
    return static_cast<size_t>(std::count_if(
        required.begin(), required.end(),
        [&](const Capability& cap) { return available.contains(cap); }));
}

}  // anonymous namespace

double CapabilityMatcher::match_score(const CapabilitySet& required,
                                      const CapabilitySet& available) const {
    if (required.empty()) {
        return config_.empty_requirement_score;
    }

    size_t matched = 0;
    size_t total = required.size();
    if (config_.case_insensitive) {
        auto req = lowercase_all(required);
        matched = count_overlap(req, lowercase_all(available));
        total = req.size();
    } else {
        matched = count_overlap(required, available);
    }

    return static_cast<double>(matched) / static_cast<double>(total);
}

std::optional<Worker> CapabilityMatcher::find_best_match(const CapabilitySet& required,
                                                         const std::vector<Worker>& candidates) const {
    const Worker* best = nullptr;
    double best_score = 0.0;

    for (const auto& worker : candidates) {
        double score = match_score(required, worker.capabilities);
        if (score > best_score) {
            best_score = score;
            best = &worker;
        }
    }

    if (best == nullptr) return std::nullopt;
    return *best;
}

std::vector<WorkerScore> CapabilityMatcher::rank(const CapabilitySet& required,
                                                 const std::vector<Worker>& candidates) const {
    std::vector<WorkerScore> ranked;
    ranked.reserve(candidates.size());
    for (const auto& worker : candidates) {
        ranked.push_back({worker.id, match_score(required, worker.capabilities)});
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const WorkerScore& a, const WorkerScore& b) { return a.score > b.score; });
    return ranked;
}

}  // namespace conductor
