/**
 * @file selection_policy.cpp
 * @brief RoundRobinPolicy and LeastRecentlyAssignedPolicy.
 * @author Dimitris Kafetzis
 */

#include "cluster/selection_policy.hpp"
#include "cluster/worker_registry.hpp"

namespace hydramesh {

std::optional<size_t> RoundRobinPolicy::select(const std::vector<const WorkerEntry*>& candidates) {
    if (candidates.empty()) return std::nullopt;

    size_t chosen = 0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i]->worker_id > last_selected_) {
            chosen = i;
            break;
        }
    }
    // No id sorts after the cursor: wrap to the first candidate (chosen == 0).

    last_selected_ = candidates[chosen]->worker_id;
    return chosen;
}

std::optional<size_t> LeastRecentlyAssignedPolicy::select(
    const std::vector<const WorkerEntry*>& candidates) {
    if (candidates.empty()) return std::nullopt;

    auto older = [](const WorkerEntry& a, const WorkerEntry& b) {
        if (a.last_assigned_at != b.last_assigned_at) {
            if (!a.last_assigned_at) return true;
            if (!b.last_assigned_at) return false;
            return *a.last_assigned_at < *b.last_assigned_at;
        }
        if (a.load_hint != b.load_hint) return a.load_hint < b.load_hint;
        return a.worker_id < b.worker_id;
    };

    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (older(*candidates[i], *candidates[best])) {
            best = i;
        }
    }
    return best;
}

std::unique_ptr<ISelectionPolicy> make_selection_policy(std::string_view name) {
    if (name == "least_recent") {
        return std::make_unique<LeastRecentlyAssignedPolicy>();
    }
    return std::make_unique<RoundRobinPolicy>();  // default
}

}  // namespace hydramesh
