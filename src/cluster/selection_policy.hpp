/**
 * @file selection_policy.hpp
 * @brief Worker selection policies used by the WorkerRegistry.
 * @author Dimitris Kafetzis
 *
 * A policy picks one entry out of the idle, healthy candidates. Policies are
 * called with the registry lock held and may keep their own cursor state.
 */

#pragma once

#include "core/types.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace hydramesh {

struct WorkerEntry;

/**
 * @brief Abstract interface for worker selection (runtime polymorphism).
 *
 * Chosen once from configuration, so virtual dispatch is fine here.
 */
class ISelectionPolicy {
public:
    virtual ~ISelectionPolicy() = default;

    /**
     * @brief Choose an index into @p candidates, or nullopt if it is empty.
     *
     * @p candidates is sorted by worker_id.
     */
    virtual std::optional<size_t> select(const std::vector<const WorkerEntry*>& candidates) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Round-robin over worker ids.
 *
 * Remembers the last chosen id and picks the next id after it in sorted
 * order, wrapping around. Every idle worker is reached within one rotation
 * regardless of hash-map iteration order or churn.
 */
class RoundRobinPolicy : public ISelectionPolicy {
public:
    std::optional<size_t> select(const std::vector<const WorkerEntry*>& candidates) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "round_robin"; }

private:
    WorkerId last_selected_;
};

/**
 * @brief Picks the candidate whose last assignment is oldest (never-assigned first).
 *
 * Ties break on lower load hint, then on worker id.
 */
class LeastRecentlyAssignedPolicy : public ISelectionPolicy {
public:
    std::optional<size_t> select(const std::vector<const WorkerEntry*>& candidates) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "least_recent"; }
};

/// Build the policy named in configuration; round-robin for unknown names.
std::unique_ptr<ISelectionPolicy> make_selection_policy(std::string_view name);

}  // namespace hydramesh
