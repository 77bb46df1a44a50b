/**
 * @file worker_registry.hpp
 * @brief Heartbeat-driven registry of inference workers.
 * @author Dimitris Kafetzis
 *
 * Fed by the head's worker receive loop, read by the TaskRouter, pruned by the
 * maintenance loop. Thread-safe via shared_mutex; no operation blocks on I/O.
 */

#pragma once

#include "cluster/selection_policy.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace hydramesh {

/**
 * @brief Liveness and load state of one worker.
 */
struct WorkerEntry {
    WorkerId worker_id;
    Endpoint address;
    std::vector<uint8_t> capabilities;
    uint8_t load_hint{0};

    SteadyTime registered_at;
    SteadyTime last_heartbeat_at;
    std::optional<SteadyTime> last_assigned_at;

    WorkerStatus status{WorkerStatus::Healthy};
    std::optional<TaskKey> current_task;

    uint64_t tasks_completed{0};
    uint64_t tasks_failed{0};
    double avg_latency_ms{0.0};
};

/**
 * @brief A worker removed by sweep(), with whatever task it still owned.
 */
struct EvictedWorker {
    WorkerId worker_id;
    Endpoint address;
    std::optional<TaskKey> in_flight;
};

struct WorkerSummary {
    WorkerId worker_id;
    Endpoint address;
    WorkerStatus status;
    uint8_t load_hint;
    uint64_t tasks_completed;
    uint64_t tasks_failed;
    double avg_latency_ms;
    std::chrono::milliseconds heartbeat_age;
};

struct RegistryStats {
    size_t total{0};
    size_t healthy{0};
    size_t busy{0};
    size_t unreachable{0};
    uint64_t evicted_total{0};
    std::vector<WorkerSummary> workers;
};

class WorkerRegistry {
public:
    explicit WorkerRegistry(std::chrono::milliseconds liveness_timeout,
                            std::unique_ptr<ISelectionPolicy> policy = nullptr);

    /**
     * @brief Insert or refresh a worker. Returns true for a first registration.
     *
     * A worker that re-binds to a new address keeps its identity and any
     * task it owns.
     */
    bool record_heartbeat(const WorkerId& worker_id,
                          const Endpoint& address,
                          std::vector<uint8_t> capabilities,
                          uint8_t load_hint,
                          SteadyTime now);

    /**
     * @brief Pick an idle worker with the configured policy.
     *
     * Fails with ErrorCode::NoWorkers when no entry is idle and healthy.
     * Entries past the liveness timeout remain candidates until sweep()
     * removes them. Workers whose last heartbeat reported load are only
     * offered when no unloaded worker is idle.
     */
    Result<WorkerEntry> select_worker(SteadyTime now);

    /// Assign @p task to the worker. False if the worker is unknown.
    bool mark_busy(const WorkerId& worker_id, const TaskKey& task, SteadyTime now);

    /**
     * @brief Release the worker's task slot if it still holds @p task.
     *
     * No-op for unknown workers and for a slot that has since been given to
     * another task, so a stale release cannot free the current owner.
     */
    void mark_idle(const WorkerId& worker_id, const TaskKey& task);

    /// Fold one finished task into the worker's counters. A success clears the load hint.
    void record_completion(const WorkerId& worker_id, Duration latency, bool success);

    /**
     * @brief Evict every worker whose last heartbeat is older than the timeout.
     *
     * Must run on a fixed interval independent of traffic; the returned set
     * lets the router fail or reassign in-flight tasks.
     */
    std::vector<EvictedWorker> sweep(SteadyTime now);

    [[nodiscard]] std::optional<WorkerEntry> find(const WorkerId& worker_id) const;
    [[nodiscard]] std::optional<WorkerStatus> status_at(const WorkerId& worker_id, SteadyTime now) const;
    [[nodiscard]] RegistryStats stats(SteadyTime now) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::chrono::milliseconds liveness_timeout() const noexcept { return timeout_; }
    [[nodiscard]] std::string_view policy_name() const noexcept { return policy_->name(); }

private:
    [[nodiscard]] WorkerStatus status_of(const WorkerEntry& entry, SteadyTime now) const noexcept;

    std::chrono::milliseconds timeout_;
    std::unique_ptr<ISelectionPolicy> policy_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<WorkerId, WorkerEntry> workers_;
    uint64_t evicted_total_{0};
};

}  // namespace hydramesh
