/**
 * @file worker_registry.cpp
 * @brief WorkerRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "cluster/worker_registry.hpp"

#include <algorithm>
#include <mutex>

namespace hydramesh {

WorkerRegistry::WorkerRegistry(std::chrono::milliseconds liveness_timeout,
                               std::unique_ptr<ISelectionPolicy> policy)
    : timeout_(liveness_timeout)
    , policy_(policy ? std::move(policy) : std::make_unique<RoundRobinPolicy>()) {}

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

bool WorkerRegistry::record_heartbeat(const WorkerId& worker_id,
                                      const Endpoint& address,
                                      std::vector<uint8_t> capabilities,
                                      uint8_t load_hint,
                                      SteadyTime now) {
    std::unique_lock lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) {
        WorkerEntry entry;
        entry.worker_id = worker_id;
        entry.address = address;
        entry.capabilities = std::move(capabilities);
        entry.load_hint = load_hint;
        entry.registered_at = now;
        entry.last_heartbeat_at = now;
        entry.status = WorkerStatus::Healthy;
        workers_.emplace(worker_id, std::move(entry));
        return true;
    }

    auto& entry = it->second;
    entry.address = address;
    entry.capabilities = std::move(capabilities);
    entry.load_hint = load_hint;
    entry.last_heartbeat_at = now;
    return false;
}

Result<WorkerEntry> WorkerRegistry::select_worker(SteadyTime now) {
    (void)now;  // staleness is decided by sweep(), not here

    std::unique_lock lock(mutex_);

    std::vector<const WorkerEntry*> candidates;
    candidates.reserve(workers_.size());
    for (const auto& [id, entry] : workers_) {
        if (entry.status == WorkerStatus::Healthy && !entry.current_task) {
            candidates.push_back(&entry);
        }
    }

    if (candidates.empty()) {
        return Error{ErrorCode::NoWorkers, "No workers available"};
    }

    // A loaded worker is still computing something the head gave up on.
    bool any_unloaded = std::any_of(candidates.begin(), candidates.end(),
                                    [](const WorkerEntry* e) { return e->load_hint == 0; });
    if (any_unloaded) {
        std::erase_if(candidates, [](const WorkerEntry* e) { return e->load_hint > 0; });
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const WorkerEntry* a, const WorkerEntry* b) { return a->worker_id < b->worker_id; });

    auto chosen = policy_->select(candidates);
    if (!chosen || *chosen >= candidates.size()) {
        return Error{ErrorCode::NoWorkers, "Selection policy declined every worker"};
    }
    return *candidates[*chosen];
}

bool WorkerRegistry::mark_busy(const WorkerId& worker_id, const TaskKey& task, SteadyTime now) {
    std::unique_lock lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return false;

    auto& entry = it->second;
    if (entry.current_task && *entry.current_task != task) {
        return false;  // one task per worker at a time
    }
    entry.current_task = task;
    entry.status = WorkerStatus::Busy;
    entry.last_assigned_at = now;
    return true;
}

void WorkerRegistry::mark_idle(const WorkerId& worker_id, const TaskKey& task) {
    std::unique_lock lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return;
    if (it->second.current_task != task) return;

    it->second.current_task.reset();
    it->second.status = WorkerStatus::Healthy;
}

void WorkerRegistry::record_completion(const WorkerId& worker_id, Duration latency, bool success) {
    std::unique_lock lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return;

    auto& entry = it->second;
    if (success) {
        entry.load_hint = 0;
        ++entry.tasks_completed;
        auto n = static_cast<double>(entry.tasks_completed);
        auto latency_ms = static_cast<double>(latency.count()) / 1000.0;
        entry.avg_latency_ms = ((n - 1.0) * entry.avg_latency_ms + latency_ms) / n;
    } else {
        ++entry.tasks_failed;
    }
}

std::vector<EvictedWorker> WorkerRegistry::sweep(SteadyTime now) {
    std::vector<EvictedWorker> evicted;

    std::unique_lock lock(mutex_);
    for (auto it = workers_.begin(); it != workers_.end(); ) {
        if ((now - it->second.last_heartbeat_at) > timeout_) {
            evicted.push_back(EvictedWorker{
                .worker_id = it->first,
                .address = it->second.address,
                .in_flight = it->second.current_task
            });
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    evicted_total_ += evicted.size();
    return evicted;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

WorkerStatus WorkerRegistry::status_of(const WorkerEntry& entry, SteadyTime now) const noexcept {
    if ((now - entry.last_heartbeat_at) > timeout_) return WorkerStatus::Unreachable;
    return entry.current_task ? WorkerStatus::Busy : WorkerStatus::Healthy;
}

std::optional<WorkerEntry> WorkerRegistry::find(const WorkerId& worker_id) const {
    std::shared_lock lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return std::nullopt;
    return it->second;
}

std::optional<WorkerStatus> WorkerRegistry::status_at(const WorkerId& worker_id, SteadyTime now) const {
    std::shared_lock lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return std::nullopt;
    return status_of(it->second, now);
}

RegistryStats WorkerRegistry::stats(SteadyTime now) const {
    std::shared_lock lock(mutex_);

    RegistryStats stats;
    stats.total = workers_.size();
    stats.evicted_total = evicted_total_;
    stats.workers.reserve(workers_.size());

    for (const auto& [id, entry] : workers_) {
        auto status = status_of(entry, now);
        switch (status) {
            case WorkerStatus::Healthy:     ++stats.healthy; break;
            case WorkerStatus::Busy:        ++stats.busy; break;
            case WorkerStatus::Unreachable: ++stats.unreachable; break;
        }
        stats.workers.push_back(WorkerSummary{
            .worker_id = id,
            .address = entry.address,
            .status = status,
            .load_hint = entry.load_hint,
            .tasks_completed = entry.tasks_completed,
            .tasks_failed = entry.tasks_failed,
            .avg_latency_ms = entry.avg_latency_ms,
            .heartbeat_age = std::chrono::duration_cast<std::chrono::milliseconds>(
                now - entry.last_heartbeat_at)
        });
    }

    std::sort(stats.workers.begin(), stats.workers.end(),
              [](const WorkerSummary& a, const WorkerSummary& b) { return a.worker_id < b.worker_id; });
    return stats;
}

size_t WorkerRegistry::size() const {
    std::shared_lock lock(mutex_);
    return workers_.size();
}

}  // namespace hydramesh
