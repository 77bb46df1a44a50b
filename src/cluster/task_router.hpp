/**
 * @file task_router.hpp
 * @brief Per-task state machine: admission, dispatch, retry and completion.
 * @author Dimitris Kafetzis
 *
 * Lifecycle of one TaskRecord:
 *
 *   PENDING ──select_worker──► DISPATCHED ──TASK sent──► AWAITING_RESULT
 *      ▲                                                     │
 *      └──── worker evicted / WORKER_BUSY (retry budget) ◄───┤
 *                                                            ├──► COMPLETE
 *                                                            └──► FAILED
 *
 * Every handler runs under the router mutex and returns the datagrams to
 * send as a list of Outbound entries. The caller enqueues them; nothing in
 * here touches a socket. The router calls into the WorkerRegistry while
 * holding its own lock; the registry never calls back.
 */

#pragma once

#include "cluster/worker_registry.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/message.hpp"
#include "protocol/payloads.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hydramesh {

/**
 * @brief Router-side state for one admitted task.
 *
 * The worker leg uses a head-assigned dispatch sequence, fresh on every
 * (re)dispatch, so a late RESULT for an abandoned attempt cannot be taken
 * for the current one.
 */
struct TaskRecord {
    TaskKey key;
    uint32_t dispatch_sequence{0};
    std::optional<WorkerId> assigned_worker_id;
    Endpoint worker_address;
    TaskStatus status{TaskStatus::Pending};
    std::vector<uint8_t> request;            ///< Kept for reassignment
    SteadyTime submitted_at;
    SteadyTime deadline;
    SteadyTime dispatched_at;
    uint32_t retry_count{0};
};

enum class Channel : uint8_t {
    ToClient,    ///< Send from the client-facing socket
    ToWorker     ///< Send from the worker-facing socket
};

struct Outbound {
    Channel channel;
    Endpoint destination;
    Message message;
};

struct RouterOptions {
    std::chrono::milliseconds request_timeout{300000};
    uint32_t max_retries = 2;
    size_t max_pending = 10000;
    size_t max_fragment_bytes = 60000;
};

struct RouterStats {
    uint64_t submitted{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timed_out{0};
    uint64_t reassigned{0};
    uint64_t rejected{0};          ///< Never dispatched: no workers or over capacity
    uint64_t duplicates{0};
    uint64_t stale_results{0};
    size_t in_flight{0};
    double avg_latency_ms{0.0};
};

/// Final outcome of a task, reported to the optional observer.
struct TaskOutcome {
    TaskKey key;
    std::optional<WorkerId> worker_id;       ///< Set when a worker produced the result
    TaskStatus status;
    std::optional<ErrorCode> error;
    Duration latency{0};
    uint32_t retries{0};
};

class TaskRouter {
public:
    TaskRouter(WorkerRegistry& registry, RouterOptions options);

    /**
     * @brief Admit a client TASK and dispatch it.
     *
     * Replies ERROR(NO_WORKERS) or ERROR(CAPACITY) immediately when the
     * task cannot be admitted. A (client, sequence) already in flight is
     * ignored.
     */
    std::vector<Outbound> submit(const Endpoint& client, const Message& task, SteadyTime now);

    /**
     * @brief A whole result arrived for @p dispatch_sequence from @p worker.
     *
     * Results with no matching record, or from an address that is neither
     * the dispatch address nor the owning worker's current registered
     * address, are counted as stale and dropped.
     */
    std::vector<Outbound> complete(const Endpoint& worker,
                                   uint32_t dispatch_sequence,
                                   std::vector<uint8_t> result,
                                   SteadyTime now);

    /// The worker answered a dispatch with an ERROR message.
    std::vector<Outbound> fail_from_worker(const Endpoint& worker,
                                           uint32_t dispatch_sequence,
                                           const ErrorPayload& error,
                                           SteadyTime now);

    /// Reassign or fail the in-flight task each evicted worker still owns.
    std::vector<Outbound> handle_evictions(const std::vector<EvictedWorker>& evicted, SteadyTime now);

    /// Fail every task whose deadline has passed.
    std::vector<Outbound> expire(SteadyTime now);

    /// The chunked result for @p dispatch_sequence was abandoned by the reassembler.
    std::vector<Outbound> fail_reassembly(uint32_t dispatch_sequence, SteadyTime now);

    [[nodiscard]] RouterStats stats() const;
    [[nodiscard]] size_t in_flight() const;
    [[nodiscard]] std::optional<TaskRecord> find(const TaskKey& key) const;

    /// Copy of every live record (health reporting, ownership checks).
    [[nodiscard]] std::vector<TaskRecord> snapshot() const;

    /// Invoked under the router lock for every task that reaches COMPLETE or FAILED.
    void on_outcome(std::function<void(const TaskOutcome&)> callback);

private:
    using RecordMap = std::unordered_map<TaskKey, TaskRecord, TaskKeyHash>;

    /// Select a worker and emit the TASK. False when no worker could be taken.
    bool dispatch_locked(TaskRecord& record, SteadyTime now, std::vector<Outbound>& out);

    /// Give up on a previous attempt and dispatch again if the budget allows.
    bool retry_locked(TaskRecord& record, SteadyTime now, std::vector<Outbound>& out);

    void release_worker_locked(TaskRecord& record, bool failed, SteadyTime now);

    /// True when @p source speaks for the record's worker. Follows a re-bound owner.
    bool owned_by_locked(TaskRecord& record, const Endpoint& source);

    void fail_locked(RecordMap::iterator it, ErrorCode code, const std::string& text,
                     SteadyTime now, std::vector<Outbound>& out);

    RecordMap::iterator find_dispatch_locked(uint32_t dispatch_sequence);
    uint32_t next_dispatch_sequence_locked();
    void report_locked(const TaskRecord& record, std::optional<ErrorCode> error, SteadyTime now);

    WorkerRegistry& registry_;
    RouterOptions options_;

    mutable std::mutex mutex_;
    RecordMap records_;
    std::unordered_map<uint32_t, TaskKey> by_dispatch_;
    uint32_t dispatch_counter_{0};

    RouterStats stats_;
    double latency_sum_ms_{0.0};
    std::function<void(const TaskOutcome&)> outcome_callback_;
};

}  // namespace hydramesh
