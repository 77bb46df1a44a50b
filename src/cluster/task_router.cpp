/**
 * @file task_router.cpp
 * @brief TaskRouter implementation.
 * @author Dimitris Kafetzis
 */

#include "cluster/task_router.hpp"
#include "protocol/chunking.hpp"

#include <algorithm>

namespace hydramesh {

namespace {

double to_ms(SteadyTime::duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

}  // anonymous namespace

TaskRouter::TaskRouter(WorkerRegistry& registry, RouterOptions options)
    : registry_(registry)
    , options_(options) {}

void TaskRouter::on_outcome(std::function<void(const TaskOutcome&)> callback) {
    std::lock_guard lock(mutex_);
    outcome_callback_ = std::move(callback);
}

// ─────────────────────────────────────────────
// Client side
// ─────────────────────────────────────────────

std::vector<Outbound> TaskRouter::submit(const Endpoint& client, const Message& task, SteadyTime now) {
    std::vector<Outbound> out;
    TaskKey key{client, task.sequence};

    std::lock_guard lock(mutex_);

    if (records_.contains(key)) {
        ++stats_.duplicates;
        return out;
    }

    if (records_.size() >= options_.max_pending) {
        ++stats_.rejected;
        out.push_back(Outbound{Channel::ToClient, client,
            make_error_message(task.sequence, ErrorCode::Capacity,
                               "too many pending tasks (" + std::to_string(options_.max_pending) + ")")});
        return out;
    }

    ++stats_.submitted;

    TaskRecord record;
    record.key = key;
    record.status = TaskStatus::Pending;
    record.request = task.payload;
    record.submitted_at = now;
    record.deadline = now + options_.request_timeout;

    if (!dispatch_locked(record, now, out)) {
        ++stats_.rejected;
        record.status = TaskStatus::Failed;
        report_locked(record, ErrorCode::NoWorkers, now);
        out.push_back(Outbound{Channel::ToClient, client,
            make_error_message(task.sequence, ErrorCode::NoWorkers, "no workers available")});
        return out;
    }

    records_.emplace(key, std::move(record));
    return out;
}

// ─────────────────────────────────────────────
// Worker side
// ─────────────────────────────────────────────

std::vector<Outbound> TaskRouter::complete(const Endpoint& worker,
                                           uint32_t dispatch_sequence,
                                           std::vector<uint8_t> result,
                                           SteadyTime now) {
    std::vector<Outbound> out;
    std::lock_guard lock(mutex_);

    auto it = find_dispatch_locked(dispatch_sequence);
    if (it == records_.end() || !owned_by_locked(it->second, worker)) {
        ++stats_.stale_results;
        return out;
    }

    auto& record = it->second;
    if (record.assigned_worker_id) {
        registry_.record_completion(*record.assigned_worker_id,
            std::chrono::duration_cast<Duration>(now - record.dispatched_at), true);
        registry_.mark_idle(*record.assigned_worker_id, record.key);
    }

    record.status = TaskStatus::Complete;
    ++stats_.completed;
    latency_sum_ms_ += to_ms(now - record.submitted_at);
    report_locked(record, std::nullopt, now);

    for (auto& msg : make_payload_messages(MessageType::Result, record.key.sequence,
                                           std::move(result), options_.max_fragment_bytes)) {
        out.push_back(Outbound{Channel::ToClient, record.key.client, std::move(msg)});
    }

    by_dispatch_.erase(record.dispatch_sequence);
    records_.erase(it);
    return out;
}

std::vector<Outbound> TaskRouter::fail_from_worker(const Endpoint& worker,
                                                   uint32_t dispatch_sequence,
                                                   const ErrorPayload& error,
                                                   SteadyTime now) {
    std::vector<Outbound> out;
    std::lock_guard lock(mutex_);

    auto it = find_dispatch_locked(dispatch_sequence);
    if (it == records_.end() || !owned_by_locked(it->second, worker)) {
        ++stats_.stale_results;
        return out;
    }

    if (error.code == ErrorCode::WorkerBusy) {
        // Admission rejection: the task never ran, so it may go elsewhere.
        if (retry_locked(it->second, now, out)) {
            return out;
        }
        fail_locked(it, ErrorCode::WorkerBusy, error.message, now, out);
        return out;
    }

    release_worker_locked(it->second, true, now);
    fail_locked(it, error.code, error.message, now, out);
    return out;
}

// ─────────────────────────────────────────────
// Maintenance
// ─────────────────────────────────────────────

std::vector<Outbound> TaskRouter::handle_evictions(const std::vector<EvictedWorker>& evicted,
                                                   SteadyTime now) {
    std::vector<Outbound> out;
    if (evicted.empty()) return out;

    std::lock_guard lock(mutex_);

    // Only the task the sweep saw on the worker is orphaned. The same id may
    // have re-registered and taken a new task since then.
    for (const auto& w : evicted) {
        if (!w.in_flight) continue;

        auto it = records_.find(*w.in_flight);
        if (it == records_.end() || it->second.assigned_worker_id != w.worker_id) continue;

        if (!retry_locked(it->second, now, out)) {
            fail_locked(it, ErrorCode::WorkerUnreachable,
                        "worker " + w.worker_id + " became unreachable", now, out);
        }
    }
    return out;
}

std::vector<Outbound> TaskRouter::expire(SteadyTime now) {
    std::vector<Outbound> out;
    std::lock_guard lock(mutex_);

    std::vector<TaskKey> overdue;
    for (const auto& [key, record] : records_) {
        if (record.deadline <= now) overdue.push_back(key);
    }

    for (const auto& key : overdue) {
        auto it = records_.find(key);
        if (it == records_.end()) continue;

        ++stats_.timed_out;
        release_worker_locked(it->second, true, now);
        fail_locked(it, ErrorCode::TaskTimeout, "task deadline exceeded", now, out);
    }
    return out;
}

std::vector<Outbound> TaskRouter::fail_reassembly(uint32_t dispatch_sequence, SteadyTime now) {
    std::vector<Outbound> out;
    std::lock_guard lock(mutex_);

    auto it = find_dispatch_locked(dispatch_sequence);
    if (it == records_.end()) {
        ++stats_.stale_results;
        return out;
    }

    release_worker_locked(it->second, true, now);
    fail_locked(it, ErrorCode::ReassemblyTimeout, "result reassembly timed out", now, out);
    return out;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

RouterStats TaskRouter::stats() const {
    std::lock_guard lock(mutex_);
    RouterStats copy = stats_;
    copy.in_flight = records_.size();
    copy.avg_latency_ms = stats_.completed > 0
        ? latency_sum_ms_ / static_cast<double>(stats_.completed)
        : 0.0;
    return copy;
}

size_t TaskRouter::in_flight() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

std::optional<TaskRecord> TaskRouter::find(const TaskKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<TaskRecord> TaskRouter::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskRecord> records;
    records.reserve(records_.size());
    for (const auto& [key, record] : records_) {
        records.push_back(record);
    }
    return records;
}

// ─────────────────────────────────────────────
// Internals (mutex_ held)
// ─────────────────────────────────────────────

bool TaskRouter::dispatch_locked(TaskRecord& record, SteadyTime now, std::vector<Outbound>& out) {
    // A selected worker can be swept before mark_busy; pick again a few times.
    constexpr int kSelectAttempts = 3;

    for (int attempt = 0; attempt < kSelectAttempts; ++attempt) {
        auto selected = registry_.select_worker(now);
        if (!selected) return false;

        if (!registry_.mark_busy(selected->worker_id, record.key, now)) continue;

        record.assigned_worker_id = selected->worker_id;
        record.worker_address = selected->address;
        record.status = TaskStatus::Dispatched;

        if (record.dispatch_sequence != 0) {
            by_dispatch_.erase(record.dispatch_sequence);
        }
        record.dispatch_sequence = next_dispatch_sequence_locked();
        by_dispatch_[record.dispatch_sequence] = record.key;
        record.dispatched_at = now;

        out.push_back(Outbound{Channel::ToWorker, record.worker_address,
                               Message::make(MessageType::Task, record.dispatch_sequence, record.request)});
        record.status = TaskStatus::AwaitingResult;
        return true;
    }
    return false;
}

bool TaskRouter::retry_locked(TaskRecord& record, SteadyTime now, std::vector<Outbound>& out) {
    release_worker_locked(record, false, now);

    if (record.retry_count >= options_.max_retries) {
        return false;
    }
    ++record.retry_count;
    record.status = TaskStatus::Pending;

    if (!dispatch_locked(record, now, out)) {
        return false;
    }
    ++stats_.reassigned;
    return true;
}

void TaskRouter::release_worker_locked(TaskRecord& record, bool failed, SteadyTime now) {
    if (!record.assigned_worker_id) return;

    if (failed) {
        registry_.record_completion(*record.assigned_worker_id,
            std::chrono::duration_cast<Duration>(now - record.dispatched_at), false);
    }
    registry_.mark_idle(*record.assigned_worker_id, record.key);
    record.assigned_worker_id.reset();
}

void TaskRouter::fail_locked(RecordMap::iterator it, ErrorCode code, const std::string& text,
                             SteadyTime now, std::vector<Outbound>& out) {
    auto& record = it->second;
    release_worker_locked(record, false, now);

    record.status = TaskStatus::Failed;
    ++stats_.failed;
    report_locked(record, code, now);

    out.push_back(Outbound{Channel::ToClient, record.key.client,
                           make_error_message(record.key.sequence, code, text)});

    if (record.dispatch_sequence != 0) {
        by_dispatch_.erase(record.dispatch_sequence);
    }
    records_.erase(it);
}

bool TaskRouter::owned_by_locked(TaskRecord& record, const Endpoint& source) {
    if (!record.assigned_worker_id) return false;
    if (record.worker_address == source) return true;

    // The owner may have re-bound since dispatch; its registered address counts.
    auto owner = registry_.find(*record.assigned_worker_id);
    if (!owner || owner->address != source || owner->current_task != record.key) {
        return false;
    }
    record.worker_address = source;
    return true;
}

TaskRouter::RecordMap::iterator TaskRouter::find_dispatch_locked(uint32_t dispatch_sequence) {
    auto d = by_dispatch_.find(dispatch_sequence);
    if (d == by_dispatch_.end()) return records_.end();
    return records_.find(d->second);
}

uint32_t TaskRouter::next_dispatch_sequence_locked() {
    // 0 is reserved for replies that cannot be correlated (malformed input).
    do {
        ++dispatch_counter_;
    } while (dispatch_counter_ == 0 || by_dispatch_.contains(dispatch_counter_));
    return dispatch_counter_;
}

void TaskRouter::report_locked(const TaskRecord& record, std::optional<ErrorCode> error, SteadyTime now) {
    if (!outcome_callback_) return;

    outcome_callback_(TaskOutcome{
        .key = record.key,
        .worker_id = record.assigned_worker_id,
        .status = record.status,
        .error = error,
        .latency = std::chrono::duration_cast<Duration>(now - record.submitted_at),
        .retries = record.retry_count
    });
}

}  // namespace hydramesh
