/**
 * @file types.hpp
 * @brief Fundamental types used throughout HydraMesh.
 * @author Dimitris Kafetzis
 *
 * Defines WorkerId, Endpoint, TaskKey, the worker/task status enums and the
 * clock aliases. Liveness and deadlines are measured on the steady clock;
 * wire timestamps are wall-clock microseconds.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace hydramesh {

// ─────────────────────────────────────────────
// Identity and Time Types
// ─────────────────────────────────────────────

using WorkerId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Wall-clock microseconds since the Unix epoch, as carried in the header.
[[nodiscard]] inline uint64_t now_micros() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// ─────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────

/**
 * @brief A UDP host:port pair.
 */
struct Endpoint {
    std::string host;
    uint16_t port{0};

    [[nodiscard]] std::string to_string() const {
        return host + ":" + std::to_string(port);
    }

    auto operator<=>(const Endpoint&) const = default;
};

// ─────────────────────────────────────────────
// Task Key
// ─────────────────────────────────────────────

/**
 * @brief Identity of a client task: the client's sequence scoped to its address.
 *
 * Two clients may reuse the same sequence number without colliding.
 */
struct TaskKey {
    Endpoint client;
    uint32_t sequence{0};

    [[nodiscard]] std::string to_string() const {
        return client.to_string() + "#" + std::to_string(sequence);
    }

    auto operator<=>(const TaskKey&) const = default;
};

struct TaskKeyHash {
    size_t operator()(const TaskKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.client.host);
        h ^= std::hash<uint32_t>{}(key.client.port) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<uint32_t>{}(key.sequence) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

// ─────────────────────────────────────────────
// Worker Status
// ─────────────────────────────────────────────

enum class WorkerStatus : uint8_t {
    Healthy,       ///< Heartbeating and idle
    Busy,          ///< Heartbeating and owns a task
    Unreachable    ///< Heartbeat older than the liveness timeout, awaiting sweep
};

[[nodiscard]] constexpr std::string_view to_string(WorkerStatus status) noexcept {
    switch (status) {
        case WorkerStatus::Healthy:     return "healthy";
        case WorkerStatus::Busy:        return "busy";
        case WorkerStatus::Unreachable: return "unreachable";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,          ///< Admitted, no worker selected yet
    Dispatched,       ///< Worker selected and marked busy
    AwaitingResult,   ///< TASK sent to the worker
    Complete,         ///< Result forwarded to the client
    Failed            ///< Error forwarded to the client
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:        return "pending";
        case TaskStatus::Dispatched:     return "dispatched";
        case TaskStatus::AwaitingResult: return "awaiting_result";
        case TaskStatus::Complete:       return "complete";
        case TaskStatus::Failed:         return "failed";
    }
    return "unknown";
}

}  // namespace hydramesh
