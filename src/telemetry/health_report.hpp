/**
 * @file health_report.hpp
 * @brief JSON rendering of head health for HEALTH replies.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "cluster/task_router.hpp"
#include "cluster/worker_registry.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace hydramesh {

/// Datagram counters of the head's two sockets combined.
struct NodeCounters {
    uint64_t messages_received{0};
    uint64_t bytes_received{0};
    uint64_t messages_sent{0};
    uint64_t bytes_sent{0};
    uint64_t malformed{0};
    uint64_t send_failures{0};
};

/**
 * @brief Render one JSON object:
 *   {"workers":{...,"list":[...]},"tasks":{...},"node":{...},"uptime_s":N}
 */
[[nodiscard]] std::string render_health_json(const RegistryStats& registry,
                                             const RouterStats& router,
                                             const NodeCounters& node,
                                             std::chrono::seconds uptime);

}  // namespace hydramesh
