/**
 * @file health_report.cpp
 * @brief render_health_json implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/health_report.hpp"
#include "core/logger.hpp"

#include <iomanip>
#include <sstream>

namespace hydramesh {

std::string render_health_json(const RegistryStats& registry,
                               const RouterStats& router,
                               const NodeCounters& node,
                               std::chrono::seconds uptime) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << R"({"workers":{)"
        << R"("total":)" << registry.total
        << R"(,"healthy":)" << registry.healthy
        << R"(,"busy":)" << registry.busy
        << R"(,"unreachable":)" << registry.unreachable
        << R"(,"evicted_total":)" << registry.evicted_total
        << R"(,"list":[)";

    bool first = true;
    for (const auto& w : registry.workers) {
        if (!first) oss << ',';
        first = false;
        oss << R"({"id":")" << json_escape(w.worker_id) << "\""
            << R"(,"address":")" << json_escape(w.address.to_string()) << "\""
            << R"(,"status":")" << to_string(w.status) << "\""
            << R"(,"load":)" << static_cast<int>(w.load_hint)
            << R"(,"tasks_completed":)" << w.tasks_completed
            << R"(,"tasks_failed":)" << w.tasks_failed
            << R"(,"avg_latency_ms":)" << w.avg_latency_ms
            << R"(,"heartbeat_age_ms":)" << w.heartbeat_age.count()
            << '}';
    }
    oss << "]}";

    oss << R"(,"tasks":{)"
        << R"("submitted":)" << router.submitted
        << R"(,"completed":)" << router.completed
        << R"(,"failed":)" << router.failed
        << R"(,"timed_out":)" << router.timed_out
        << R"(,"reassigned":)" << router.reassigned
        << R"(,"rejected":)" << router.rejected
        << R"(,"duplicates":)" << router.duplicates
        << R"(,"stale_results":)" << router.stale_results
        << R"(,"in_flight":)" << router.in_flight
        << R"(,"avg_latency_ms":)" << router.avg_latency_ms
        << '}';

    oss << R"(,"node":{)"
        << R"("messages_received":)" << node.messages_received
        << R"(,"bytes_received":)" << node.bytes_received
        << R"(,"messages_sent":)" << node.messages_sent
        << R"(,"bytes_sent":)" << node.bytes_sent
        << R"(,"malformed":)" << node.malformed
        << R"(,"send_failures":)" << node.send_failures
        << '}';

    oss << R"(,"uptime_s":)" << uptime.count() << '}';
    return oss.str();
}

}  // namespace hydramesh
