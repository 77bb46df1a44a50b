/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "cluster/task_router.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>

namespace hydramesh {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_task_outcome(const TaskOutcome& outcome);
    void record_worker_event(const WorkerId& worker, const Endpoint& address, std::string_view event_type);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace hydramesh
