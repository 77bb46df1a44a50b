/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace hydramesh {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_task_outcome(const TaskOutcome& outcome) {
    std::ostringstream oss;
    oss << R"({"event":"task_)" << to_string(outcome.status) << "\""
        << R"(,"ts_us":)" << now_micros()
        << R"(,"client":")" << json_escape(outcome.key.client.to_string()) << "\""
        << R"(,"seq":)" << outcome.key.sequence;
    if (outcome.worker_id) {
        oss << R"(,"worker":")" << json_escape(*outcome.worker_id) << "\"";
    }
    if (outcome.error) {
        oss << R"(,"error":")" << to_string(*outcome.error) << "\"";
    }
    oss << R"(,"latency_us":)" << outcome.latency.count()
        << R"(,"retries":)" << outcome.retries
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_worker_event(const WorkerId& worker, const Endpoint& address,
                                           std::string_view event_type) {
    std::ostringstream oss;
    oss << R"({"event":"worker_)" << event_type << "\""
        << R"(,"ts_us":)" << now_micros()
        << R"(,"worker":")" << json_escape(worker) << "\""
        << R"(,"address":")" << json_escape(address.to_string()) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"ts_us":)" << now_micros()
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace hydramesh
