/**
 * @file head_controller.hpp
 * @brief The head process: two UDP sockets, the registry, the router and the reassembler.
 * @author Dimitris Kafetzis
 *
 * Threads:
 *   1. worker receive loop:  HEARTBEAT, RESULT, CHUNK and ERROR from workers
 *   2. client receive loop:  TASK and HEALTH from clients
 *   3. maintenance loop:     registry sweep every sweep interval; task expiry
 *                            and reassembly eviction every maintenance tick
 *   4. sender loop:          drains the outbound queue onto the sockets
 *
 * Receive handlers never send directly. They feed the router, collect the
 * Outbound list it returns and enqueue it for the sender loop.
 */

#pragma once

#include "cluster/task_router.hpp"
#include "cluster/worker_registry.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/udp_socket.hpp"
#include "protocol/chunking.hpp"
#include "protocol/message.hpp"
#include "telemetry/health_report.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hydramesh {

class HeadController {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;   ///< Null discards metrics
    };

    explicit HeadController(Options opts);
    ~HeadController();

    // Non-copyable, non-movable
    HeadController(const HeadController&) = delete;
    HeadController& operator=(const HeadController&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /**
     * @brief One maintenance pass at @p now: optional sweep, then expiry and
     *        reassembly eviction. The maintenance loop calls this on its tick.
     */
    void run_maintenance(SteadyTime now, bool sweep);

    /// Current health report as JSON (the HEALTH reply payload).
    [[nodiscard]] std::string health_json() const;
    [[nodiscard]] NodeCounters counters() const;

    // ── Accessors (for testing) ─────────────
    [[nodiscard]] uint16_t client_port() const noexcept { return client_socket_.local_port(); }
    [[nodiscard]] uint16_t worker_port() const noexcept { return worker_socket_.local_port(); }
    WorkerRegistry& registry() { return registry_; }
    TaskRouter& router() { return router_; }
    ChunkReassembler& reassembler() { return reassembler_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }

private:
    void worker_receive_loop(std::stop_token stop);
    void client_receive_loop(std::stop_token stop);
    void maintenance_loop(std::stop_token stop);
    void sender_loop(std::stop_token stop);

    void handle_worker_datagram(const Datagram& datagram);
    void handle_client_datagram(const Datagram& datagram);
    void handle_heartbeat(const Endpoint& source, const Message& msg);
    void handle_worker_chunk(const Endpoint& source, const Message& msg);
    void handle_worker_error(const Endpoint& source, const Message& msg);

    /// Decode a datagram, counting it; malformed input is answered with ERROR(seq 0).
    Result<Message> decode_counted(const Datagram& datagram, Channel reply_channel);

    void enqueue(std::vector<Outbound> batch);
    void enqueue(Outbound item);
    void transmit(const Outbound& item);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;

    WorkerRegistry registry_;
    TaskRouter router_;
    ChunkReassembler reassembler_;

    UdpSocket client_socket_;
    UdpSocket worker_socket_;

    std::mutex outbound_mutex_;
    std::condition_variable_any outbound_cv_;
    std::deque<Outbound> outbound_;

    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> send_failures_{0};

    SteadyTime started_at_;

    std::jthread worker_thread_;
    std::jthread client_thread_;
    std::jthread maintenance_thread_;
    std::jthread sender_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace hydramesh
