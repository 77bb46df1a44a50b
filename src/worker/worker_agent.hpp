/**
 * @file worker_agent.hpp
 * @brief Worker-side counterpart of the head: heartbeats, task intake, results.
 * @author Dimitris Kafetzis
 *
 * Threads:
 *   - receive loop:   decodes TASK messages from the head and admits or rejects them
 *   - heartbeat loop: sends HEARTBEAT every heartbeat interval
 *   - executor:       a one-thread pool running IInferenceExecutor
 *
 * All three send from the same listen socket, so the head sees one stable
 * address per worker.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "network/udp_socket.hpp"
#include "protocol/message.hpp"
#include "worker/inference_executor.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace hydramesh {

enum class AgentState : uint8_t {
    Idle,
    Busy
};

struct WorkerAgentStats {
    uint64_t tasks_completed{0};
    uint64_t tasks_failed{0};
    uint64_t tasks_rejected{0};
    uint64_t tasks_queued{0};
    uint64_t heartbeats_sent{0};
    uint64_t malformed{0};
};

class WorkerAgent {
public:
    struct Options {
        Config config;
        std::unique_ptr<IInferenceExecutor> executor;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
    };

    explicit WorkerAgent(Options opts);
    ~WorkerAgent();

    // Non-copyable, non-movable
    WorkerAgent(const WorkerAgent&) = delete;
    WorkerAgent& operator=(const WorkerAgent&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Send one HEARTBEAT now, outside the regular interval.
    Result<void> send_heartbeat();

    // ── Accessors ────────────────────────────
    [[nodiscard]] AgentState state() const;
    [[nodiscard]] uint8_t load_hint() const;
    [[nodiscard]] WorkerAgentStats stats() const;
    [[nodiscard]] uint16_t listen_port() const noexcept { return socket_.local_port(); }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    Logger& logger() { return logger_; }

private:
    struct PendingTask {
        Endpoint reply_to;
        uint32_t sequence;
        std::vector<uint8_t> payload;
    };

    void receive_loop(std::stop_token stop);
    void heartbeat_loop(std::stop_token stop);

    void handle_datagram(const Datagram& datagram);
    void handle_task(const Endpoint& source, Message task);

    /// Runs on the executor thread; drains the one-slot queue before going idle.
    void run_tasks(PendingTask first, std::stop_token stop);
    void execute_one(const PendingTask& task, std::stop_token stop);

    void send(const Endpoint& destination, const Message& msg);

    Config config_;
    Logger logger_;
    std::unique_ptr<IInferenceExecutor> executor_;

    UdpSocket socket_;
    Endpoint head_;
    ThreadPool executor_pool_{1};

    mutable std::mutex state_mutex_;
    AgentState state_{AgentState::Idle};
    std::optional<PendingTask> queued_;

    std::atomic<uint32_t> heartbeat_sequence_{0};
    std::atomic<uint64_t> tasks_completed_{0};
    std::atomic<uint64_t> tasks_failed_{0};
    std::atomic<uint64_t> tasks_rejected_{0};
    std::atomic<uint64_t> tasks_queued_{0};
    std::atomic<uint64_t> heartbeats_sent_{0};
    std::atomic<uint64_t> malformed_{0};

    std::jthread receive_thread_;
    std::jthread heartbeat_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace hydramesh
