/**
 * @file worker_agent.cpp
 * @brief WorkerAgent implementation.
 * @author Dimitris Kafetzis
 */

#include "worker/worker_agent.hpp"
#include "protocol/chunking.hpp"
#include "protocol/payloads.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>

namespace hydramesh {

namespace {

constexpr uint32_t RECEIVE_POLL_MS = 100;

}  // anonymous namespace

WorkerAgent::WorkerAgent(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level, "worker")
    , executor_(std::move(opts.executor))
    , head_{config_.worker.head_host, config_.worker.head_port} {
    if (!executor_) {
        executor_ = std::make_unique<EchoExecutor>();
    }
}

WorkerAgent::~WorkerAgent() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> WorkerAgent::start() {
    if (running_.exchange(true)) {
        return Error{"Already running"};
    }

    // Heartbeats and results all go to the head; look its name up once.
    auto head = resolve_endpoint(Endpoint{config_.worker.head_host, config_.worker.head_port});
    if (!head) {
        running_.store(false);
        return head.error();
    }
    head_ = *head;

    auto bound = socket_.bind(config_.worker.listen_port);
    if (!bound) {
        running_.store(false);
        return bound.error();
    }

    logger_.info("Worker starting: id=" + (config_.worker.id.empty() ? std::string("<address>") : config_.worker.id)
                 + " listen=" + std::to_string(socket_.local_port())
                 + " head=" + head_.to_string()
                 + " executor=" + std::string(executor_->name())
                 + " admission=" + config_.worker.admission);

    receive_thread_ = std::jthread([this](std::stop_token stop) {
        receive_loop(stop);
    });
    heartbeat_thread_ = std::jthread([this](std::stop_token stop) {
        heartbeat_loop(stop);
    });

    return Result<void>{};
}

void WorkerAgent::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Worker shutting down...");

    if (receive_thread_.joinable()) receive_thread_.request_stop();
    if (heartbeat_thread_.joinable()) heartbeat_thread_.request_stop();
    if (receive_thread_.joinable()) receive_thread_.join();
    if (heartbeat_thread_.joinable()) heartbeat_thread_.join();

    executor_pool_.shutdown();
    socket_.close();

    logger_.info("Worker stopped");
    logger_.flush();
}

// ─────────────────────────────────────────────
// Heartbeats
// ─────────────────────────────────────────────

Result<void> WorkerAgent::send_heartbeat() {
    HeartbeatPayload hb;
    hb.port = socket_.local_port();
    hb.load_hint = load_hint();
    hb.worker_id = config_.worker.id;
    hb.capabilities.assign(config_.worker.capabilities.begin(), config_.worker.capabilities.end());

    auto msg = Message::make(MessageType::Heartbeat, ++heartbeat_sequence_,
                             PayloadCodec::encode_heartbeat(hb));
    auto sent = socket_.send_to(head_, MessageCodec::encode(msg));
    if (!sent) return sent;

    heartbeats_sent_.fetch_add(1);
    return Result<void>{};
}

void WorkerAgent::heartbeat_loop(std::stop_token stop) {
    auto interval = config_.heartbeat_interval();

    while (!stop.stop_requested()) {
        auto sent = send_heartbeat();
        if (!sent) {
            logger_.warn("Heartbeat to " + head_.to_string() + " failed: " + sent.error().message);
        }

        // Sleep in small increments to respond to stop requests promptly
        auto deadline = std::chrono::steady_clock::now() + interval;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
}

// ─────────────────────────────────────────────
// Receive Thread
// ─────────────────────────────────────────────

void WorkerAgent::receive_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto received = socket_.receive(RECEIVE_POLL_MS);
        if (!received) {
            logger_.error("Receive failed: " + received.error().message);
            std::this_thread::sleep_for(std::chrono::milliseconds(RECEIVE_POLL_MS));
            continue;
        }
        if (!received->has_value()) continue;

        handle_datagram(**received);
    }
}

void WorkerAgent::handle_datagram(const Datagram& datagram) {
    auto decoded = MessageCodec::decode(datagram.data);
    if (!decoded) {
        malformed_.fetch_add(1);
        logger_.warn("Malformed datagram from " + datagram.source.to_string()
                     + ": " + decoded.error().message);
        send(datagram.source, make_error_message(0, decoded.error()));
        return;
    }

    auto& msg = *decoded;
    switch (msg.type) {
        case MessageType::Task:
            handle_task(datagram.source, std::move(msg));
            break;
        case MessageType::Error: {
            auto err = PayloadCodec::decode_error(msg.payload);
            logger_.warn("Head reported error for seq " + std::to_string(msg.sequence) + ": "
                         + (err ? std::string(to_string(err->code)) + " " + err->message
                                : err.error().message));
            break;
        }
        default:
            logger_.debug("Ignoring " + std::string(to_string(msg.type))
                          + " from " + datagram.source.to_string());
            break;
    }
}

void WorkerAgent::handle_task(const Endpoint& source, Message task) {
    PendingTask pending{source, task.sequence, std::move(task.payload)};

    {
        std::lock_guard lock(state_mutex_);
        if (state_ == AgentState::Busy) {
            if (config_.worker.admission == "queue" && !queued_) {
                queued_ = std::move(pending);
                tasks_queued_.fetch_add(1);
                logger_.debug("Queued task seq " + std::to_string(task.sequence));
                return;
            }
            tasks_rejected_.fetch_add(1);
            logger_.debug("Rejecting task seq " + std::to_string(task.sequence) + ": busy");
            send(source, make_error_message(task.sequence, ErrorCode::WorkerBusy, "worker busy"));
            return;
        }
        state_ = AgentState::Busy;
    }

    logger_.debug("Accepted task seq " + std::to_string(pending.sequence)
                  + " (" + std::to_string(pending.payload.size()) + " bytes)");

    try {
        executor_pool_.submit_cancellable([this, first = std::move(pending)](std::stop_token stop) mutable {
            run_tasks(std::move(first), stop);
        });
    } catch (const std::exception& e) {
        // Pool already shut down: the agent is stopping.
        {
            std::lock_guard lock(state_mutex_);
            state_ = AgentState::Idle;
        }
        logger_.warn(std::string("Dropping task, executor unavailable: ") + e.what());
    }
}

// ─────────────────────────────────────────────
// Executor Thread
// ─────────────────────────────────────────────

void WorkerAgent::run_tasks(PendingTask first, std::stop_token stop) {
    std::optional<PendingTask> current = std::move(first);

    while (current) {
        execute_one(*current, stop);

        std::lock_guard lock(state_mutex_);
        current = std::move(queued_);
        queued_.reset();
        if (!current) {
            state_ = AgentState::Idle;
        }
    }
}

void WorkerAgent::execute_one(const PendingTask& task, std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    auto result = executor_->execute(task.payload, stop);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!result) {
        tasks_failed_.fetch_add(1);
        logger_.warn("Task seq " + std::to_string(task.sequence) + " failed: " + result.error().message);
        send(task.reply_to, make_error_message(task.sequence, ErrorCode::ExecutionFailed,
                                               result.error().message));
        return;
    }

    auto size = result->size();
    auto messages = make_payload_messages(MessageType::Result, task.sequence, std::move(*result),
                                          config_.protocol.max_fragment_bytes);
    for (const auto& msg : messages) {
        send(task.reply_to, msg);
    }

    tasks_completed_.fetch_add(1);
    logger_.debug("Task seq " + std::to_string(task.sequence) + " done in "
                  + std::to_string(elapsed.count()) + "ms, " + std::to_string(size) + " bytes in "
                  + std::to_string(messages.size()) + " message(s)");
}

void WorkerAgent::send(const Endpoint& destination, const Message& msg) {
    auto sent = socket_.send_to(destination, MessageCodec::encode(msg));
    if (!sent) {
        logger_.warn("Send " + std::string(to_string(msg.type)) + " to " + destination.to_string()
                     + " failed: " + sent.error().message);
    }
}

// ─────────────────────────────────────────────
// Accessors
// ─────────────────────────────────────────────

AgentState WorkerAgent::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

uint8_t WorkerAgent::load_hint() const {
    std::lock_guard lock(state_mutex_);
    if (state_ == AgentState::Idle) return 0;
    return queued_ ? 2 : 1;
}

WorkerAgentStats WorkerAgent::stats() const {
    return WorkerAgentStats{
        .tasks_completed = tasks_completed_.load(),
        .tasks_failed = tasks_failed_.load(),
        .tasks_rejected = tasks_rejected_.load(),
        .tasks_queued = tasks_queued_.load(),
        .heartbeats_sent = heartbeats_sent_.load(),
        .malformed = malformed_.load()
    };
}

}  // namespace hydramesh
