/**
 * @file head_controller.cpp
 * @brief HeadController implementation.
 * @author Dimitris Kafetzis
 */

#include "head/head_controller.hpp"
#include "protocol/payloads.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>

namespace hydramesh {

namespace {

constexpr uint32_t RECEIVE_POLL_MS = 100;

RouterOptions router_options(const Config& config) {
    return RouterOptions{
        .request_timeout = config.request_timeout(),
        .max_retries = config.router.max_retries,
        .max_pending = config.router.max_pending,
        .max_fragment_bytes = config.protocol.max_fragment_bytes
    };
}

ReassemblyOptions reassembly_options(const Config& config) {
    ReassemblyOptions opts;
    opts.idle_timeout = config.reassembly_timeout();
    opts.max_total_bytes = config.protocol.max_reassembly_bytes;
    opts.max_buffers = config.protocol.max_reassembly_buffers;
    return opts;
}

}  // anonymous namespace

HeadController::HeadController(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level, "head")
    , metrics_(or_null_sink(std::move(opts.metrics_sink)))
    , registry_(config_.worker_timeout(), make_selection_policy(config_.registry.selection_policy))
    , router_(registry_, router_options(config_))
    , reassembler_(reassembly_options(config_))
    , started_at_(std::chrono::steady_clock::now()) {
    router_.on_outcome([this](const TaskOutcome& outcome) {
        metrics_.record_task_outcome(outcome);
        if (outcome.status == TaskStatus::Complete) {
            logger_.debug("Task " + outcome.key.to_string() + " complete via "
                          + outcome.worker_id.value_or("?") + " in "
                          + std::to_string(outcome.latency.count()) + "us");
        } else {
            logger_.info("Task " + outcome.key.to_string() + " failed: "
                         + std::string(to_string(outcome.error.value_or(ErrorCode::Internal))));
        }
    });
}

HeadController::~HeadController() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> HeadController::start() {
    if (running_.exchange(true)) {
        return Error{"Already running"};
    }

    auto client_bound = client_socket_.bind(config_.head.client_port, config_.head.bind_address);
    if (!client_bound) {
        running_.store(false);
        return client_bound.error();
    }
    auto worker_bound = worker_socket_.bind(config_.head.worker_port, config_.head.bind_address);
    if (!worker_bound) {
        client_socket_.close();
        running_.store(false);
        return worker_bound.error();
    }

    started_at_ = std::chrono::steady_clock::now();

    logger_.info("Head starting: clients=" + config_.head.bind_address + ":"
                 + std::to_string(client_socket_.local_port())
                 + " workers=" + config_.head.bind_address + ":"
                 + std::to_string(worker_socket_.local_port())
                 + " policy=" + std::string(registry_.policy_name())
                 + " worker_timeout=" + std::to_string(config_.worker_timeout().count()) + "ms"
                 + " sweep=" + std::to_string(config_.sweep_interval().count()) + "ms");

    sender_thread_ = std::jthread([this](std::stop_token stop) {
        sender_loop(stop);
    });
    worker_thread_ = std::jthread([this](std::stop_token stop) {
        worker_receive_loop(stop);
    });
    client_thread_ = std::jthread([this](std::stop_token stop) {
        client_receive_loop(stop);
    });
    maintenance_thread_ = std::jthread([this](std::stop_token stop) {
        maintenance_loop(stop);
    });

    return Result<void>{};
}

void HeadController::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Head shutting down...");

    for (auto* t : {&client_thread_, &worker_thread_, &maintenance_thread_, &sender_thread_}) {
        if (t->joinable()) t->request_stop();
    }
    outbound_cv_.notify_all();
    for (auto* t : {&client_thread_, &worker_thread_, &maintenance_thread_, &sender_thread_}) {
        if (t->joinable()) t->join();
    }

    client_socket_.close();
    worker_socket_.close();

    auto stats = router_.stats();
    metrics_.record_custom("head_shutdown",
        "{\"submitted\":" + std::to_string(stats.submitted)
        + ",\"completed\":" + std::to_string(stats.completed)
        + ",\"failed\":" + std::to_string(stats.failed)
        + ",\"in_flight\":" + std::to_string(stats.in_flight) + "}");
    metrics_.flush();

    logger_.info("Head stopped");
    logger_.flush();
}

// ─────────────────────────────────────────────
// Receive Threads
// ─────────────────────────────────────────────

void HeadController::worker_receive_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto received = worker_socket_.receive(RECEIVE_POLL_MS);
        if (!received) {
            logger_.error("Worker socket receive failed: " + received.error().message);
            std::this_thread::sleep_for(std::chrono::milliseconds(RECEIVE_POLL_MS));
            continue;
        }
        if (!received->has_value()) continue;

        handle_worker_datagram(**received);
    }
}

void HeadController::client_receive_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto received = client_socket_.receive(RECEIVE_POLL_MS);
        if (!received) {
            logger_.error("Client socket receive failed: " + received.error().message);
            std::this_thread::sleep_for(std::chrono::milliseconds(RECEIVE_POLL_MS));
            continue;
        }
        if (!received->has_value()) continue;

        handle_client_datagram(**received);
    }
}

Result<Message> HeadController::decode_counted(const Datagram& datagram, Channel reply_channel) {
    messages_received_.fetch_add(1);
    bytes_received_.fetch_add(datagram.data.size());

    auto decoded = MessageCodec::decode(datagram.data);
    if (!decoded) {
        malformed_.fetch_add(1);
        logger_.warn("Malformed datagram from " + datagram.source.to_string()
                     + ": " + decoded.error().message);
        enqueue(Outbound{reply_channel, datagram.source, make_error_message(0, decoded.error())});
    }
    return decoded;
}

// ── Worker channel ───────────────────────────

void HeadController::handle_worker_datagram(const Datagram& datagram) {
    auto decoded = decode_counted(datagram, Channel::ToWorker);
    if (!decoded) return;

    const auto& msg = *decoded;
    auto now = std::chrono::steady_clock::now();

    switch (msg.type) {
        case MessageType::Heartbeat:
            handle_heartbeat(datagram.source, msg);
            break;
        case MessageType::Result:
            enqueue(router_.complete(datagram.source, msg.sequence, msg.payload, now));
            break;
        case MessageType::Chunk:
            handle_worker_chunk(datagram.source, msg);
            break;
        case MessageType::Error:
            handle_worker_error(datagram.source, msg);
            break;
        default:
            logger_.debug("Ignoring " + std::string(to_string(msg.type))
                          + " on worker channel from " + datagram.source.to_string());
            break;
    }
}

void HeadController::handle_heartbeat(const Endpoint& source, const Message& msg) {
    auto hb = PayloadCodec::decode_heartbeat(msg.payload);
    if (!hb) {
        malformed_.fetch_add(1);
        logger_.warn("Bad heartbeat from " + source.to_string() + ": " + hb.error().message);
        enqueue(Outbound{Channel::ToWorker, source, make_error_message(msg.sequence, hb.error())});
        return;
    }

    Endpoint address{source.host, hb->port != 0 ? hb->port : source.port};
    WorkerId id = hb->worker_id.empty() ? address.to_string() : hb->worker_id;

    bool is_new = registry_.record_heartbeat(id, address, std::move(hb->capabilities),
                                             hb->load_hint, std::chrono::steady_clock::now());
    if (is_new) {
        logger_.info("Worker registered: " + id + " at " + address.to_string());
        metrics_.record_worker_event(id, address, "registered");
    }
}

void HeadController::handle_worker_chunk(const Endpoint& source, const Message& msg) {
    auto chunk = PayloadCodec::decode_chunk(msg.payload);
    if (!chunk) {
        malformed_.fetch_add(1);
        logger_.warn("Bad chunk from " + source.to_string() + ": " + chunk.error().message);
        enqueue(Outbound{Channel::ToWorker, source, make_error_message(msg.sequence, chunk.error())});
        return;
    }

    auto now = std::chrono::steady_clock::now();
    auto ingested = reassembler_.ingest(*chunk, now);
    if (!ingested) {
        if (ingested.error().code == ErrorCode::Malformed) malformed_.fetch_add(1);
        logger_.warn("Rejected chunk " + std::to_string(chunk->message_id) + "@"
                     + std::to_string(chunk->offset) + " from " + source.to_string()
                     + ": " + ingested.error().message);
        enqueue(Outbound{Channel::ToWorker, source, make_error_message(msg.sequence, ingested.error())});
        return;
    }

    if (ingested->has_value()) {
        enqueue(router_.complete(source, chunk->message_id, std::move(**ingested), now));
    }
}

void HeadController::handle_worker_error(const Endpoint& source, const Message& msg) {
    auto err = PayloadCodec::decode_error(msg.payload);
    if (!err) {
        malformed_.fetch_add(1);
        logger_.warn("Bad error payload from " + source.to_string() + ": " + err.error().message);
        return;
    }

    if (msg.sequence == 0) {
        // Uncorrelated complaint, e.g. the worker could not decode something we sent.
        logger_.warn("Worker " + source.to_string() + " reported " + std::string(to_string(err->code))
                     + ": " + err->message);
        return;
    }

    logger_.debug("Worker " + source.to_string() + " error for dispatch "
                  + std::to_string(msg.sequence) + ": " + std::string(to_string(err->code)));
    enqueue(router_.fail_from_worker(source, msg.sequence, *err, std::chrono::steady_clock::now()));
}

// ── Client channel ───────────────────────────

void HeadController::handle_client_datagram(const Datagram& datagram) {
    auto decoded = decode_counted(datagram, Channel::ToClient);
    if (!decoded) return;

    const auto& msg = *decoded;

    switch (msg.type) {
        case MessageType::Task:
            enqueue(router_.submit(datagram.source, msg, std::chrono::steady_clock::now()));
            break;
        case MessageType::Health: {
            auto body = health_json();
            std::vector<uint8_t> payload(body.begin(), body.end());
            for (auto& reply : make_payload_messages(MessageType::Health, msg.sequence, std::move(payload),
                                                     config_.protocol.max_fragment_bytes)) {
                enqueue(Outbound{Channel::ToClient, datagram.source, std::move(reply)});
            }
            break;
        }
        default:
            logger_.debug("Unexpected " + std::string(to_string(msg.type))
                          + " on client channel from " + datagram.source.to_string());
            enqueue(Outbound{Channel::ToClient, datagram.source,
                             make_error_message(msg.sequence, ErrorCode::Malformed,
                                                "unexpected message type on client channel")});
            break;
    }
}

// ─────────────────────────────────────────────
// Maintenance Thread
// ─────────────────────────────────────────────

void HeadController::run_maintenance(SteadyTime now, bool sweep) {
    if (sweep) {
        auto evicted = registry_.sweep(now);
        for (const auto& w : evicted) {
            logger_.warn("Worker evicted: " + w.worker_id + " at " + w.address.to_string()
                         + (w.in_flight ? " with task " + w.in_flight->to_string() : std::string{}));
            metrics_.record_worker_event(w.worker_id, w.address, "evicted");
        }
        enqueue(router_.handle_evictions(evicted, now));
    }

    enqueue(router_.expire(now));

    for (auto message_id : reassembler_.evict_stale(now)) {
        logger_.warn("Reassembly of dispatch " + std::to_string(message_id) + " timed out");
        enqueue(router_.fail_reassembly(message_id, now));
    }
}

void HeadController::maintenance_loop(std::stop_token stop) {
    auto tick = std::chrono::milliseconds(std::max<uint32_t>(1, config_.router.maintenance_interval_ms));
    auto sweep_interval = config_.sweep_interval();
    auto next_sweep = std::chrono::steady_clock::now() + sweep_interval;
    auto next_tick = std::chrono::steady_clock::now() + tick;

    while (!stop.stop_requested()) {
        // Sleep in small increments to respond to stop requests promptly
        auto wake = std::min(next_tick, next_sweep);
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (stop.stop_requested()) break;

        auto now = std::chrono::steady_clock::now();
        bool do_sweep = now >= next_sweep;
        if (do_sweep) {
            next_sweep = now + sweep_interval;
        }
        if (now >= next_tick || do_sweep) {
            next_tick = now + tick;
        }

        run_maintenance(now, do_sweep);
    }
}

// ─────────────────────────────────────────────
// Outbound Queue
// ─────────────────────────────────────────────

void HeadController::enqueue(std::vector<Outbound> batch) {
    if (batch.empty()) return;
    {
        std::lock_guard lock(outbound_mutex_);
        for (auto& item : batch) {
            outbound_.push_back(std::move(item));
        }
    }
    outbound_cv_.notify_one();
}

void HeadController::enqueue(Outbound item) {
    {
        std::lock_guard lock(outbound_mutex_);
        outbound_.push_back(std::move(item));
    }
    outbound_cv_.notify_one();
}

void HeadController::sender_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::deque<Outbound> batch;
        {
            std::unique_lock lock(outbound_mutex_);
            outbound_cv_.wait(lock, stop, [this] { return !outbound_.empty(); });
            if (outbound_.empty()) continue;
            batch.swap(outbound_);
        }

        for (const auto& item : batch) {
            transmit(item);
        }
    }
}

void HeadController::transmit(const Outbound& item) {
    auto& socket = item.channel == Channel::ToClient ? client_socket_ : worker_socket_;
    auto bytes = MessageCodec::encode(item.message);

    auto sent = socket.send_to(item.destination, bytes);
    if (!sent) {
        send_failures_.fetch_add(1);
        logger_.warn("Send " + std::string(to_string(item.message.type)) + " to "
                     + item.destination.to_string() + " failed: " + sent.error().message);
        return;
    }

    messages_sent_.fetch_add(1);
    bytes_sent_.fetch_add(bytes.size());
}

// ─────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────

NodeCounters HeadController::counters() const {
    return NodeCounters{
        .messages_received = messages_received_.load(),
        .bytes_received = bytes_received_.load(),
        .messages_sent = messages_sent_.load(),
        .bytes_sent = bytes_sent_.load(),
        .malformed = malformed_.load(),
        .send_failures = send_failures_.load()
    };
}

std::string HeadController::health_json() const {
    auto now = std::chrono::steady_clock::now();
    return render_health_json(registry_.stats(now), router_.stats(), counters(),
                              std::chrono::duration_cast<std::chrono::seconds>(now - started_at_));
}

}  // namespace hydramesh
