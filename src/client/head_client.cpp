/**
 * @file head_client.cpp
 * @brief HeadClient implementation.
 * @author Dimitris Kafetzis
 */

#include "client/head_client.hpp"
#include "protocol/payloads.hpp"

#include <algorithm>

namespace hydramesh {

HeadClient::HeadClient(Endpoint head)
    : head_(std::move(head)) {}

Result<void> HeadClient::open(uint16_t local_port) {
    auto resolved = resolve_endpoint(head_);
    if (!resolved) return resolved.error();
    head_ = *resolved;

    return socket_.bind(local_port);
}

void HeadClient::close() {
    socket_.close();
}

Result<void> HeadClient::send(const Message& msg) {
    return socket_.send_to(head_, MessageCodec::encode(msg));
}

Result<uint32_t> HeadClient::send_task(std::span<const uint8_t> request) {
    uint32_t seq = next_sequence_++;
    if (next_sequence_ == 0) next_sequence_ = 1;

    auto sent = send(Message::make(MessageType::Task, seq,
                                   std::vector<uint8_t>(request.begin(), request.end())));
    if (!sent) return sent.error();
    return seq;
}

Result<std::vector<uint8_t>> HeadClient::submit(std::span<const uint8_t> request,
                                                std::chrono::milliseconds timeout) {
    auto seq = send_task(request);
    if (!seq) return seq.error();
    return await_reply(*seq, MessageType::Result, timeout);
}

Result<std::string> HeadClient::health(std::chrono::milliseconds timeout) {
    uint32_t seq = next_sequence_++;
    if (next_sequence_ == 0) next_sequence_ = 1;

    auto sent = send(Message::make(MessageType::Health, seq));
    if (!sent) return sent.error();

    auto reply = await_reply(seq, MessageType::Health, timeout);
    if (!reply) return reply.error();
    return std::string(reply->begin(), reply->end());
}

Result<std::vector<uint8_t>> HeadClient::await_reply(uint32_t sequence,
                                                     MessageType expected,
                                                     std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto received = socket_.receive(static_cast<uint32_t>(std::max<int64_t>(1, remaining.count())));
        if (!received) return received.error();
        if (!received->has_value()) continue;

        auto decoded = MessageCodec::decode((*received)->data);
        if (!decoded || decoded->sequence != sequence) continue;

        switch (decoded->type) {
            case MessageType::Chunk: {
                auto chunk = PayloadCodec::decode_chunk(decoded->payload);
                if (!chunk) return chunk.error();
                auto ingested = reassembler_.ingest(*chunk, std::chrono::steady_clock::now());
                if (!ingested) return ingested.error();
                if (ingested->has_value()) return std::move(**ingested);
                break;
            }
            case MessageType::Error: {
                auto err = PayloadCodec::decode_error(decoded->payload);
                if (!err) return err.error();
                return Error{err->code, err->message};
            }
            default:
                if (decoded->type == expected) return std::move(decoded->payload);
                break;
        }
    }

    reassembler_.discard(sequence);
    return Error{ErrorCode::TaskTimeout,
                 "no reply for sequence " + std::to_string(sequence)
                 + " within " + std::to_string(timeout.count()) + "ms"};
}

}  // namespace hydramesh
