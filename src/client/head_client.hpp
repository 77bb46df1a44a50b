/**
 * @file head_client.hpp
 * @brief Blocking client for submitting tasks to a head and querying its health.
 * @author Dimitris Kafetzis
 *
 * One request at a time: send, then wait for the reply carrying the same
 * sequence. Replies may arrive as one message or as a CHUNK series.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "network/udp_socket.hpp"
#include "protocol/chunking.hpp"
#include "protocol/message.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace hydramesh {

class HeadClient {
public:
    explicit HeadClient(Endpoint head);

    /// Resolve the head address and bind the local socket. Port 0 lets the OS choose.
    Result<void> open(uint16_t local_port = 0);
    void close();

    /**
     * @brief Submit one TASK and wait for its outcome.
     *
     * An ERROR reply becomes an Error with the wire code; no reply within
     * @p timeout becomes ErrorCode::TaskTimeout.
     */
    Result<std::vector<uint8_t>> submit(std::span<const uint8_t> request,
                                        std::chrono::milliseconds timeout);

    /// Ask the head for its health report (JSON text).
    Result<std::string> health(std::chrono::milliseconds timeout);

    /// Send a TASK without waiting; returns the sequence used.
    Result<uint32_t> send_task(std::span<const uint8_t> request);

    /// Wait for the reply to @p sequence of type @p expected.
    Result<std::vector<uint8_t>> await_reply(uint32_t sequence,
                                             MessageType expected,
                                             std::chrono::milliseconds timeout);

    [[nodiscard]] uint16_t local_port() const noexcept { return socket_.local_port(); }
    [[nodiscard]] const Endpoint& head() const noexcept { return head_; }

private:
    Result<void> send(const Message& msg);

    Endpoint head_;
    UdpSocket socket_;
    ChunkReassembler reassembler_;
    uint32_t next_sequence_{1};
};

}  // namespace hydramesh
