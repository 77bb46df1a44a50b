/**
 * @file payloads.hpp
 * @brief Typed payload framings carried inside HEARTBEAT, ERROR and CHUNK messages.
 * @author Dimitris Kafetzis
 *
 * Wire formats (all multi-byte values are big-endian):
 *
 * Heartbeat:
 *   [2B advertised port][1B load_hint][1B id_len][id bytes][capabilities...]
 *
 * Error:
 *   [1B error code][utf-8 message]
 *
 * Chunk:
 *   [4B message_id][4B offset][4B total_len][fragment bytes...]
 *
 * TASK and RESULT payloads are opaque inference bytes and have no framing.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/message.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace hydramesh {

inline constexpr size_t CHUNK_HEADER_SIZE = 12;

/**
 * @brief Liveness beacon sent by a worker.
 *
 * An advertised port of 0 means "reply to the datagram source port".
 * An empty worker_id means the head derives the identity from the address.
 */
struct HeartbeatPayload {
    uint16_t port{0};
    uint8_t load_hint{0};
    WorkerId worker_id;
    std::vector<uint8_t> capabilities;

    bool operator==(const HeartbeatPayload&) const = default;
};

struct ErrorPayload {
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    bool operator==(const ErrorPayload&) const = default;
};

struct ChunkPayload {
    uint32_t message_id{0};
    uint32_t offset{0};
    uint32_t total_len{0};
    std::vector<uint8_t> data;

    bool operator==(const ChunkPayload&) const = default;
};

struct PayloadCodec {
    [[nodiscard]] static std::vector<uint8_t> encode_heartbeat(const HeartbeatPayload& hb);
    [[nodiscard]] static Result<HeartbeatPayload> decode_heartbeat(std::span<const uint8_t> data);

    [[nodiscard]] static std::vector<uint8_t> encode_error(const ErrorPayload& err);
    [[nodiscard]] static Result<ErrorPayload> decode_error(std::span<const uint8_t> data);

    [[nodiscard]] static std::vector<uint8_t> encode_chunk(const ChunkPayload& chunk);
    [[nodiscard]] static Result<ChunkPayload> decode_chunk(std::span<const uint8_t> data);
};

/// ERROR message for @p sequence carrying @p code and @p text.
[[nodiscard]] Message make_error_message(uint32_t sequence, ErrorCode code, std::string text);

/// ERROR message built from a failed Result.
[[nodiscard]] Message make_error_message(uint32_t sequence, const Error& error);

}  // namespace hydramesh
