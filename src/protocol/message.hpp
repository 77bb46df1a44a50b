/**
 * @file message.hpp
 * @brief Wire message and the fixed-header codec.
 * @author Dimitris Kafetzis
 *
 * Every datagram is one message:
 *
 *   offset 0   version      (1 byte)
 *   offset 1   type         (1 byte)
 *   offset 2   sequence     (4 bytes, big-endian)
 *   offset 6   timestamp    (8 bytes, big-endian, microseconds since epoch)
 *   offset 14  payload_len  (4 bytes, big-endian)
 *   offset 18  payload      (payload_len bytes)
 *
 * The older 17-byte header without a version byte is a different wire
 * revision and is not accepted.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace hydramesh {

inline constexpr uint8_t PROTOCOL_VERSION = 1;
inline constexpr size_t HEADER_SIZE = 18;

enum class MessageType : uint8_t {
    Heartbeat = 0x01,
    Task      = 0x02,
    Result    = 0x03,
    Health    = 0x04,
    Chunk     = 0x06,
    Error     = 0xFF
};

[[nodiscard]] constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Heartbeat: return "heartbeat";
        case MessageType::Task:      return "task";
        case MessageType::Result:    return "result";
        case MessageType::Health:    return "health";
        case MessageType::Chunk:     return "chunk";
        case MessageType::Error:     return "error";
    }
    return "unknown";
}

/// True if @p raw is one of the MessageType values.
[[nodiscard]] constexpr bool is_known_type(uint8_t raw) noexcept {
    switch (raw) {
        case 0x01: case 0x02: case 0x03: case 0x04: case 0x06: case 0xFF:
            return true;
        default:
            return false;
    }
}

/**
 * @brief One unit of wire transmission.
 */
struct Message {
    uint8_t version{PROTOCOL_VERSION};
    MessageType type{MessageType::Heartbeat};
    uint32_t sequence{0};
    uint64_t timestamp_us{0};
    std::vector<uint8_t> payload;

    bool operator==(const Message&) const = default;

    /// Build a message stamped with the current wall-clock time.
    [[nodiscard]] static Message make(MessageType type, uint32_t sequence,
                                      std::vector<uint8_t> payload = {});
};

/**
 * @brief Stateless encoder/decoder for the fixed header.
 *
 * All multi-byte fields are big-endian. Pure transform: no I/O, no clocks.
 */
struct MessageCodec {
    [[nodiscard]] static std::vector<uint8_t> encode(const Message& msg);

    /**
     * @brief Decode one datagram.
     *
     * Fails with ErrorCode::Malformed when the buffer is shorter than the
     * header, the type is unknown, or payload_len differs from the trailing
     * byte count; with ErrorCode::UnsupportedVersion for a foreign version.
     */
    [[nodiscard]] static Result<Message> decode(std::span<const uint8_t> data);

    static void put_u16(std::vector<uint8_t>& buf, uint16_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static void put_u64(std::vector<uint8_t>& buf, uint64_t val);
    [[nodiscard]] static uint16_t get_u16(const uint8_t* p);
    [[nodiscard]] static uint32_t get_u32(const uint8_t* p);
    [[nodiscard]] static uint64_t get_u64(const uint8_t* p);
};

}  // namespace hydramesh
