/**
 * @file message.cpp
 * @brief MessageCodec binary serialization of the 18-byte header.
 * @author Dimitris Kafetzis
 */

#include "protocol/message.hpp"

#include <string>

namespace hydramesh {

Message Message::make(MessageType type, uint32_t sequence, std::vector<uint8_t> payload) {
    Message msg;
    msg.type = type;
    msg.sequence = sequence;
    msg.timestamp_us = now_micros();
    msg.payload = std::move(payload);
    return msg;
}

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void MessageCodec::put_u16(std::vector<uint8_t>& buf, uint16_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

void MessageCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

void MessageCodec::put_u64(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

uint16_t MessageCodec::get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t MessageCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

uint64_t MessageCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

// ─────────────────────────────────────────────
// Encode / Decode
// ─────────────────────────────────────────────

std::vector<uint8_t> MessageCodec::encode(const Message& msg) {
    std::vector<uint8_t> buf;
    buf.reserve(HEADER_SIZE + msg.payload.size());

    buf.push_back(msg.version);
    buf.push_back(static_cast<uint8_t>(msg.type));
    put_u32(buf, msg.sequence);
    put_u64(buf, msg.timestamp_us);
    put_u32(buf, static_cast<uint32_t>(msg.payload.size()));
    buf.insert(buf.end(), msg.payload.begin(), msg.payload.end());

    return buf;
}

Result<Message> MessageCodec::decode(std::span<const uint8_t> data) {
    if (data.size() < HEADER_SIZE) {
        return Error{ErrorCode::Malformed,
                     "Datagram shorter than header: " + std::to_string(data.size()) + " bytes"};
    }

    const uint8_t* p = data.data();

    if (p[0] != PROTOCOL_VERSION) {
        return Error{ErrorCode::UnsupportedVersion,
                     "Unsupported protocol version " + std::to_string(p[0])};
    }
    if (!is_known_type(p[1])) {
        return Error{ErrorCode::Malformed, "Unknown message type " + std::to_string(p[1])};
    }

    uint32_t payload_len = get_u32(p + 14);
    size_t remaining = data.size() - HEADER_SIZE;
    if (payload_len != remaining) {
        return Error{ErrorCode::Malformed,
                     "payload_len " + std::to_string(payload_len) + " does not match "
                     + std::to_string(remaining) + " trailing bytes"};
    }

    Message msg;
    msg.version = p[0];
    msg.type = static_cast<MessageType>(p[1]);
    msg.sequence = get_u32(p + 2);
    msg.timestamp_us = get_u64(p + 6);
    msg.payload.assign(p + HEADER_SIZE, p + data.size());
    return msg;
}

}  // namespace hydramesh
