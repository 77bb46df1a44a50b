/**
 * @file payloads.cpp
 * @brief PayloadCodec framing for heartbeat, error and chunk payloads.
 * @author Dimitris Kafetzis
 */

#include "protocol/payloads.hpp"

#include <algorithm>
#include <cstddef>

namespace hydramesh {

namespace {

constexpr size_t HEARTBEAT_FIXED_SIZE = 4;  // port + load_hint + id_len

bool is_known_error_code(uint8_t raw) {
    return (raw >= 0x01 && raw <= 0x09) || raw == 0xFF;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Heartbeat
// ─────────────────────────────────────────────

std::vector<uint8_t> PayloadCodec::encode_heartbeat(const HeartbeatPayload& hb) {
    std::vector<uint8_t> buf;
    auto id_len = std::min<size_t>(hb.worker_id.size(), 255);
    buf.reserve(HEARTBEAT_FIXED_SIZE + id_len + hb.capabilities.size());

    MessageCodec::put_u16(buf, hb.port);
    buf.push_back(hb.load_hint);
    buf.push_back(static_cast<uint8_t>(id_len));
    buf.insert(buf.end(), hb.worker_id.begin(), hb.worker_id.begin() + static_cast<ptrdiff_t>(id_len));
    buf.insert(buf.end(), hb.capabilities.begin(), hb.capabilities.end());

    return buf;
}

Result<HeartbeatPayload> PayloadCodec::decode_heartbeat(std::span<const uint8_t> data) {
    if (data.size() < HEARTBEAT_FIXED_SIZE) {
        return Error{ErrorCode::Malformed, "Heartbeat payload too short"};
    }

    const uint8_t* p = data.data();
    HeartbeatPayload hb;
    hb.port = MessageCodec::get_u16(p);
    hb.load_hint = p[2];

    size_t id_len = p[3];
    if (HEARTBEAT_FIXED_SIZE + id_len > data.size()) {
        return Error{ErrorCode::Malformed, "Heartbeat worker id overruns payload"};
    }
    hb.worker_id.assign(reinterpret_cast<const char*>(p + HEARTBEAT_FIXED_SIZE), id_len);
    hb.capabilities.assign(p + HEARTBEAT_FIXED_SIZE + id_len, p + data.size());

    return hb;
}

// ─────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────

std::vector<uint8_t> PayloadCodec::encode_error(const ErrorPayload& err) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + err.message.size());
    buf.push_back(static_cast<uint8_t>(err.code));
    buf.insert(buf.end(), err.message.begin(), err.message.end());
    return buf;
}

Result<ErrorPayload> PayloadCodec::decode_error(std::span<const uint8_t> data) {
    if (data.empty()) {
        return Error{ErrorCode::Malformed, "Error payload is empty"};
    }

    ErrorPayload err;
    // Unknown codes from newer peers still carry a usable message.
    err.code = is_known_error_code(data[0]) ? static_cast<ErrorCode>(data[0]) : ErrorCode::Internal;
    err.message.assign(reinterpret_cast<const char*>(data.data() + 1), data.size() - 1);
    return err;
}

// ─────────────────────────────────────────────
// Chunk
// ─────────────────────────────────────────────

std::vector<uint8_t> PayloadCodec::encode_chunk(const ChunkPayload& chunk) {
    std::vector<uint8_t> buf;
    buf.reserve(CHUNK_HEADER_SIZE + chunk.data.size());

    MessageCodec::put_u32(buf, chunk.message_id);
    MessageCodec::put_u32(buf, chunk.offset);
    MessageCodec::put_u32(buf, chunk.total_len);
    buf.insert(buf.end(), chunk.data.begin(), chunk.data.end());

    return buf;
}

Result<ChunkPayload> PayloadCodec::decode_chunk(std::span<const uint8_t> data) {
    if (data.size() < CHUNK_HEADER_SIZE) {
        return Error{ErrorCode::Malformed, "Chunk payload shorter than chunk header"};
    }

    const uint8_t* p = data.data();
    ChunkPayload chunk;
    chunk.message_id = MessageCodec::get_u32(p);
    chunk.offset = MessageCodec::get_u32(p + 4);
    chunk.total_len = MessageCodec::get_u32(p + 8);
    chunk.data.assign(p + CHUNK_HEADER_SIZE, p + data.size());

    return chunk;
}

// ─────────────────────────────────────────────
// Message helpers
// ─────────────────────────────────────────────

Message make_error_message(uint32_t sequence, ErrorCode code, std::string text) {
    return Message::make(MessageType::Error, sequence,
                         PayloadCodec::encode_error(ErrorPayload{code, std::move(text)}));
}

Message make_error_message(uint32_t sequence, const Error& error) {
    return make_error_message(sequence, error.code, error.message);
}

}  // namespace hydramesh
