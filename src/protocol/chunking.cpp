/**
 * @file chunking.cpp
 * @brief Chunk splitting and ChunkReassembler implementation.
 * @author Dimitris Kafetzis
 */

#include "protocol/chunking.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace hydramesh {

// ─────────────────────────────────────────────
// Sending side
// ─────────────────────────────────────────────

std::vector<Message> split_into_chunks(uint32_t sequence,
                                       std::span<const uint8_t> payload,
                                       size_t max_fragment_bytes) {
    std::vector<Message> chunks;
    if (payload.empty() || max_fragment_bytes == 0) return chunks;

    chunks.reserve((payload.size() + max_fragment_bytes - 1) / max_fragment_bytes);

    for (size_t offset = 0; offset < payload.size(); offset += max_fragment_bytes) {
        auto len = std::min(max_fragment_bytes, payload.size() - offset);

        ChunkPayload chunk;
        chunk.message_id = sequence;
        chunk.offset = static_cast<uint32_t>(offset);
        chunk.total_len = static_cast<uint32_t>(payload.size());
        chunk.data.assign(payload.begin() + static_cast<ptrdiff_t>(offset),
                          payload.begin() + static_cast<ptrdiff_t>(offset + len));

        chunks.push_back(Message::make(MessageType::Chunk, sequence,
                                       PayloadCodec::encode_chunk(chunk)));
    }

    return chunks;
}

std::vector<Message> make_payload_messages(MessageType type,
                                           uint32_t sequence,
                                           std::vector<uint8_t> payload,
                                           size_t max_fragment_bytes) {
    if (payload.size() <= max_fragment_bytes) {
        std::vector<Message> single;
        single.push_back(Message::make(type, sequence, std::move(payload)));
        return single;
    }
    return split_into_chunks(sequence, payload, max_fragment_bytes);
}

// ─────────────────────────────────────────────
// ChunkReassembler
// ─────────────────────────────────────────────

ChunkReassembler::ChunkReassembler(ReassemblyOptions options)
    : options_(options) {}

Result<Reassembled> ChunkReassembler::ingest(const ChunkPayload& chunk, SteadyTime now) {
    return ingest(chunk.message_id, chunk.offset, chunk.data, chunk.total_len, now);
}

Result<Reassembled> ChunkReassembler::ingest(uint32_t message_id,
                                             uint32_t offset,
                                             std::span<const uint8_t> bytes,
                                             uint32_t total_len,
                                             SteadyTime now) {
    if (bytes.empty() || total_len == 0) {
        return Error{ErrorCode::Malformed, "Empty chunk for message " + std::to_string(message_id)};
    }
    if (static_cast<uint64_t>(offset) + bytes.size() > total_len) {
        return Error{ErrorCode::Malformed,
                     "Chunk [" + std::to_string(offset) + ", +" + std::to_string(bytes.size())
                     + ") exceeds total length " + std::to_string(total_len)};
    }
    if (total_len > options_.max_total_bytes) {
        return Error{ErrorCode::Malformed,
                     "Chunked payload of " + std::to_string(total_len) + " bytes exceeds limit"};
    }

    std::lock_guard lock(mutex_);

    if (finished_.count(message_id) > 0) {
        // Late duplicate of a payload that was already yielded or evicted.
        return Reassembled{};
    }

    auto it = buffers_.find(message_id);
    if (it == buffers_.end()) {
        if (buffers_.size() >= options_.max_buffers) {
            return Error{ErrorCode::Capacity, "Too many payloads in reassembly"};
        }
        ReassemblyBuffer buffer;
        buffer.message_id = message_id;
        buffer.expected_total_len = total_len;
        buffer.created_at = now;
        buffer.last_fragment_at = now;
        it = buffers_.emplace(message_id, std::move(buffer)).first;
    }

    auto& buffer = it->second;
    if (buffer.expected_total_len != total_len) {
        return Error{ErrorCode::Malformed,
                     "Chunk total length " + std::to_string(total_len)
                     + " disagrees with " + std::to_string(buffer.expected_total_len)};
    }

    auto end = static_cast<uint64_t>(offset) + bytes.size();
    auto next = buffer.fragments.lower_bound(offset);

    if (next != buffer.fragments.end() && next->first == offset) {
        if (next->second.size() == bytes.size()) {
            buffer.last_fragment_at = now;
            return Reassembled{};  // duplicate
        }
        return Error{ErrorCode::Malformed, "Chunk at offset " + std::to_string(offset)
                                           + " overlaps a fragment of different length"};
    }
    if (next != buffer.fragments.end() && end > next->first) {
        return Error{ErrorCode::Malformed, "Chunk at offset " + std::to_string(offset)
                                           + " overlaps the following fragment"};
    }
    if (next != buffer.fragments.begin()) {
        auto prev = std::prev(next);
        if (static_cast<uint64_t>(prev->first) + prev->second.size() > offset) {
            return Error{ErrorCode::Malformed, "Chunk at offset " + std::to_string(offset)
                                               + " overlaps the preceding fragment"};
        }
    }

    buffer.fragments.emplace_hint(next, offset, std::vector<uint8_t>(bytes.begin(), bytes.end()));
    buffer.received_len += static_cast<uint32_t>(bytes.size());
    buffer.last_fragment_at = now;
    buffered_bytes_ += bytes.size();

    if (!buffer.complete()) {
        return Reassembled{};
    }

    std::vector<uint8_t> payload;
    payload.reserve(buffer.expected_total_len);
    for (auto& [frag_offset, data] : buffer.fragments) {
        payload.insert(payload.end(), data.begin(), data.end());
    }

    buffered_bytes_ -= buffer.received_len;
    buffers_.erase(it);
    remember_finished(message_id);

    return Reassembled{std::move(payload)};
}

std::vector<uint32_t> ChunkReassembler::evict_stale(SteadyTime now) {
    std::vector<uint32_t> evicted;

    std::lock_guard lock(mutex_);
    for (auto it = buffers_.begin(); it != buffers_.end(); ) {
        if (now - it->second.last_fragment_at > options_.idle_timeout) {
            evicted.push_back(it->first);
            buffered_bytes_ -= it->second.received_len;
            remember_finished(it->first);
            it = buffers_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

void ChunkReassembler::discard(uint32_t message_id) {
    std::lock_guard lock(mutex_);
    auto it = buffers_.find(message_id);
    if (it == buffers_.end()) return;
    buffered_bytes_ -= it->second.received_len;
    buffers_.erase(it);
    remember_finished(message_id);
}

size_t ChunkReassembler::pending_count() const {
    std::lock_guard lock(mutex_);
    return buffers_.size();
}

uint64_t ChunkReassembler::buffered_bytes() const {
    std::lock_guard lock(mutex_);
    return buffered_bytes_;
}

void ChunkReassembler::remember_finished(uint32_t message_id) {
    if (options_.finished_history == 0) return;
    if (finished_.insert(message_id).second) {
        finished_order_.push_back(message_id);
    }
    while (finished_order_.size() > options_.finished_history) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

}  // namespace hydramesh
