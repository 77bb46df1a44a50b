/**
 * @file chunking.hpp
 * @brief Splitting oversized payloads into CHUNK messages and reassembling them.
 * @author Dimitris Kafetzis
 *
 * A payload larger than the per-datagram limit travels as a series of CHUNK
 * messages, each carrying (message_id, offset, total_len) so fragments can
 * arrive in any order and be retransmitted independently. The receiving side
 * buffers fragments per message_id and yields the whole payload exactly once.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/message.hpp"
#include "protocol/payloads.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hydramesh {

// ─────────────────────────────────────────────
// Sending side
// ─────────────────────────────────────────────

/**
 * @brief Split @p payload into sequential CHUNK messages for @p sequence.
 *
 * Each fragment carries at most @p max_fragment_bytes of data. The chunk
 * framing's message_id equals @p sequence.
 */
[[nodiscard]] std::vector<Message> split_into_chunks(uint32_t sequence,
                                                     std::span<const uint8_t> payload,
                                                     size_t max_fragment_bytes);

/**
 * @brief One message of @p type when the payload fits, otherwise a CHUNK series.
 */
[[nodiscard]] std::vector<Message> make_payload_messages(MessageType type,
                                                         uint32_t sequence,
                                                         std::vector<uint8_t> payload,
                                                         size_t max_fragment_bytes);

// ─────────────────────────────────────────────
// Receiving side
// ─────────────────────────────────────────────

/// Whole payload once a message completes, nullopt while fragments are missing.
using Reassembled = std::optional<std::vector<uint8_t>>;

struct ReassemblyOptions {
    std::chrono::milliseconds idle_timeout{30000};
    uint64_t max_total_bytes = 64ULL * 1024 * 1024;
    size_t max_buffers = 1024;
    size_t finished_history = 4096;      ///< Ids remembered to drop late duplicates
};

/**
 * @brief In-progress reassembly of one multi-chunk payload.
 *
 * Invariant: fragments never overlap and received_len is the sum of their lengths.
 */
struct ReassemblyBuffer {
    uint32_t message_id{0};
    uint32_t expected_total_len{0};
    uint32_t received_len{0};
    std::map<uint32_t, std::vector<uint8_t>> fragments;  ///< keyed by offset
    SteadyTime created_at;
    SteadyTime last_fragment_at;

    [[nodiscard]] bool complete() const noexcept { return received_len == expected_total_len; }
};

/**
 * @brief Thread-safe per-message fragment buffers with idle-timeout eviction.
 */
class ChunkReassembler {
public:
    explicit ChunkReassembler(ReassemblyOptions options = {});

    /**
     * @brief Add one fragment.
     *
     * Out-of-order fragments and exact duplicates (same offset and length)
     * are accepted. Overlapping, oversized or inconsistent fragments fail
     * with ErrorCode::Malformed and leave the buffer untouched.
     */
    Result<Reassembled> ingest(uint32_t message_id,
                               uint32_t offset,
                               std::span<const uint8_t> bytes,
                               uint32_t total_len,
                               SteadyTime now);

    Result<Reassembled> ingest(const ChunkPayload& chunk, SteadyTime now);

    /// Evict buffers with no fragment for longer than the idle timeout.
    std::vector<uint32_t> evict_stale(SteadyTime now);

    /// Drop a buffer without reporting it (e.g. its task already failed).
    void discard(uint32_t message_id);

    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] uint64_t buffered_bytes() const;

private:
    void remember_finished(uint32_t message_id);

    ReassemblyOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<uint32_t, ReassemblyBuffer> buffers_;
    uint64_t buffered_bytes_{0};

    std::deque<uint32_t> finished_order_;
    std::unordered_set<uint32_t> finished_;
};

}  // namespace hydramesh
