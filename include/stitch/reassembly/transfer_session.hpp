#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "stitch/reassembly/chunk_buffer.hpp"
#include "stitch/reassembly/error.hpp"

namespace stitch::reassembly {

// Transfer session state
enum class SessionState {
    AWAITING_METADATA,
    RECEIVING,
    FINALIZING,
    COMPLETED,
    FAILED
};

const char* session_state_to_string(SessionState state);

// Tracking state for one in-flight transfer.
// Not thread-safe; the registry serializes access per source.
class TransferSession {
public:
    // Provisional session, created before metadata is known
    TransferSession(std::string source, uint64_t now_ms);

    // Disable copy
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // AWAITING_METADATA -> RECEIVING.
    // Chunks buffered provisionally are kept, except indices >= expected_chunks.
    // Returns false if the session is not awaiting metadata or expected_chunks is 0.
    bool begin(std::string transfer_id, uint32_t expected_chunks, uint64_t now_ms);

    // Record a chunk (RECEIVING or AWAITING_METADATA only).
    // An index >= expected_chunks is stored but reported as CHUNK_OUT_OF_RANGE
    // and does not count as progress.
    ErrorKind add_chunk(ChunkIndex index, std::span<const uint8_t> payload, uint64_t now_ms);

    // RECEIVING -> FINALIZING on end marker.
    // Returns NO_METADATA if still awaiting metadata; no transition happens then.
    ErrorKind request_finalize();

    // FINALIZING -> COMPLETED
    bool complete();

    // Any non-terminal state -> FAILED
    bool fail(ErrorKind reason, std::string detail = {});

    [[nodiscard]] const std::string& source() const { return source_; }
    [[nodiscard]] const std::string& transfer_id() const { return transfer_id_; }
    [[nodiscard]] std::optional<uint32_t> expected_chunks() const { return expected_chunks_; }
    [[nodiscard]] SessionState state() const { return state_; }
    [[nodiscard]] const ChunkBuffer& buffer() const { return buffer_; }
    [[nodiscard]] uint64_t started_at_ms() const { return started_at_ms_; }
    [[nodiscard]] uint64_t last_progress_ms() const { return last_progress_ms_; }
    [[nodiscard]] ErrorKind failure() const { return failure_; }
    [[nodiscard]] const std::string& failure_detail() const { return failure_detail_; }

    [[nodiscard]] bool is_terminal() const {
        return state_ == SessionState::COMPLETED || state_ == SessionState::FAILED;
    }

    // Milliseconds since the last metadata or accepted chunk
    [[nodiscard]] uint64_t idle_ms(uint64_t now_ms) const {
        return now_ms > last_progress_ms_ ? now_ms - last_progress_ms_ : 0;
    }

    // True iff expected count is known and every chunk is present
    [[nodiscard]] bool is_complete() const;

private:
    std::string source_;
    std::string transfer_id_;
    std::optional<uint32_t> expected_chunks_;
    SessionState state_{SessionState::AWAITING_METADATA};
    ChunkBuffer buffer_;
    uint64_t started_at_ms_;
    uint64_t last_progress_ms_;
    ErrorKind failure_{ErrorKind::NONE};
    std::string failure_detail_;
};

}  // namespace stitch::reassembly
