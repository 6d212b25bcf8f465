#include "stitch/reassembly/transfer_session.hpp"

#include <utility>

namespace stitch::reassembly {

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::AWAITING_METADATA: return "awaiting_metadata";
        case SessionState::RECEIVING: return "receiving";
        case SessionState::FINALIZING: return "finalizing";
        case SessionState::COMPLETED: return "completed";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(std::string source, uint64_t now_ms)
    : source_(std::move(source)),
      started_at_ms_(now_ms),
      last_progress_ms_(now_ms) {
}

bool TransferSession::begin(std::string transfer_id, uint32_t expected_chunks, uint64_t now_ms) {
    if (state_ != SessionState::AWAITING_METADATA || expected_chunks == 0) {
        return false;
    }

    transfer_id_ = std::move(transfer_id);
    expected_chunks_ = expected_chunks;
    buffer_.prune_from(expected_chunks);
    started_at_ms_ = now_ms;
    last_progress_ms_ = now_ms;
    state_ = SessionState::RECEIVING;
    return true;
}

ErrorKind TransferSession::add_chunk(ChunkIndex index, std::span<const uint8_t> payload,
                                     uint64_t now_ms) {
    if (state_ != SessionState::RECEIVING && state_ != SessionState::AWAITING_METADATA) {
        return ErrorKind::NO_METADATA;
    }

    auto result = buffer_.put(index, payload);
    if (result != ErrorKind::NONE) {
        return result;
    }

    // Stored, but assemble() and completeness only look at [0, expected)
    if (expected_chunks_ && index >= *expected_chunks_) {
        return ErrorKind::CHUNK_OUT_OF_RANGE;
    }

    last_progress_ms_ = now_ms;
    return ErrorKind::NONE;
}

ErrorKind TransferSession::request_finalize() {
    if (state_ != SessionState::RECEIVING) {
        return ErrorKind::NO_METADATA;
    }

    state_ = SessionState::FINALIZING;
    return ErrorKind::NONE;
}

bool TransferSession::complete() {
    if (state_ != SessionState::FINALIZING) {
        return false;
    }

    state_ = SessionState::COMPLETED;
    return true;
}

bool TransferSession::fail(ErrorKind reason, std::string detail) {
    if (is_terminal()) {
        return false;
    }

    state_ = SessionState::FAILED;
    failure_ = reason;
    failure_detail_ = std::move(detail);
    buffer_.clear();
    return true;
}

bool TransferSession::is_complete() const {
    return expected_chunks_ && buffer_.is_complete(*expected_chunks_);
}

}  // namespace stitch::reassembly
