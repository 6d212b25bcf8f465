#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "stitch/reassembly/chunk_buffer.hpp"
#include "stitch/reassembly/error.hpp"
#include "stitch/reassembly/transfer_session.hpp"

namespace stitch::reassembly {

// Start of a transfer (info topic)
struct MetadataEvent {
    uint32_t total_chunks{0};
    std::optional<std::string> transfer_id;  // Synthesized from UTC time if absent
};

// One indexed fragment (chunk topic, non-empty payload)
struct ChunkEvent {
    ChunkIndex index{0};
    Bytes payload;
};

// Zero-length payload on the chunk topic
struct EndMarkerEvent {};

using Event = std::variant<MetadataEvent, ChunkEvent, EndMarkerEvent>;

// Final result of a transfer, reported once per session
struct TransferOutcome {
    std::string source;
    std::string transfer_id;
    SessionState state{SessionState::FAILED};
    ErrorKind error{ErrorKind::NONE};
    std::vector<ChunkIndex> missing;  // Set for MISSING_CHUNKS
    std::string artifact_url;         // Set for COMPLETED
    std::string record_id;            // Set for COMPLETED
    size_t bytes{0};
    std::string detail;

    [[nodiscard]] bool ok() const { return state == SessionState::COMPLETED; }
};

using OutcomeCallback = std::function<void(const TransferOutcome& outcome)>;

}  // namespace stitch::reassembly
