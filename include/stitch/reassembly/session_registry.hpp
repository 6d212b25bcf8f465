#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "stitch/reassembly/events.hpp"
#include "stitch/reassembly/transfer_session.hpp"

namespace stitch::reassembly {

// Configuration for the session registry
struct RegistryConfig {
    uint64_t idle_timeout_ms = 30000;         // Fail sessions with no chunk progress
    size_t max_sessions = 64;                 // Max tracked sources
    size_t max_transfer_bytes = 16 * 1048576; // Max buffered bytes per transfer (16MB)
};

// Registry statistics
struct RegistryStats {
    uint64_t sessions_started{0};
    uint64_t sessions_finalized{0};
    uint64_t sessions_superseded{0};
    uint64_t sessions_expired{0};
    uint64_t chunks_accepted{0};
    uint64_t chunks_duplicate{0};
    uint64_t chunks_out_of_range{0};  // Stored, never assembled
    uint64_t chunks_rejected{0};
    uint64_t end_markers_ignored{0};
};

// Point-in-time view of one live session
struct SessionSnapshot {
    std::string source;
    std::string transfer_id;
    SessionState state{SessionState::AWAITING_METADATA};
    std::optional<uint32_t> expected_chunks;
    size_t chunks_received{0};
    size_t bytes_received{0};
};

// Owns every live TransferSession, keyed by source (topic prefix).
// One non-terminal session per source; events for a source are applied
// under that source's lock so different sources never wait on each other.
class SessionRegistry {
public:
    using FinalizeHandler = std::function<void(std::unique_ptr<TransferSession> session)>;

    explicit SessionRegistry(const RegistryConfig& config = {});

    // Disable copy
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Receives sessions that reached FINALIZING; ownership moves with the call
    void set_finalize_handler(FinalizeHandler handler);

    // Receives failures decided by the registry (superseded, timeout, too large)
    void set_outcome_callback(OutcomeCallback callback);

    // Start a transfer; a non-terminal session on the same source is superseded.
    // Metadata refused as TRANSFER_IN_FLIGHT still cancels the source's session, and
    // the source's chunks are dropped until its next end marker or accepted metadata.
    ErrorKind on_metadata(const std::string& source, const MetadataEvent& event, uint64_t now_ms);

    // Record a chunk; buffered provisionally if no metadata arrived yet
    ErrorKind on_chunk(const std::string& source, ChunkIndex index,
                       std::span<const uint8_t> payload, uint64_t now_ms);

    // Hand the source's session to the finalize handler
    ErrorKind on_end_marker(const std::string& source, uint64_t now_ms);

    // Route any event
    ErrorKind dispatch(const std::string& source, const Event& event, uint64_t now_ms);

    // Fail sessions idle for longer than idle_timeout_ms and drop empty sources
    // Returns number of sessions expired
    size_t sweep_expired(uint64_t now_ms);

    // Called once a handed-off transfer reaches a terminal state
    void release_transfer(const std::string& transfer_id);

    [[nodiscard]] std::optional<SessionSnapshot> find(const std::string& source) const;
    [[nodiscard]] size_t active_sessions() const;
    [[nodiscard]] bool is_finalizing(const std::string& transfer_id) const;
    [[nodiscard]] RegistryStats stats() const;

private:
    struct Stream {
        std::mutex mutex;
        std::unique_ptr<TransferSession> session;
        std::optional<uint64_t> discarding_since_ms;  // Metadata was refused; drop chunks
        bool retired{false};
    };

    RegistryConfig config_;

    // Guards streams_, transfer id sets and stats_.
    // Lock order: a Stream mutex may be held while taking mutex_, never the reverse.
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Stream>> streams_;
    std::unordered_map<std::string, std::string> receiving_ids_;  // transfer id -> source
    std::unordered_set<std::string> finalizing_ids_;
    RegistryStats stats_{};
    std::atomic<uint64_t> ids_synthesized_{0};

    FinalizeHandler finalize_handler_;
    OutcomeCallback outcome_callback_;

    // Locked stream for source, creating it if requested and allowed
    std::shared_ptr<Stream> acquire(const std::string& source, bool create,
                                    std::unique_lock<std::mutex>& lock, ErrorKind* error);

    // img-<UTC YYYYmmddHHMMSS>-<n>, unique for this registry
    std::string synthesize_transfer_id();

    // Fail the stream's session, unregister it, and return its outcome
    TransferOutcome drop_session(Stream& stream, ErrorKind reason, std::string detail);

    void emit(const std::vector<TransferOutcome>& outcomes);
};

}  // namespace stitch::reassembly
