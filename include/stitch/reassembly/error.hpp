#pragma once

#include <cstdint>

namespace stitch::reassembly {

// Error taxonomy shared by the buffer, sessions, registry and engine.
// Every kind is terminal for the affected session at most, never for the dispatcher.
enum class ErrorKind {
    NONE,
    DUPLICATE_CHUNK,     // Index already recorded, arrival ignored
    MALFORMED_CHUNK,     // Chunk payload shorter than the 2-byte index
    MALFORMED_METADATA,  // Info payload unparsable or total_chunks out of range
    NO_METADATA,         // End marker without a session in Receiving
    MISSING_CHUNKS,      // End marker with gaps, nothing persisted
    STORAGE_ERROR,       // Upload or record insert failed
    SUPERSEDED,          // Replaced by newer metadata before completion
    TIMEOUT,             // No chunk progress within the idle timeout
    CHUNK_OUT_OF_RANGE,  // Index >= expected chunk count; kept but never assembled
    TRANSFER_TOO_LARGE,  // Buffered bytes exceeded the configured limit
    TRANSFER_IN_FLIGHT,  // Metadata for a transfer id that is still finalizing
    UNKNOWN_TOPIC,       // Message on a topic the router does not handle
    TOO_MANY_SESSIONS    // Registry is at its session limit
};

const char* error_kind_to_string(ErrorKind kind);

}  // namespace stitch::reassembly
