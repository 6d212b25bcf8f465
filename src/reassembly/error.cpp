#include "stitch/reassembly/error.hpp"

namespace stitch::reassembly {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::DUPLICATE_CHUNK: return "duplicate_chunk";
        case ErrorKind::MALFORMED_CHUNK: return "malformed_chunk";
        case ErrorKind::MALFORMED_METADATA: return "malformed_metadata";
        case ErrorKind::NO_METADATA: return "no_metadata";
        case ErrorKind::MISSING_CHUNKS: return "missing_chunks";
        case ErrorKind::STORAGE_ERROR: return "storage_error";
        case ErrorKind::SUPERSEDED: return "superseded";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::CHUNK_OUT_OF_RANGE: return "chunk_out_of_range";
        case ErrorKind::TRANSFER_TOO_LARGE: return "transfer_too_large";
        case ErrorKind::TRANSFER_IN_FLIGHT: return "transfer_in_flight";
        case ErrorKind::UNKNOWN_TOPIC: return "unknown_topic";
        case ErrorKind::TOO_MANY_SESSIONS: return "too_many_sessions";
    }
    return "unknown";
}

}  // namespace stitch::reassembly
