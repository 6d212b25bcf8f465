#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "stitch/reassembly/error.hpp"
#include "stitch/reassembly/events.hpp"

namespace stitch::router {

/*
Info topic:   UTF-8 JSON {"total_chunks": <int>, "image_id": "<string>"}  (image_id optional)
Chunk topic:  [2B index, big-endian][raw bytes]
              zero-length payload = end marker
*/

inline constexpr size_t CHUNK_INDEX_SIZE = 2;
inline constexpr uint32_t MAX_TOTAL_CHUNKS = 65536;

// Decode an info payload
// Returns nullopt and sets *error to MALFORMED_METADATA on invalid JSON,
// missing or non-integer total_chunks, total_chunks outside [1, 65536],
// or a non-string image_id. *detail receives a human readable reason.
std::optional<reassembly::MetadataEvent> decode_metadata(std::span<const uint8_t> payload,
                                                         reassembly::ErrorKind* error = nullptr,
                                                         std::string* detail = nullptr);

// Decode a chunk-topic payload into a ChunkEvent or an EndMarkerEvent
// Returns nullopt and sets *error to MALFORMED_CHUNK for 1-byte payloads
std::optional<reassembly::Event> decode_chunk(std::span<const uint8_t> payload,
                                              reassembly::ErrorKind* error = nullptr);

// True if text is well-formed UTF-8 (no overlongs, surrogates or code points past U+10FFFF)
bool is_valid_utf8(std::string_view text);

// Encode an info payload
std::string encode_metadata(uint32_t total_chunks, const std::optional<std::string>& transfer_id);

// Encode one chunk-topic payload
std::vector<uint8_t> encode_chunk(reassembly::ChunkIndex index, std::span<const uint8_t> data);

// Split data into chunk bodies of at most chunk_size bytes
// Returns empty if chunk_size is 0 or more than MAX_TOTAL_CHUNKS bodies would be needed
std::vector<std::vector<uint8_t>> split_payload(std::span<const uint8_t> data, size_t chunk_size);

}  // namespace stitch::router
