#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

#include "stitch/reassembly/error.hpp"

namespace stitch::reassembly {

using ChunkIndex = uint16_t;
using Bytes = std::vector<uint8_t>;

// Holding area for the chunks of one transfer, keyed by chunk index.
// The buffer does not know the expected count; callers pass it to the
// completeness queries so that chunks buffered before metadata can be kept.
class ChunkBuffer {
public:
    ChunkBuffer() = default;

    // Record a chunk payload
    // Returns DUPLICATE_CHUNK and leaves the buffer untouched if the index is present
    ErrorKind put(ChunkIndex index, std::span<const uint8_t> payload);

    [[nodiscard]] bool contains(ChunkIndex index) const { return chunks_.count(index) > 0; }

    // True iff every index in [0, expected_count) is present
    [[nodiscard]] bool is_complete(size_t expected_count) const;

    // Indices in [0, expected_count) that have not arrived, ascending
    [[nodiscard]] std::vector<ChunkIndex> missing(size_t expected_count) const;

    // Concatenate chunks 0..expected_count-1 in index order.
    // Returns nullopt if any are absent and, when requested, lists them in *missing_out.
    // Indices >= expected_count never contribute to the output.
    [[nodiscard]] std::optional<Bytes> assemble(size_t expected_count,
                                                std::vector<ChunkIndex>* missing_out = nullptr) const;

    // Drop every chunk with index >= expected_count
    // Returns number of chunks removed
    size_t prune_from(size_t expected_count);

    // Payload of a recorded chunk, or nullptr
    [[nodiscard]] const Bytes* find(ChunkIndex index) const;

    [[nodiscard]] size_t chunk_count() const { return chunks_.size(); }
    [[nodiscard]] size_t total_bytes() const { return total_bytes_; }
    [[nodiscard]] bool empty() const { return chunks_.empty(); }

    void clear();

private:
    std::map<ChunkIndex, Bytes> chunks_;
    size_t total_bytes_{0};
};

}  // namespace stitch::reassembly
