#include "stitch/reassembly/chunk_buffer.hpp"

namespace stitch::reassembly {

ErrorKind ChunkBuffer::put(ChunkIndex index, std::span<const uint8_t> payload) {
    // First arrival wins, later copies are never merged
    if (chunks_.count(index) > 0) {
        return ErrorKind::DUPLICATE_CHUNK;
    }

    chunks_.emplace(index, Bytes(payload.begin(), payload.end()));
    total_bytes_ += payload.size();
    return ErrorKind::NONE;
}

bool ChunkBuffer::is_complete(size_t expected_count) const {
    if (expected_count == 0 || chunks_.size() < expected_count) {
        return false;
    }

    for (size_t i = 0; i < expected_count; ++i) {
        if (chunks_.count(static_cast<ChunkIndex>(i)) == 0) {
            return false;
        }
    }
    return true;
}

std::vector<ChunkIndex> ChunkBuffer::missing(size_t expected_count) const {
    std::vector<ChunkIndex> absent;
    for (size_t i = 0; i < expected_count; ++i) {
        if (chunks_.count(static_cast<ChunkIndex>(i)) == 0) {
            absent.push_back(static_cast<ChunkIndex>(i));
        }
    }
    return absent;
}

std::optional<Bytes> ChunkBuffer::assemble(size_t expected_count,
                                           std::vector<ChunkIndex>* missing_out) const {
    auto absent = missing(expected_count);
    if (expected_count == 0 || !absent.empty()) {
        if (missing_out) {
            *missing_out = std::move(absent);
        }
        return std::nullopt;
    }

    size_t size = 0;
    for (size_t i = 0; i < expected_count; ++i) {
        size += chunks_.at(static_cast<ChunkIndex>(i)).size();
    }

    Bytes result;
    result.reserve(size);

    // std::map iterates in key order; stop before out-of-range indices
    for (const auto& [index, payload] : chunks_) {
        if (index >= expected_count) {
            break;
        }
        result.insert(result.end(), payload.begin(), payload.end());
    }

    if (missing_out) {
        missing_out->clear();
    }
    return result;
}

size_t ChunkBuffer::prune_from(size_t expected_count) {
    size_t removed = 0;

    for (auto it = chunks_.begin(); it != chunks_.end(); ) {
        if (it->first >= expected_count) {
            total_bytes_ -= it->second.size();
            it = chunks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    return removed;
}

const Bytes* ChunkBuffer::find(ChunkIndex index) const {
    auto it = chunks_.find(index);
    if (it == chunks_.end()) {
        return nullptr;
    }
    return &it->second;
}

void ChunkBuffer::clear() {
    chunks_.clear();
    total_bytes_ = 0;
}

}  // namespace stitch::reassembly
