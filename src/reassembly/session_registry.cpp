#include "stitch/reassembly/session_registry.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "stitch/utils/time.hpp"

namespace stitch::reassembly {

namespace {

// Chunk indices are 16-bit on the wire
constexpr uint32_t MAX_CHUNK_COUNT = 65536;

}  // namespace

SessionRegistry::SessionRegistry(const RegistryConfig& config)
    : config_(config) {
}

std::string SessionRegistry::synthesize_transfer_id() {
    // Several sources may send id-less metadata within the same second
    return "img-" + utils::utc_compact() + "-" + std::to_string(++ids_synthesized_);
}

void SessionRegistry::set_finalize_handler(FinalizeHandler handler) {
    finalize_handler_ = std::move(handler);
}

void SessionRegistry::set_outcome_callback(OutcomeCallback callback) {
    outcome_callback_ = std::move(callback);
}

std::shared_ptr<SessionRegistry::Stream> SessionRegistry::acquire(
    const std::string& source, bool create, std::unique_lock<std::mutex>& lock, ErrorKind* error) {

    for (;;) {
        std::shared_ptr<Stream> stream;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            auto it = streams_.find(source);
            if (it != streams_.end()) {
                stream = it->second;
            } else if (create) {
                if (streams_.size() >= config_.max_sessions) {
                    if (error) {
                        *error = ErrorKind::TOO_MANY_SESSIONS;
                    }
                    return nullptr;
                }
                stream = std::make_shared<Stream>();
                streams_.emplace(source, stream);
            } else {
                return nullptr;
            }
        }

        lock = std::unique_lock<std::mutex>(stream->mutex);
        if (!stream->retired) {
            return stream;
        }
        // Retired by a concurrent sweep after we looked it up; look again
        lock.unlock();
    }
}

TransferOutcome SessionRegistry::drop_session(Stream& stream, ErrorKind reason, std::string detail) {
    auto& session = *stream.session;

    TransferOutcome outcome;
    outcome.source = session.source();
    outcome.transfer_id = session.transfer_id();
    outcome.bytes = session.buffer().total_bytes();
    outcome.state = SessionState::FAILED;
    outcome.error = reason;
    outcome.detail = detail;

    session.fail(reason, std::move(detail));

    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = receiving_ids_.find(outcome.transfer_id);
        if (it != receiving_ids_.end() && it->second == outcome.source) {
            receiving_ids_.erase(it);
        }
        if (reason == ErrorKind::TIMEOUT) {
            ++stats_.sessions_expired;
        } else if (reason == ErrorKind::SUPERSEDED) {
            ++stats_.sessions_superseded;
        }
    }

    stream.session.reset();
    return outcome;
}

void SessionRegistry::emit(const std::vector<TransferOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        if (outcome_callback_) {
            outcome_callback_(outcome);
        }
    }
}

ErrorKind SessionRegistry::on_metadata(const std::string& source, const MetadataEvent& event,
                                       uint64_t now_ms) {
    if (event.total_chunks == 0 || event.total_chunks > MAX_CHUNK_COUNT) {
        spdlog::warn("Rejecting metadata on {}: total_chunks={}", source, event.total_chunks);
        return ErrorKind::MALFORMED_METADATA;
    }

    std::string transfer_id = event.transfer_id && !event.transfer_id->empty()
                                  ? *event.transfer_id
                                  : synthesize_transfer_id();

    std::vector<TransferOutcome> outcomes;
    ErrorKind result = ErrorKind::NONE;
    {
        std::unique_lock<std::mutex> lock;
        ErrorKind error = ErrorKind::NONE;
        auto stream = acquire(source, true, lock, &error);
        if (!stream) {
            spdlog::warn("Rejecting metadata for {} on {}: {}", transfer_id, source,
                         error_kind_to_string(error));
            return error;
        }

        auto* previous = stream->session.get();
        bool supersede = previous && previous->state() != SessionState::AWAITING_METADATA;

        {
            std::lock_guard<std::mutex> guard(mutex_);
            auto receiving = receiving_ids_.find(transfer_id);
            if (finalizing_ids_.count(transfer_id) > 0 ||
                (receiving != receiving_ids_.end() && receiving->second != source)) {
                result = ErrorKind::TRANSFER_IN_FLIGHT;
            } else {
                if (supersede) {
                    auto old = receiving_ids_.find(previous->transfer_id());
                    if (old != receiving_ids_.end() && old->second == source) {
                        receiving_ids_.erase(old);
                    }
                    ++stats_.sessions_superseded;
                }
                receiving_ids_[transfer_id] = source;
                ++stats_.sessions_started;
            }
        }

        if (result == ErrorKind::TRANSFER_IN_FLIGHT) {
            spdlog::warn("Rejecting metadata on {}: transfer {} is already in flight",
                         source, transfer_id);
            // The source has moved on; nothing it sent before or sends next may
            // end up in an older buffer
            if (supersede) {
                spdlog::warn("Transfer {} on {} abandoned with {}/{} chunks: superseded by {}",
                             previous->transfer_id(), source, previous->buffer().chunk_count(),
                             previous->expected_chunks().value_or(0), transfer_id);
                outcomes.push_back(drop_session(*stream, ErrorKind::SUPERSEDED,
                                                "superseded by refused " + transfer_id));
            } else if (previous) {
                spdlog::warn("Discarding {} provisional chunks on {}",
                             previous->buffer().chunk_count(), source);
                stream->session.reset();
            }
            stream->discarding_since_ms = now_ms;
        } else {
            if (supersede) {
                TransferOutcome outcome;
                outcome.source = source;
                outcome.transfer_id = previous->transfer_id();
                outcome.bytes = previous->buffer().total_bytes();
                outcome.error = ErrorKind::SUPERSEDED;
                outcome.detail = "superseded by " + transfer_id;

                spdlog::warn("Transfer {} on {} abandoned with {}/{} chunks: superseded by {}",
                             previous->transfer_id(), source, previous->buffer().chunk_count(),
                             previous->expected_chunks().value_or(0), transfer_id);

                previous->fail(ErrorKind::SUPERSEDED, outcome.detail);
                stream->session.reset();
                outcomes.push_back(std::move(outcome));
            }

            if (!stream->session) {
                stream->session = std::make_unique<TransferSession>(source, now_ms);
            } else {
                spdlog::debug("Adopting {} provisional chunks on {} into {}",
                              stream->session->buffer().chunk_count(), source, transfer_id);
            }

            stream->discarding_since_ms.reset();
            stream->session->begin(transfer_id, event.total_chunks, now_ms);
            spdlog::info("Expecting {} chunks for {} on {}", event.total_chunks, transfer_id, source);
        }
    }

    emit(outcomes);
    return result;
}

ErrorKind SessionRegistry::on_chunk(const std::string& source, ChunkIndex index,
                                    std::span<const uint8_t> payload, uint64_t now_ms) {
    std::vector<TransferOutcome> outcomes;
    ErrorKind result = ErrorKind::NONE;
    {
        std::unique_lock<std::mutex> lock;
        ErrorKind error = ErrorKind::NONE;
        auto stream = acquire(source, true, lock, &error);
        if (!stream) {
            spdlog::warn("Dropping chunk {} on {}: {}", index, source, error_kind_to_string(error));
            std::lock_guard<std::mutex> guard(mutex_);
            ++stats_.chunks_rejected;
            return error;
        }

        if (!stream->session && stream->discarding_since_ms) {
            stream->discarding_since_ms = now_ms;
            spdlog::warn("Dropping chunk {} on {}: its metadata was refused", index, source);
            std::lock_guard<std::mutex> guard(mutex_);
            ++stats_.chunks_rejected;
            return ErrorKind::NO_METADATA;
        }

        if (!stream->session) {
            spdlog::warn("Chunk {} on {} arrived before metadata, buffering provisionally",
                         index, source);
            stream->session = std::make_unique<TransferSession>(source, now_ms);
        }

        auto& session = *stream->session;
        result = session.add_chunk(index, payload, now_ms);

        bool stored = result == ErrorKind::NONE || result == ErrorKind::CHUNK_OUT_OF_RANGE;
        if (stored && session.buffer().total_bytes() > config_.max_transfer_bytes) {
            spdlog::error("Transfer {} on {} exceeded {} bytes, dropping it",
                          session.transfer_id(), source, config_.max_transfer_bytes);
            outcomes.push_back(drop_session(*stream, ErrorKind::TRANSFER_TOO_LARGE,
                                            "buffered bytes exceeded limit"));
            result = ErrorKind::TRANSFER_TOO_LARGE;
        }

        switch (result) {
            case ErrorKind::NONE: {
                spdlog::debug("Chunk {} received ({} bytes) on {}", index, payload.size(), source);
                std::lock_guard<std::mutex> guard(mutex_);
                ++stats_.chunks_accepted;
                break;
            }
            case ErrorKind::CHUNK_OUT_OF_RANGE: {
                spdlog::warn("Chunk {} on {} is beyond the expected {} chunks, it will not be assembled",
                             index, source, session.expected_chunks().value_or(0));
                std::lock_guard<std::mutex> guard(mutex_);
                ++stats_.chunks_out_of_range;
                break;
            }
            case ErrorKind::TRANSFER_TOO_LARGE:
                break;
            case ErrorKind::DUPLICATE_CHUNK: {
                spdlog::debug("Duplicate chunk {} on {}, skipping", index, source);
                std::lock_guard<std::mutex> guard(mutex_);
                ++stats_.chunks_duplicate;
                break;
            }
            default: {
                spdlog::warn("Dropping chunk {} on {}: {} (expected {} chunks)", index, source,
                             error_kind_to_string(result), session.expected_chunks().value_or(0));
                std::lock_guard<std::mutex> guard(mutex_);
                ++stats_.chunks_rejected;
                break;
            }
        }
    }

    emit(outcomes);
    return result;
}

ErrorKind SessionRegistry::on_end_marker(const std::string& source, uint64_t now_ms) {
    std::unique_ptr<TransferSession> handoff;
    {
        std::unique_lock<std::mutex> lock;
        auto stream = acquire(source, false, lock, nullptr);
        if (stream && !stream->session) {
            // Ends a refused transfer
            stream->discarding_since_ms.reset();
        }
        if (!stream || !stream->session ||
            stream->session->request_finalize() != ErrorKind::NONE) {
            spdlog::warn("No metadata received before end marker on {}", source);
            std::lock_guard<std::mutex> guard(mutex_);
            ++stats_.end_markers_ignored;
            return ErrorKind::NO_METADATA;
        }

        handoff = std::move(stream->session);

        std::lock_guard<std::mutex> guard(mutex_);
        auto it = receiving_ids_.find(handoff->transfer_id());
        if (it != receiving_ids_.end() && it->second == source) {
            receiving_ids_.erase(it);
        }
        finalizing_ids_.insert(handoff->transfer_id());
        ++stats_.sessions_finalized;
    }

    spdlog::info("End marker received for {} on {} after {} ms, stitching {}/{} chunks",
                 handoff->transfer_id(), source, now_ms - handoff->started_at_ms(),
                 handoff->buffer().chunk_count(), handoff->expected_chunks().value_or(0));

    if (!finalize_handler_) {
        TransferOutcome outcome;
        outcome.source = source;
        outcome.transfer_id = handoff->transfer_id();
        outcome.error = ErrorKind::STORAGE_ERROR;
        outcome.detail = "no finalize handler installed";
        spdlog::error("Transfer {} dropped: {}", outcome.transfer_id, outcome.detail);
        handoff->fail(outcome.error, outcome.detail);
        release_transfer(outcome.transfer_id);
        emit({outcome});
        return ErrorKind::STORAGE_ERROR;
    }

    finalize_handler_(std::move(handoff));
    return ErrorKind::NONE;
}

ErrorKind SessionRegistry::dispatch(const std::string& source, const Event& event, uint64_t now_ms) {
    if (const auto* meta = std::get_if<MetadataEvent>(&event)) {
        return on_metadata(source, *meta, now_ms);
    }
    if (const auto* chunk = std::get_if<ChunkEvent>(&event)) {
        return on_chunk(source, chunk->index, chunk->payload, now_ms);
    }
    return on_end_marker(source, now_ms);
}

size_t SessionRegistry::sweep_expired(uint64_t now_ms) {
    std::vector<std::pair<std::string, std::shared_ptr<Stream>>> snapshot;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        snapshot.assign(streams_.begin(), streams_.end());
    }

    std::vector<TransferOutcome> outcomes;
    size_t expired = 0;

    for (auto& [source, stream] : snapshot) {
        std::lock_guard<std::mutex> lock(stream->mutex);
        if (stream->retired) {
            continue;
        }

        if (stream->session && stream->session->idle_ms(now_ms) > config_.idle_timeout_ms) {
            auto idle = stream->session->idle_ms(now_ms);
            spdlog::error("Transfer {} on {} timed out with {}/{} chunks after {} ms idle",
                          stream->session->transfer_id(), source,
                          stream->session->buffer().chunk_count(),
                          stream->session->expected_chunks().value_or(0), idle);
            outcomes.push_back(drop_session(*stream, ErrorKind::TIMEOUT,
                                            "no chunk progress for " + std::to_string(idle) + " ms"));
            ++expired;
        }

        // Keep the refusal around while the source is still sending
        if (!stream->session && stream->discarding_since_ms &&
            (now_ms < *stream->discarding_since_ms ||
             now_ms - *stream->discarding_since_ms <= config_.idle_timeout_ms)) {
            continue;
        }

        if (!stream->session) {
            stream->retired = true;
            std::lock_guard<std::mutex> guard(mutex_);
            auto it = streams_.find(source);
            if (it != streams_.end() && it->second == stream) {
                streams_.erase(it);
            }
        }
    }

    emit(outcomes);
    return expired;
}

void SessionRegistry::release_transfer(const std::string& transfer_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    finalizing_ids_.erase(transfer_id);
}

std::optional<SessionSnapshot> SessionRegistry::find(const std::string& source) const {
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = streams_.find(source);
        if (it == streams_.end()) {
            return std::nullopt;
        }
        stream = it->second;
    }

    std::lock_guard<std::mutex> lock(stream->mutex);
    if (stream->retired || !stream->session) {
        return std::nullopt;
    }

    const auto& session = *stream->session;
    SessionSnapshot snap;
    snap.source = session.source();
    snap.transfer_id = session.transfer_id();
    snap.state = session.state();
    snap.expected_chunks = session.expected_chunks();
    snap.chunks_received = session.buffer().chunk_count();
    snap.bytes_received = session.buffer().total_bytes();
    return snap;
}

size_t SessionRegistry::active_sessions() const {
    std::vector<std::shared_ptr<Stream>> snapshot;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (const auto& [source, stream] : streams_) {
            snapshot.push_back(stream);
        }
    }

    size_t count = 0;
    for (const auto& stream : snapshot) {
        std::lock_guard<std::mutex> lock(stream->mutex);
        if (!stream->retired && stream->session) {
            ++count;
        }
    }
    return count;
}

bool SessionRegistry::is_finalizing(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return finalizing_ids_.count(transfer_id) > 0;
}

RegistryStats SessionRegistry::stats() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return stats_;
}

}  // namespace stitch::reassembly
