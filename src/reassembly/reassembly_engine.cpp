#include "stitch/reassembly/reassembly_engine.hpp"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>
#include <exception>
#include <utility>

#include "stitch/crypto/crypto.hpp"
#include "stitch/utils/time.hpp"

namespace stitch::reassembly {

namespace {

// Comma separated, truncated after a few dozen entries
std::string format_indices(const std::vector<ChunkIndex>& indices) {
    constexpr size_t MAX_LISTED = 32;
    std::string out;
    for (size_t i = 0; i < indices.size() && i < MAX_LISTED; ++i) {
        if (i > 0) {
            out += ",";
        }
        out += std::to_string(indices[i]);
    }
    if (indices.size() > MAX_LISTED) {
        out += ",... (" + std::to_string(indices.size() - MAX_LISTED) + " more)";
    }
    return out;
}

}  // namespace

ReassemblyEngine::ReassemblyEngine(storage::StorageSink& sink, const EngineConfig& config,
                                   utils::WorkerPool* pool)
    : sink_(sink), config_(config), pool_(pool) {
}

void ReassemblyEngine::attach(SessionRegistry& registry) {
    registry_ = &registry;
    registry.set_finalize_handler([this](std::unique_ptr<TransferSession> session) {
        submit(std::move(session));
    });
}

void ReassemblyEngine::set_completion_callback(OutcomeCallback callback) {
    completion_callback_ = std::move(callback);
}

std::string ReassemblyEngine::artifact_key(const std::string& transfer_id,
                                           const std::string& extension) {
    return transfer_id + extension;
}

bool ReassemblyEngine::submit(std::unique_ptr<TransferSession> session) {
    if (!pool_) {
        run(*session);
        return true;
    }

    // std::function needs a copyable callable
    std::shared_ptr<TransferSession> shared(std::move(session));
    if (pool_->submit([this, shared] { run(*shared); })) {
        return true;
    }

    TransferOutcome outcome;
    outcome.source = shared->source();
    outcome.transfer_id = shared->transfer_id();
    outcome.error = ErrorKind::STORAGE_ERROR;
    outcome.detail = "upload queue saturated";
    spdlog::error("Transfer {} failed: {}", outcome.transfer_id, outcome.detail);
    shared->fail(outcome.error, outcome.detail);
    report(outcome);
    return false;
}

void ReassemblyEngine::run(TransferSession& session) {
    TransferOutcome outcome;
    try {
        outcome = finalize(session);
    } catch (const std::exception& e) {
        // A throwing sink fails this transfer only; it must still be reported
        outcome = TransferOutcome{};
        outcome.source = session.source();
        outcome.transfer_id = session.transfer_id();
        outcome.error = ErrorKind::STORAGE_ERROR;
        outcome.detail = std::string("storage threw: ") + e.what();
        spdlog::error("Transfer {} failed: {}", outcome.transfer_id, outcome.detail);
        session.fail(outcome.error, outcome.detail);
    }
    report(outcome);
}

TransferOutcome ReassemblyEngine::finalize(TransferSession& session) {
    TransferOutcome outcome;
    outcome.source = session.source();
    outcome.transfer_id = session.transfer_id();

    if (session.state() != SessionState::FINALIZING || !session.expected_chunks()) {
        outcome.error = ErrorKind::NO_METADATA;
        outcome.detail = std::string("session is ") + session_state_to_string(session.state());
        spdlog::error("Refusing to finalize {}: {}", outcome.transfer_id, outcome.detail);
        return outcome;
    }

    uint32_t expected = *session.expected_chunks();
    auto assembled = session.buffer().assemble(expected, &outcome.missing);
    if (!assembled) {
        outcome.error = ErrorKind::MISSING_CHUNKS;
        outcome.detail = "missing " + std::to_string(outcome.missing.size()) + " of " +
                         std::to_string(expected) + " chunks";
        spdlog::error("Transfer {} incomplete, missing chunks [{}]", outcome.transfer_id,
                      format_indices(outcome.missing));
        session.fail(outcome.error, outcome.detail);
        return outcome;
    }

    outcome.bytes = assembled->size();
    spdlog::info("All {} chunks stitched for {} ({} bytes)", expected, outcome.transfer_id,
                 outcome.bytes);

    auto key = artifact_key(outcome.transfer_id, config_.extension);
    auto uploaded = sink_.upload(config_.bucket, key, *assembled, config_.content_type);
    if (!uploaded.ok) {
        outcome.error = ErrorKind::STORAGE_ERROR;
        outcome.detail = "upload failed: " + uploaded.error;
        spdlog::error("Transfer {} failed: {}", outcome.transfer_id, outcome.detail);
        session.fail(outcome.error, outcome.detail);
        return outcome;
    }
    outcome.artifact_url = uploaded.value;

    nlohmann::json fields = {
        {"gxp_id", config_.device_id},
        {"image_id", outcome.transfer_id},
        {"image_url", outcome.artifact_url},
        {"chunk_status", "complete"},
        {"submitted_at", utils::utc_iso8601()},
        {"raw_payload", {
            {"source", outcome.source},
            {"total_chunks", expected},
            {"bytes", outcome.bytes},
            {"sha256", crypto::to_hex(crypto::sha256(*assembled))}
        }}
    };

    auto inserted = sink_.insert_record(config_.table, fields);
    if (!inserted.ok) {
        outcome.error = ErrorKind::STORAGE_ERROR;
        outcome.detail = "record insert failed: " + inserted.error;
        spdlog::error("Transfer {} failed: {}", outcome.transfer_id, outcome.detail);
        session.fail(outcome.error, outcome.detail);
        return outcome;
    }
    outcome.record_id = inserted.value;

    session.complete();
    outcome.state = SessionState::COMPLETED;
    spdlog::info("Uploaded {} to {} and inserted record {}", key, outcome.artifact_url,
                 outcome.record_id);
    return outcome;
}

void ReassemblyEngine::report(const TransferOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (outcome.ok()) {
            ++stats_.transfers_completed;
            stats_.bytes_stored += outcome.bytes;
        } else if (outcome.error == ErrorKind::MISSING_CHUNKS) {
            ++stats_.transfers_incomplete;
        } else if (outcome.error == ErrorKind::STORAGE_ERROR) {
            ++stats_.storage_failures;
        }
    }

    if (registry_) {
        registry_->release_transfer(outcome.transfer_id);
    }

    if (completion_callback_) {
        completion_callback_(outcome);
    }
}

EngineStats ReassemblyEngine::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace stitch::reassembly
