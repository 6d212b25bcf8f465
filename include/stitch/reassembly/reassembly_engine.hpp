#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "stitch/reassembly/events.hpp"
#include "stitch/reassembly/session_registry.hpp"
#include "stitch/reassembly/transfer_session.hpp"
#include "stitch/storage/storage_sink.hpp"
#include "stitch/utils/worker_pool.hpp"

namespace stitch::reassembly {

// Where and how completed artifacts are stored
struct EngineConfig {
    std::string bucket = "petri-images";
    std::string table = "gxp_raw_observations";
    std::string content_type = "image/jpeg";
    std::string extension = ".jpg";
    std::string device_id = "dev-default";  // gxp_id column of the metadata row
};

// Engine statistics
struct EngineStats {
    uint64_t transfers_completed{0};
    uint64_t transfers_incomplete{0};
    uint64_t storage_failures{0};
    uint64_t bytes_stored{0};
};

// Turns finalizing sessions into stored artifacts.
// Each session is finalized exactly once: one upload and one metadata insert
// on success, no storage call at all when chunks are missing.
class ReassemblyEngine {
public:
    // pool may be null, in which case submit() finalizes on the caller's thread
    ReassemblyEngine(storage::StorageSink& sink, const EngineConfig& config = {},
                     utils::WorkerPool* pool = nullptr);

    // Disable copy
    ReassemblyEngine(const ReassemblyEngine&) = delete;
    ReassemblyEngine& operator=(const ReassemblyEngine&) = delete;

    // Install this engine as the registry's finalize handler
    void attach(SessionRegistry& registry);

    // Set callback for every finalized transfer
    void set_completion_callback(OutcomeCallback callback);

    // Take ownership of a FINALIZING session and finalize it on the pool
    // Returns false if the pool refused it (the transfer is then failed and reported)
    bool submit(std::unique_ptr<TransferSession> session);

    // Assemble, upload and record one session synchronously
    // Exceptions from the sink propagate; submit() turns them into STORAGE_ERROR
    TransferOutcome finalize(TransferSession& session);

    [[nodiscard]] EngineStats stats() const;

    // Storage key for a transfer, e.g. "img-1" + ".jpg"
    [[nodiscard]] static std::string artifact_key(const std::string& transfer_id,
                                                  const std::string& extension);

private:
    storage::StorageSink& sink_;
    EngineConfig config_;
    utils::WorkerPool* pool_;
    SessionRegistry* registry_{nullptr};
    OutcomeCallback completion_callback_;

    mutable std::mutex stats_mutex_;
    EngineStats stats_{};

    void run(TransferSession& session);
    void report(const TransferOutcome& outcome);
};

}  // namespace stitch::reassembly
