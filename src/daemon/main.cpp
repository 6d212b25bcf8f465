#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "stitch/config/config.hpp"
#include "stitch/crypto/crypto.hpp"
#include "stitch/reassembly/reassembly_engine.hpp"
#include "stitch/reassembly/session_registry.hpp"
#include "stitch/router/message_router.hpp"
#include "stitch/storage/filesystem_sink.hpp"
#include "stitch/storage/supabase_sink.hpp"
#include "stitch/transport/udp_bridge.hpp"
#include "stitch/utils/logging.hpp"
#include "stitch/utils/time.hpp"
#include "stitch/utils/worker_pool.hpp"

using namespace stitch;

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

namespace {

std::unique_ptr<storage::StorageSink> make_sink(const config::StitchConfig& config) {
    switch (config.storage.backend) {
        case config::StorageBackend::SUPABASE:
            return std::make_unique<storage::SupabaseSink>(config.storage.supabase);
        case config::StorageBackend::FILESYSTEM:
            break;
    }
    return std::make_unique<storage::FilesystemSink>(config.storage.root_dir);
}

void log_outcome(const reassembly::TransferOutcome& outcome) {
    if (outcome.ok()) {
        spdlog::info("Stored {} from {} ({} bytes) at {}", outcome.transfer_id, outcome.source,
                     outcome.bytes, outcome.artifact_url);
        return;
    }
    spdlog::error("Transfer {} from {} failed: {}{}{}", outcome.transfer_id.empty() ? "-" : outcome.transfer_id,
                  outcome.source, reassembly::error_kind_to_string(outcome.error),
                  outcome.detail.empty() ? "" : " - ", outcome.detail);
}

}  // namespace

int main(int argc, char* argv[]) {
    int exit_code = 0;
    auto overrides = config::parse_cli(argc, argv, &exit_code);
    if (!overrides) {
        return exit_code;
    }

    config::StitchConfig cfg;
    if (overrides->config_path) {
        std::string error;
        auto loaded = config::load_config(*overrides->config_path, &error);
        if (!loaded) {
            std::cerr << "Invalid configuration: " << error << "\n";
            return 1;
        }
        cfg = std::move(*loaded);
    }
    config::apply_environment(cfg);

    std::string merge_error;
    if (!config::merge_config(cfg, *overrides, &merge_error)) {
        std::cerr << "Invalid option: " << merge_error << "\n";
        return 1;
    }

    utils::init_logging(cfg.logging);

    auto validation = config::validate_config(cfg);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("Config: {}", warning);
    }
    for (const auto& error : validation.errors) {
        spdlog::error("Config: {}", error);
    }
    if (!validation.valid) {
        return 1;
    }
    if (overrides->check_only) {
        spdlog::info("Configuration OK");
        return 0;
    }

    if (!crypto::init()) {
        spdlog::error("Failed to initialize crypto subsystem");
        return 1;
    }

    if (cfg.storage.backend == config::StorageBackend::FILESYSTEM) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.storage.root_dir, ec);
        if (ec) {
            spdlog::error("Cannot create storage root {}: {}", cfg.storage.root_dir, ec.message());
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto sink = make_sink(cfg);
    utils::WorkerPool pool(cfg.workers);

    reassembly::SessionRegistry registry(cfg.registry);
    registry.set_outcome_callback(log_outcome);

    reassembly::ReassemblyEngine engine(*sink, cfg.engine, &pool);
    engine.set_completion_callback(log_outcome);
    engine.attach(registry);

    router::MessageRouter router(registry, cfg.router);

    transport::UdpBridgeSource source(cfg.bridge);
    bool started = source.start([&router](transport::Message message) {
        router.route(message, utils::time_ms());
    });
    if (!started) {
        spdlog::error("Failed to start {} source", source.name());
        return 1;
    }

    spdlog::info("stitchd running: prefix '{}', storage {} ({} workers)",
                 cfg.router.prefix, sink->name(), pool.worker_count());

    uint64_t last_sweep = utils::time_ms();
    while (g_running) {
        source.poll(100);

        uint64_t now = utils::time_ms();
        if (now - last_sweep >= cfg.sweep_interval_ms) {
            registry.sweep_expired(now);
            last_sweep = now;
        }
    }

    spdlog::info("Shutting down, finishing {} queued uploads", pool.queued());
    source.stop();
    pool.shutdown();

    auto rs = registry.stats();
    auto es = engine.stats();
    spdlog::info("Sessions started {}, superseded {}, expired {}; stored {}, incomplete {}, storage failures {}",
                 rs.sessions_started, rs.sessions_superseded, rs.sessions_expired,
                 es.transfers_completed, es.transfers_incomplete, es.storage_failures);
    return 0;
}
