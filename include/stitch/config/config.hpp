#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "stitch/reassembly/reassembly_engine.hpp"
#include "stitch/reassembly/session_registry.hpp"
#include "stitch/router/message_router.hpp"
#include "stitch/storage/supabase_sink.hpp"
#include "stitch/transport/udp_bridge.hpp"
#include "stitch/utils/logging.hpp"
#include "stitch/utils/worker_pool.hpp"

namespace stitch::config {

inline constexpr uint16_t DEFAULT_BRIDGE_PORT = 1884;
inline constexpr const char* DEFAULT_TOPIC_PREFIX = "esp32cam";

enum class StorageBackend {
    FILESYSTEM,
    SUPABASE
};

const char* storage_backend_to_string(StorageBackend backend);
std::optional<StorageBackend> string_to_storage_backend(const std::string& str);

struct StorageSettings {
    StorageBackend backend = StorageBackend::FILESYSTEM;
    std::string root_dir = "stitch-data";
    storage::SupabaseConfig supabase;
};

// Everything stitchd needs to run
struct StitchConfig {
    transport::UdpBridgeConfig bridge;
    router::RouterConfig router;
    reassembly::RegistryConfig registry;
    uint64_t sweep_interval_ms = 1000;
    utils::WorkerPoolConfig workers;
    reassembly::EngineConfig engine;
    StorageSettings storage;
    utils::LogConfig logging;

    StitchConfig();
};

// Command-line overrides; unset options keep the file/environment value
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> bind_host;
    std::optional<uint16_t> bind_port;
    std::optional<std::string> topic_prefix;
    std::optional<uint64_t> idle_timeout_ms;
    std::optional<size_t> workers;
    std::optional<std::string> backend;
    std::optional<std::string> root_dir;
    std::optional<std::string> bucket;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool check_only{false};  // Validate configuration and exit
};

// Parse INI configuration
// Returns nullopt on a malformed value; error receives "<section>.<key>: <reason>"
std::optional<StitchConfig> parse_config(std::istream& input, std::string* error = nullptr);

std::optional<StitchConfig> load_config(const std::string& path, std::string* error = nullptr);

bool save_config(const StitchConfig& config, const std::string& path);

// Parse stitchd arguments
// Returns nullopt for --help or a usage error; exit_code receives the status to exit with
std::optional<CliOverrides> parse_cli(int argc, char* argv[], int* exit_code = nullptr);

// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

std::optional<std::string> process_env(const std::string& name);

// Apply SUPABASE_URL, SUPABASE_SERVICE_ROLE_KEY, SUPABASE_BUCKET and STITCH_TOPIC_PREFIX
void apply_environment(StitchConfig& config, const EnvLookup& env = process_env);

// Apply command-line overrides over a loaded configuration
// Returns false if an override has an invalid value
bool merge_config(StitchConfig& config, const CliOverrides& overlay, std::string* error = nullptr);

struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const StitchConfig& config);

}  // namespace stitch::config
