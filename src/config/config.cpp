#include "stitch/config/config.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "stitch/storage/filesystem_sink.hpp"

namespace stitch::config {

namespace {

// Minimal INI reader: [section], key = value, '#' and ';' comments
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
        size_t line{0};
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;
        size_t line_no = 0;

        while (std::getline(input, line)) {
            ++line_no;
            line = trim(line);

            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = trim(line.substr(1, line.size() - 2));
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                continue;
            }

            std::string key = trim(line.substr(0, eq_pos));
            std::string value = trim(line.substr(eq_pos + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }

            entries.push_back({current_section, key, value, line_no});
        }

        return entries;
    }

private:
    static std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

uint64_t parse_unsigned(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("expected a non-negative integer");
    }
    size_t pos = 0;
    uint64_t result = std::stoull(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

uint16_t parse_port(const std::string& value) {
    uint64_t port = parse_unsigned(value);
    if (port > 65535) {
        throw std::out_of_range("port out of range");
    }
    return static_cast<uint16_t>(port);
}

// Returns false for an unknown key so the caller can warn about it
bool apply_entry(StitchConfig& config, const std::string& section, const std::string& key,
                 const std::string& value) {
    if (section == "transport") {
        if (key == "bind_host" || key == "bind") {
            config.bridge.socket.bind_address.host = value;
        } else if (key == "bind_port" || key == "port") {
            config.bridge.socket.bind_address.port = parse_port(value);
        } else if (key == "recv_buffer_size") {
            config.bridge.socket.recv_buffer_size = parse_unsigned(value);
        } else if (key == "topic_prefix") {
            config.router.prefix = value;
        } else if (key == "info_suffix") {
            config.router.info_suffix = value;
        } else if (key == "chunk_suffix") {
            config.router.chunk_suffix = value;
        } else {
            return false;
        }
    } else if (section == "reassembly") {
        if (key == "idle_timeout_ms") {
            config.registry.idle_timeout_ms = parse_unsigned(value);
        } else if (key == "sweep_interval_ms") {
            config.sweep_interval_ms = parse_unsigned(value);
        } else if (key == "max_sessions") {
            config.registry.max_sessions = parse_unsigned(value);
        } else if (key == "max_transfer_bytes") {
            config.registry.max_transfer_bytes = parse_unsigned(value);
        } else if (key == "workers") {
            config.workers.workers = parse_unsigned(value);
        } else if (key == "queue_capacity") {
            config.workers.queue_capacity = parse_unsigned(value);
        } else {
            return false;
        }
    } else if (section == "storage") {
        if (key == "backend") {
            auto backend = string_to_storage_backend(value);
            if (!backend) {
                throw std::invalid_argument("unknown backend '" + value + "'");
            }
            config.storage.backend = *backend;
        } else if (key == "root_dir") {
            config.storage.root_dir = value;
        } else if (key == "bucket") {
            config.engine.bucket = value;
        } else if (key == "table") {
            config.engine.table = value;
        } else if (key == "url") {
            config.storage.supabase.url = value;
        } else if (key == "service_key" || key == "key") {
            config.storage.supabase.service_key = value;
        } else if (key == "content_type") {
            config.engine.content_type = value;
        } else if (key == "extension") {
            config.engine.extension = value;
        } else if (key == "device_id") {
            config.engine.device_id = value;
        } else if (key == "timeout_ms") {
            config.storage.supabase.timeout_ms = static_cast<long>(parse_unsigned(value));
        } else {
            return false;
        }
    } else if (section == "logging") {
        if (key == "level") {
            config.logging.level = utils::string_to_log_level(value);
        } else if (key == "file") {
            config.logging.file = value;
        } else if (key == "pattern") {
            config.logging.pattern = value;
        } else {
            return false;
        }
    } else {
        return false;
    }
    return true;
}

}  // namespace

StitchConfig::StitchConfig() {
    bridge.socket.bind_address = {"0.0.0.0", DEFAULT_BRIDGE_PORT};
    router.prefix = DEFAULT_TOPIC_PREFIX;
}

const char* storage_backend_to_string(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::FILESYSTEM: return "filesystem";
        case StorageBackend::SUPABASE: return "supabase";
    }
    return "filesystem";
}

std::optional<StorageBackend> string_to_storage_backend(const std::string& str) {
    std::string lower = to_lower(str);
    if (lower == "filesystem" || lower == "fs") return StorageBackend::FILESYSTEM;
    if (lower == "supabase") return StorageBackend::SUPABASE;
    return std::nullopt;
}

std::optional<StitchConfig> parse_config(std::istream& input, std::string* error) {
    StitchConfig config;

    for (const auto& entry : IniParser::parse(input)) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        try {
            if (!apply_entry(config, section, key, entry.value)) {
                spdlog::warn("Ignoring unknown config key {}.{} (line {})", section, key, entry.line);
            }
        } catch (const std::logic_error& e) {
            if (error) {
                *error = section + "." + key + ": " + e.what();
            }
            return std::nullopt;
        }
    }

    return config;
}

std::optional<StitchConfig> load_config(const std::string& path, std::string* error) {
    std::ifstream file(path);
    if (!file) {
        if (error) {
            *error = "cannot open " + path;
        }
        return std::nullopt;
    }
    return parse_config(file, error);
}

bool save_config(const StitchConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "[transport]\n";
    file << "bind_host = " << config.bridge.socket.bind_address.host << "\n";
    file << "bind_port = " << config.bridge.socket.bind_address.port << "\n";
    file << "recv_buffer_size = " << config.bridge.socket.recv_buffer_size << "\n";
    file << "topic_prefix = " << config.router.prefix << "\n";
    file << "info_suffix = " << config.router.info_suffix << "\n";
    file << "chunk_suffix = " << config.router.chunk_suffix << "\n";
    file << "\n";

    file << "[reassembly]\n";
    file << "idle_timeout_ms = " << config.registry.idle_timeout_ms << "\n";
    file << "sweep_interval_ms = " << config.sweep_interval_ms << "\n";
    file << "max_sessions = " << config.registry.max_sessions << "\n";
    file << "max_transfer_bytes = " << config.registry.max_transfer_bytes << "\n";
    file << "workers = " << config.workers.workers << "\n";
    file << "queue_capacity = " << config.workers.queue_capacity << "\n";
    file << "\n";

    // The service key is never written; supply it through SUPABASE_SERVICE_ROLE_KEY
    file << "[storage]\n";
    file << "backend = " << storage_backend_to_string(config.storage.backend) << "\n";
    file << "root_dir = " << config.storage.root_dir << "\n";
    file << "bucket = " << config.engine.bucket << "\n";
    file << "table = " << config.engine.table << "\n";
    file << "url = " << config.storage.supabase.url << "\n";
    file << "content_type = " << config.engine.content_type << "\n";
    file << "extension = " << config.engine.extension << "\n";
    file << "device_id = " << config.engine.device_id << "\n";
    file << "timeout_ms = " << config.storage.supabase.timeout_ms << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << utils::log_level_to_string(config.logging.level) << "\n";
    if (!config.logging.file.empty()) {
        file << "file = " << config.logging.file << "\n";
    }

    return static_cast<bool>(file);
}

std::optional<CliOverrides> parse_cli(int argc, char* argv[], int* exit_code) {
    CLI::App app{"stitchd - chunked image reassembly service"};

    CliOverrides overrides;

    app.add_option("-c,--config", overrides.config_path, "INI configuration file");
    app.add_option("-b,--bind", overrides.bind_host, "Bridge listen address");
    app.add_option("-p,--port", overrides.bind_port, "Bridge listen port");
    app.add_option("-t,--topic-prefix", overrides.topic_prefix, "Accepted topic prefix");
    app.add_option("--idle-timeout-ms", overrides.idle_timeout_ms,
                   "Fail transfers with no progress for this long");
    app.add_option("-w,--workers", overrides.workers, "Storage worker threads");
    app.add_option("--backend", overrides.backend, "Storage backend (filesystem|supabase)");
    app.add_option("--root-dir", overrides.root_dir, "Filesystem backend root directory");
    app.add_option("--bucket", overrides.bucket, "Artifact bucket");
    app.add_option("-l,--log-level", overrides.log_level, "Log level (trace..off)");
    app.add_option("--log-file", overrides.log_file, "Also log to a rotating file");
    app.add_flag("--check", overrides.check_only, "Validate configuration and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        if (exit_code) {
            *exit_code = code;
        }
        return std::nullopt;
    }

    if (exit_code) {
        *exit_code = 0;
    }
    return overrides;
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void apply_environment(StitchConfig& config, const EnvLookup& env) {
    if (auto url = env("SUPABASE_URL")) {
        config.storage.supabase.url = *url;
    }
    if (auto key = env("SUPABASE_SERVICE_ROLE_KEY")) {
        config.storage.supabase.service_key = *key;
    }
    if (auto bucket = env("SUPABASE_BUCKET")) {
        config.engine.bucket = *bucket;
    }
    if (auto prefix = env("STITCH_TOPIC_PREFIX")) {
        config.router.prefix = *prefix;
    }
}

bool merge_config(StitchConfig& config, const CliOverrides& overlay, std::string* error) {
    if (overlay.bind_host) {
        config.bridge.socket.bind_address.host = *overlay.bind_host;
    }
    if (overlay.bind_port) {
        config.bridge.socket.bind_address.port = *overlay.bind_port;
    }
    if (overlay.topic_prefix) {
        config.router.prefix = *overlay.topic_prefix;
    }
    if (overlay.idle_timeout_ms) {
        config.registry.idle_timeout_ms = *overlay.idle_timeout_ms;
    }
    if (overlay.workers) {
        config.workers.workers = *overlay.workers;
    }
    if (overlay.backend) {
        auto backend = string_to_storage_backend(*overlay.backend);
        if (!backend) {
            if (error) {
                *error = "unknown backend '" + *overlay.backend + "'";
            }
            return false;
        }
        config.storage.backend = *backend;
    }
    if (overlay.root_dir) {
        config.storage.root_dir = *overlay.root_dir;
    }
    if (overlay.bucket) {
        config.engine.bucket = *overlay.bucket;
    }
    if (overlay.log_level) {
        config.logging.level = utils::string_to_log_level(*overlay.log_level);
    }
    if (overlay.log_file) {
        config.logging.file = *overlay.log_file;
    }
    return true;
}

ValidationResult validate_config(const StitchConfig& config) {
    ValidationResult result;

    auto fail = [&result](std::string message) {
        result.errors.push_back(std::move(message));
        result.valid = false;
    };

    if (config.bridge.socket.bind_address.port == 0) {
        result.warnings.push_back("Bridge port is 0 - will use ephemeral port");
    }

    if (config.router.info_suffix.empty() || config.router.chunk_suffix.empty()) {
        fail("Topic suffixes must not be empty");
    } else if (config.router.info_suffix == config.router.chunk_suffix) {
        fail("Info and chunk topic suffixes must differ");
    }
    if (config.router.prefix.empty()) {
        result.warnings.push_back("Topic prefix is empty - every source prefix is accepted");
    }

    if (config.registry.idle_timeout_ms == 0) {
        fail("idle_timeout_ms must be positive");
    }
    if (config.sweep_interval_ms == 0) {
        fail("sweep_interval_ms must be positive");
    } else if (config.sweep_interval_ms > config.registry.idle_timeout_ms) {
        result.warnings.push_back("sweep_interval_ms exceeds idle_timeout_ms - timeouts fire late");
    }
    if (config.registry.max_sessions == 0) {
        fail("max_sessions must be positive");
    }
    if (config.registry.max_transfer_bytes == 0) {
        fail("max_transfer_bytes must be positive");
    }
    if (config.workers.workers == 0) {
        fail("workers must be positive");
    }
    if (config.workers.queue_capacity == 0) {
        fail("queue_capacity must be positive");
    }

    if (config.engine.bucket.empty()) {
        fail("Storage bucket must not be empty");
    }
    if (config.engine.table.empty()) {
        fail("Storage table must not be empty");
    }
    if (config.engine.extension.empty()) {
        result.warnings.push_back("Artifact extension is empty - keys are bare transfer ids");
    }

    switch (config.storage.backend) {
        case StorageBackend::FILESYSTEM:
            if (config.storage.root_dir.empty()) {
                fail("Filesystem backend requires root_dir");
            }
            if (!storage::FilesystemSink::is_safe_name(config.engine.bucket) ||
                !storage::FilesystemSink::is_safe_name(config.engine.table)) {
                fail("Bucket and table must be single path components");
            }
            break;
        case StorageBackend::SUPABASE:
            if (config.storage.supabase.url.empty()) {
                fail("Supabase backend requires url (or SUPABASE_URL)");
            } else if (config.storage.supabase.url.rfind("https://", 0) != 0) {
                fail("Supabase url must use https://");
            }
            if (config.storage.supabase.service_key.empty()) {
                fail("Supabase backend requires a service key (SUPABASE_SERVICE_ROLE_KEY)");
            }
            if (config.storage.supabase.timeout_ms <= 0) {
                fail("Storage timeout_ms must be positive");
            }
            break;
    }

    return result;
}

}  // namespace stitch::config
