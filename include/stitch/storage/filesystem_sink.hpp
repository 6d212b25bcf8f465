#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

#include "stitch/storage/storage_sink.hpp"

namespace stitch::storage {

// Stores artifacts as <root>/<bucket>/<key> and appends metadata rows as
// JSON lines to <root>/<table>.jsonl. Existing objects are never overwritten.
class FilesystemSink : public StorageSink {
public:
    explicit FilesystemSink(std::filesystem::path root);

    StorageResult upload(const std::string& bucket,
                         const std::string& key,
                         std::span<const uint8_t> bytes,
                         const std::string& content_type) override;

    StorageResult insert_record(const std::string& table, const nlohmann::json& fields) override;

    [[nodiscard]] std::string name() const override { return "filesystem"; }

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    // Single path component without separators or dot segments
    [[nodiscard]] static bool is_safe_name(const std::string& name);

private:
    std::filesystem::path root_;
    std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> next_record_ids_;  // per table

    uint64_t count_records(const std::filesystem::path& path) const;
};

}  // namespace stitch::storage
