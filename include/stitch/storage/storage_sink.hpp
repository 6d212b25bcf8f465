#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace stitch::storage {

// Result of a storage operation.
// value holds the artifact URL for uploads and the record id for inserts.
struct StorageResult {
    bool ok{false};
    std::string value;
    std::string error;

    static StorageResult success(std::string value) { return {true, std::move(value), {}}; }
    static StorageResult failure(std::string error) { return {false, {}, std::move(error)}; }
};

// Durable destination for reassembled artifacts and their metadata rows.
// Calls may block; the reassembly engine runs them off the dispatch path.
class StorageSink {
public:
    virtual ~StorageSink() = default;

    virtual StorageResult upload(const std::string& bucket,
                                 const std::string& key,
                                 std::span<const uint8_t> bytes,
                                 const std::string& content_type) = 0;

    virtual StorageResult insert_record(const std::string& table, const nlohmann::json& fields) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace stitch::storage
