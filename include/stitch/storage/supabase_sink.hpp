#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "stitch/storage/storage_sink.hpp"

namespace stitch::storage {

// Supabase project settings
struct SupabaseConfig {
    std::string url;          // https://<project>.supabase.co
    std::string service_key;  // Service role key
    long timeout_ms = 30000;
};

// HTTP response as seen by the sink
struct HttpResponse {
    long status{0};        // HTTP status, 0 if the request never completed
    std::string body;
    std::string error;     // Transport error text
};

// Uploads artifacts to Supabase Storage and inserts metadata rows through
// PostgREST. TLS peer and host verification are always enabled.
class SupabaseSink : public StorageSink {
public:
    explicit SupabaseSink(SupabaseConfig config);
    ~SupabaseSink() override;

    // Disable copy
    SupabaseSink(const SupabaseSink&) = delete;
    SupabaseSink& operator=(const SupabaseSink&) = delete;

    StorageResult upload(const std::string& bucket,
                         const std::string& key,
                         std::span<const uint8_t> bytes,
                         const std::string& content_type) override;

    StorageResult insert_record(const std::string& table, const nlohmann::json& fields) override;

    [[nodiscard]] std::string name() const override { return "supabase"; }

    // {url}/storage/v1/object/public/{bucket}/{key}
    [[nodiscard]] std::string public_url(const std::string& bucket, const std::string& key) const;

private:
    SupabaseConfig config_;

    HttpResponse post(const std::string& url,
                      const std::vector<std::string>& headers,
                      std::span<const uint8_t> body) const;
};

}  // namespace stitch::storage
