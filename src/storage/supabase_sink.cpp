#include "stitch/storage/supabase_sink.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <memory>

namespace stitch::storage {

namespace {

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_escape(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

}  // namespace

SupabaseSink::SupabaseSink(SupabaseConfig config)
    : config_(std::move(config)) {
    config_.url = trim_trailing_slash(config_.url);
    curl_global_init(CURL_GLOBAL_ALL);
}

SupabaseSink::~SupabaseSink() {
    curl_global_cleanup();
}

std::string SupabaseSink::public_url(const std::string& bucket, const std::string& key) const {
    return config_.url + "/storage/v1/object/public/" + url_escape(bucket) + "/" + url_escape(key);
}

HttpResponse SupabaseSink::post(const std::string& url,
                                const std::vector<std::string>& headers,
                                std::span<const uint8_t> body) const {
    HttpResponse response;

    // One handle per request; uploads run concurrently on the worker pool
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        response.error = "failed to initialize CURL";
        return response;
    }

    struct curl_slist* list = nullptr;
    for (const auto& header : headers) {
        list = curl_slist_append(list, header.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(list, &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(body.data()));
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

StorageResult SupabaseSink::upload(const std::string& bucket,
                                   const std::string& key,
                                   std::span<const uint8_t> bytes,
                                   const std::string& content_type) {
    std::string url = config_.url + "/storage/v1/object/" + url_escape(bucket) + "/" + url_escape(key);
    std::vector<std::string> headers = {
        "Authorization: Bearer " + config_.service_key,
        "apikey: " + config_.service_key,
        "Content-Type: " + content_type,
        "x-upsert: false"
    };

    auto response = post(url, headers, bytes);
    if (!response.error.empty()) {
        return StorageResult::failure(response.error);
    }
    if (response.status < 200 || response.status >= 300) {
        return StorageResult::failure("HTTP " + std::to_string(response.status) + ": " + response.body);
    }

    spdlog::debug("Uploaded {} bytes to {}/{}", bytes.size(), bucket, key);
    return StorageResult::success(public_url(bucket, key));
}

StorageResult SupabaseSink::insert_record(const std::string& table, const nlohmann::json& fields) {
    std::string url = config_.url + "/rest/v1/" + url_escape(table);
    std::vector<std::string> headers = {
        "Authorization: Bearer " + config_.service_key,
        "apikey: " + config_.service_key,
        "Content-Type: application/json",
        "Prefer: return=representation"
    };

    std::string body = fields.dump();
    auto response = post(url, headers,
                         std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(body.data()),
                                                  body.size()));
    if (!response.error.empty()) {
        return StorageResult::failure(response.error);
    }
    if (response.status < 200 || response.status >= 300) {
        return StorageResult::failure("HTTP " + std::to_string(response.status) + ": " + response.body);
    }

    // PostgREST returns the inserted rows as an array
    std::string record_id;
    auto rows = nlohmann::json::parse(response.body, nullptr, false);
    if (!rows.is_discarded() && rows.is_array() && !rows.empty() && rows[0].contains("id")) {
        const auto& id = rows[0]["id"];
        record_id = id.is_string() ? id.get<std::string>() : id.dump();
    }

    return StorageResult::success(record_id);
}

}  // namespace stitch::storage
