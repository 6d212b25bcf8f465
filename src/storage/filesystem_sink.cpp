#include "stitch/storage/filesystem_sink.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace stitch::storage {

namespace fs = std::filesystem;

FilesystemSink::FilesystemSink(fs::path root)
    : root_(std::move(root)) {
}

bool FilesystemSink::is_safe_name(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.front() == '.') {
        return false;
    }
    return name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

StorageResult FilesystemSink::upload(const std::string& bucket,
                                     const std::string& key,
                                     std::span<const uint8_t> bytes,
                                     const std::string& content_type) {
    if (!is_safe_name(bucket) || !is_safe_name(key)) {
        return StorageResult::failure("unsafe object path: " + bucket + "/" + key);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::path dir = root_ / bucket;
    fs::create_directories(dir, ec);
    if (ec) {
        return StorageResult::failure("cannot create " + dir.string() + ": " + ec.message());
    }

    fs::path target = dir / key;
    if (fs::exists(target, ec)) {
        return StorageResult::failure("object already exists: " + target.string());
    }

    // Write to a temp file and rename so readers never see a partial artifact
    fs::path temp = dir / ("." + key + ".part");
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return StorageResult::failure("cannot open " + temp.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return StorageResult::failure("write failed: " + temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return StorageResult::failure("rename failed: " + ec.message());
    }

    spdlog::debug("Stored {} bytes ({}) at {}", bytes.size(), content_type, target.string());
    return StorageResult::success("file://" + fs::absolute(target, ec).string());
}

uint64_t FilesystemSink::count_records(const fs::path& path) const {
    std::ifstream in(path);
    uint64_t count = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            ++count;
        }
    }
    return count;
}

StorageResult FilesystemSink::insert_record(const std::string& table, const nlohmann::json& fields) {
    if (!is_safe_name(table)) {
        return StorageResult::failure("unsafe table name: " + table);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return StorageResult::failure("cannot create " + root_.string() + ": " + ec.message());
    }

    fs::path path = root_ / (table + ".jsonl");
    auto next = next_record_ids_.find(table);
    if (next == next_record_ids_.end()) {
        next = next_record_ids_.emplace(table, count_records(path) + 1).first;
    }

    nlohmann::json row = fields;
    row["id"] = next->second;

    std::ofstream out(path, std::ios::app);
    if (!out) {
        return StorageResult::failure("cannot open " + path.string());
    }
    out << row.dump() << "\n";
    out.flush();
    if (!out) {
        return StorageResult::failure("write failed: " + path.string());
    }

    return StorageResult::success(std::to_string(next->second++));
}

}  // namespace stitch::storage
