#include "stitch/router/wire.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace stitch::router {

namespace {

void set_error(reassembly::ErrorKind* error, std::string* detail,
               reassembly::ErrorKind kind, std::string reason) {
    if (error) {
        *error = kind;
    }
    if (detail) {
        *detail = std::move(reason);
    }
}

}  // namespace

std::optional<reassembly::MetadataEvent> decode_metadata(std::span<const uint8_t> payload,
                                                         reassembly::ErrorKind* error,
                                                         std::string* detail) {
    using reassembly::ErrorKind;

    nlohmann::json meta = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (meta.is_discarded() || !meta.is_object()) {
        set_error(error, detail, ErrorKind::MALFORMED_METADATA, "payload is not a JSON object");
        return std::nullopt;
    }

    auto total = meta.find("total_chunks");
    if (total == meta.end() || !total->is_number_integer()) {
        set_error(error, detail, ErrorKind::MALFORMED_METADATA, "total_chunks missing or not an integer");
        return std::nullopt;
    }

    auto count = total->get<int64_t>();
    if (count <= 0 || count > static_cast<int64_t>(MAX_TOTAL_CHUNKS)) {
        set_error(error, detail, ErrorKind::MALFORMED_METADATA,
                  "total_chunks out of range: " + std::to_string(count));
        return std::nullopt;
    }

    reassembly::MetadataEvent event;
    event.total_chunks = static_cast<uint32_t>(count);

    auto id = meta.find("image_id");
    if (id != meta.end() && !id->is_null()) {
        if (!id->is_string()) {
            set_error(error, detail, ErrorKind::MALFORMED_METADATA, "image_id is not a string");
            return std::nullopt;
        }
        event.transfer_id = id->get<std::string>();
    }

    set_error(error, nullptr, ErrorKind::NONE, {});
    return event;
}

std::optional<reassembly::Event> decode_chunk(std::span<const uint8_t> payload,
                                              reassembly::ErrorKind* error) {
    if (payload.empty()) {
        if (error) {
            *error = reassembly::ErrorKind::NONE;
        }
        return reassembly::Event{reassembly::EndMarkerEvent{}};
    }

    if (payload.size() < CHUNK_INDEX_SIZE) {
        if (error) {
            *error = reassembly::ErrorKind::MALFORMED_CHUNK;
        }
        return std::nullopt;
    }

    reassembly::ChunkEvent chunk;
    chunk.index = static_cast<reassembly::ChunkIndex>((payload[0] << 8) | payload[1]);
    chunk.payload.assign(payload.begin() + CHUNK_INDEX_SIZE, payload.end());

    if (error) {
        *error = reassembly::ErrorKind::NONE;
    }
    return reassembly::Event{std::move(chunk)};
}

bool is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<uint8_t>(text[i]);
        size_t len;
        uint32_t cp;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (i + len > text.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            auto cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        constexpr uint32_t MIN_FOR_LEN[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < MIN_FOR_LEN[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string encode_metadata(uint32_t total_chunks, const std::optional<std::string>& transfer_id) {
    nlohmann::json meta;
    meta["total_chunks"] = total_chunks;
    if (transfer_id) {
        meta["image_id"] = *transfer_id;
    }
    return meta.dump();
}

std::vector<uint8_t> encode_chunk(reassembly::ChunkIndex index, std::span<const uint8_t> data) {
    std::vector<uint8_t> out;
    out.reserve(CHUNK_INDEX_SIZE + data.size());
    out.push_back(static_cast<uint8_t>(index >> 8));
    out.push_back(static_cast<uint8_t>(index & 0xFF));
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

std::vector<std::vector<uint8_t>> split_payload(std::span<const uint8_t> data, size_t chunk_size) {
    if (chunk_size == 0) {
        return {};
    }

    size_t count = (data.size() + chunk_size - 1) / chunk_size;
    if (count > MAX_TOTAL_CHUNKS) {
        return {};
    }

    std::vector<std::vector<uint8_t>> bodies;
    bodies.reserve(count);
    for (size_t offset = 0; offset < data.size(); offset += chunk_size) {
        size_t take = std::min(chunk_size, data.size() - offset);
        bodies.emplace_back(data.begin() + offset, data.begin() + offset + take);
    }
    return bodies;
}

}  // namespace stitch::router
