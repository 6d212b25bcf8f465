#include "stitch/router/message_router.hpp"

#include <spdlog/spdlog.h>

#include "stitch/router/wire.hpp"

namespace stitch::router {

using reassembly::ErrorKind;

MessageRouter::MessageRouter(reassembly::SessionRegistry& registry, const RouterConfig& config)
    : registry_(registry), config_(config) {
}

std::optional<std::string> MessageRouter::match_suffix(const std::string& topic,
                                                       const std::string& suffix) {
    if (suffix.empty() || topic.size() <= suffix.size()) {
        return std::nullopt;
    }
    if (topic.compare(topic.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    return topic.substr(0, topic.size() - suffix.size());
}

std::optional<RoutedEvent> MessageRouter::classify(const std::string& topic,
                                                   std::span<const uint8_t> payload,
                                                   ErrorKind* error) const {
    // Sources end up in JSON records, which must be UTF-8
    if (!is_valid_utf8(topic)) {
        if (error) {
            *error = ErrorKind::UNKNOWN_TOPIC;
        }
        spdlog::warn("Ignoring message on a topic that is not valid UTF-8 ({} bytes)", topic.size());
        return std::nullopt;
    }

    auto info_source = match_suffix(topic, config_.info_suffix);
    if (info_source && accepts(*info_source)) {
        std::string detail;
        auto meta = decode_metadata(payload, error, &detail);
        if (!meta) {
            spdlog::warn("Malformed metadata on {}: {}", topic, detail);
            return std::nullopt;
        }
        return RoutedEvent{std::move(*info_source), std::move(*meta)};
    }

    auto chunk_source = match_suffix(topic, config_.chunk_suffix);
    if (chunk_source && accepts(*chunk_source)) {
        auto event = decode_chunk(payload, error);
        if (!event) {
            spdlog::warn("Malformed chunk on {}: {} byte payload", topic, payload.size());
            return std::nullopt;
        }
        return RoutedEvent{std::move(*chunk_source), std::move(*event)};
    }

    if (error) {
        *error = ErrorKind::UNKNOWN_TOPIC;
    }
    spdlog::debug("Ignoring message on unhandled topic {}", topic);
    return std::nullopt;
}

ErrorKind MessageRouter::route(const std::string& topic, std::span<const uint8_t> payload,
                               uint64_t now_ms) {
    ++stats_.messages;

    ErrorKind error = ErrorKind::NONE;
    auto routed = classify(topic, payload, &error);
    if (!routed) {
        if (error == ErrorKind::UNKNOWN_TOPIC) {
            ++stats_.unknown_topic;
        } else {
            ++stats_.malformed;
        }
        return error;
    }

    if (std::holds_alternative<reassembly::MetadataEvent>(routed->event)) {
        ++stats_.metadata;
    } else if (std::holds_alternative<reassembly::ChunkEvent>(routed->event)) {
        ++stats_.chunks;
    } else {
        ++stats_.end_markers;
    }

    return registry_.dispatch(routed->source, routed->event, now_ms);
}

}  // namespace stitch::router
