#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "stitch/reassembly/events.hpp"
#include "stitch/reassembly/session_registry.hpp"
#include "stitch/transport/message_source.hpp"

namespace stitch::router {

// Topic layout: <prefix><info_suffix> and <prefix><chunk_suffix>.
// The prefix identifies the publishing source.
struct RouterConfig {
    std::string prefix;  // Only accept this source prefix; empty accepts any
    std::string info_suffix = "/image/info";
    std::string chunk_suffix = "/image/chunk";
};

// Router statistics
struct RouterStats {
    uint64_t messages{0};
    uint64_t metadata{0};
    uint64_t chunks{0};
    uint64_t end_markers{0};
    uint64_t malformed{0};
    uint64_t unknown_topic{0};
};

// A message classified into a registry event
struct RoutedEvent {
    std::string source;
    reassembly::Event event;
};

// Classifies transport messages by topic and feeds the registry.
// Called from the dispatcher thread only.
class MessageRouter {
public:
    explicit MessageRouter(reassembly::SessionRegistry& registry, const RouterConfig& config = {});

    // Classify and forward one message
    // Returns the error kind for the message; malformed messages never reach the registry
    reassembly::ErrorKind route(const std::string& topic, std::span<const uint8_t> payload,
                                uint64_t now_ms);

    reassembly::ErrorKind route(const transport::Message& message, uint64_t now_ms) {
        return route(message.topic, message.payload, now_ms);
    }

    // Classify without forwarding
    [[nodiscard]] std::optional<RoutedEvent> classify(const std::string& topic,
                                                      std::span<const uint8_t> payload,
                                                      reassembly::ErrorKind* error = nullptr) const;

    [[nodiscard]] const RouterStats& stats() const { return stats_; }

private:
    reassembly::SessionRegistry& registry_;
    RouterConfig config_;
    RouterStats stats_{};

    // Source prefix if topic is <prefix><suffix> with a non-empty prefix
    static std::optional<std::string> match_suffix(const std::string& topic, const std::string& suffix);

    [[nodiscard]] bool accepts(const std::string& source) const {
        return config_.prefix.empty() || source == config_.prefix;
    }
};

}  // namespace stitch::router
