#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "stitch/transport/message_source.hpp"
#include "stitch/transport/udp_socket.hpp"

namespace stitch::transport {

/*
Bridge datagram, one publish/subscribe message per datagram:
  [2B topic length, big-endian][topic bytes][payload bytes]
An empty payload (end marker) is a datagram that ends right after the topic.

Devices publish to an MQTT broker. A relay next to the broker subscribes to
<prefix>/image/# and forwards every message in this format, payload untouched,
to stitchd's bind address. stitch-send writes the same datagrams.
*/

inline constexpr size_t BRIDGE_HEADER_SIZE = 2;

std::vector<uint8_t> encode_bridge_datagram(const std::string& topic, std::span<const uint8_t> payload);

// Returns nullopt if the datagram is truncated or the topic is empty
std::optional<Message> decode_bridge_datagram(std::span<const uint8_t> datagram);

struct UdpBridgeConfig {
    UdpSocketConfig socket;
    size_t max_batch = 64;  // Datagrams drained per poll()
};

// Receives messages forwarded by a broker-side bridge over UDP
class UdpBridgeSource : public MessageSource {
public:
    explicit UdpBridgeSource(const UdpBridgeConfig& config);

    bool start(OnMessage on_message) override;
    int poll(int timeout_ms) override;
    void stop() override;
    std::string name() const override { return "udp-bridge"; }

    [[nodiscard]] const SocketAddress& local_address() const { return socket_.local_address(); }
    [[nodiscard]] uint64_t malformed_datagrams() const { return malformed_; }

private:
    UdpBridgeConfig config_;
    UdpSocket socket_;
    OnMessage on_message_;
    uint64_t malformed_{0};
};

// Sending side of the bridge
class UdpBridgePublisher {
public:
    explicit UdpBridgePublisher(SocketAddress target);

    bool open();
    bool publish(const std::string& topic, std::span<const uint8_t> payload);

    [[nodiscard]] uint64_t published() const { return socket_.datagrams_sent(); }

private:
    SocketAddress target_;
    UdpSocket socket_;
};

}  // namespace stitch::transport
