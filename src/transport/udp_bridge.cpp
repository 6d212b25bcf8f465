#include "stitch/transport/udp_bridge.hpp"

#include <spdlog/spdlog.h>

namespace stitch::transport {

std::vector<uint8_t> encode_bridge_datagram(const std::string& topic, std::span<const uint8_t> payload) {
    std::vector<uint8_t> out;
    out.reserve(BRIDGE_HEADER_SIZE + topic.size() + payload.size());
    out.push_back(static_cast<uint8_t>((topic.size() >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(topic.size() & 0xFF));
    out.insert(out.end(), topic.begin(), topic.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<Message> decode_bridge_datagram(std::span<const uint8_t> datagram) {
    if (datagram.size() < BRIDGE_HEADER_SIZE) {
        return std::nullopt;
    }

    size_t topic_len = (static_cast<size_t>(datagram[0]) << 8) | datagram[1];
    if (topic_len == 0 || datagram.size() < BRIDGE_HEADER_SIZE + topic_len) {
        return std::nullopt;
    }

    Message message;
    auto topic_begin = datagram.begin() + BRIDGE_HEADER_SIZE;
    message.topic.assign(topic_begin, topic_begin + topic_len);
    message.payload.assign(topic_begin + topic_len, datagram.end());
    return message;
}

UdpBridgeSource::UdpBridgeSource(const UdpBridgeConfig& config)
    : config_(config) {
}

bool UdpBridgeSource::start(OnMessage on_message) {
    on_message_ = std::move(on_message);

    socket_.set_error_callback([](int code, const std::string& msg) {
        spdlog::error("Bridge socket error {}: {}", code, msg);
    });

    if (!socket_.open(config_.socket)) {
        return false;
    }

    spdlog::info("Listening for bridged messages on {}:{}", socket_.local_address().host,
                 socket_.local_address().port);
    return true;
}

int UdpBridgeSource::poll(int timeout_ms) {
    int ready = socket_.poll_recv(timeout_ms);
    if (ready <= 0) {
        return ready;
    }

    int delivered = 0;
    for (size_t i = 0; i < config_.max_batch; ++i) {
        auto datagram = socket_.recv();
        if (!datagram) {
            break;
        }

        auto message = decode_bridge_datagram(datagram->data);
        if (!message) {
            ++malformed_;
            spdlog::warn("Dropping malformed bridge datagram ({} bytes) from {}:{}",
                         datagram->data.size(), datagram->from.host, datagram->from.port);
            continue;
        }

        if (on_message_) {
            on_message_(std::move(*message));
        }
        ++delivered;
    }
    return delivered;
}

void UdpBridgeSource::stop() {
    socket_.close();
}

UdpBridgePublisher::UdpBridgePublisher(SocketAddress target)
    : target_(std::move(target)) {
}

bool UdpBridgePublisher::open() {
    socket_.set_error_callback([](int code, const std::string& msg) {
        spdlog::error("Publisher socket error {}: {}", code, msg);
    });

    UdpSocketConfig config;
    config.bind_address = {"0.0.0.0", 0};
    config.nonblocking = false;
    return socket_.open(config);
}

bool UdpBridgePublisher::publish(const std::string& topic, std::span<const uint8_t> payload) {
    auto datagram = encode_bridge_datagram(topic, payload);
    return socket_.send_to(target_, datagram);
}

}  // namespace stitch::transport
