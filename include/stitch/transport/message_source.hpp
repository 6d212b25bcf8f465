#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace stitch::transport {

// One publish/subscribe message
struct Message {
    std::string topic;
    std::vector<uint8_t> payload;
};

using OnMessage = std::function<void(Message message)>;

// Inbound side of the publish/subscribe transport.
// Implementations deliver messages on the thread that calls poll().
struct MessageSource {
    virtual bool start(OnMessage on_message) = 0;

    // Wait up to timeout_ms for messages and deliver them
    // Returns number of messages delivered, -1 on error
    virtual int poll(int timeout_ms) = 0;

    virtual void stop() = 0;
    virtual std::string name() const { return ""; }
    virtual ~MessageSource() = default;
};

}  // namespace stitch::transport
