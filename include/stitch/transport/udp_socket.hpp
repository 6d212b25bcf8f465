#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace stitch::transport {

// Socket address
struct SocketAddress {
    std::string host;
    uint16_t port{0};

    bool operator==(const SocketAddress& other) const {
        return host == other.host && port == other.port;
    }
};

// UDP socket configuration
struct UdpSocketConfig {
    SocketAddress bind_address;         // Address to bind to
    bool reuse_address = true;          // SO_REUSEADDR
    bool nonblocking = true;            // Non-blocking mode
    size_t recv_buffer_size = 4194304;  // Kernel receive buffer (4MB, chunk bursts)
    size_t max_datagram_size = 65536;   // Largest datagram accepted
};

// Received datagram
struct Datagram {
    SocketAddress from;
    std::vector<uint8_t> data;
};

// IPv4 UDP socket with epoll-based waiting
class UdpSocket {
public:
    using ErrorCallback = std::function<void(int error_code, const std::string& message)>;

    UdpSocket() = default;
    ~UdpSocket();

    // Disable copy
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Enable move
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    // Open and bind socket
    bool open(const UdpSocketConfig& config);

    // Close socket
    void close();

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] int fd() const { return fd_; }

    void set_error_callback(ErrorCallback callback);

    // Send one datagram
    bool send_to(const SocketAddress& to, std::span<const uint8_t> data);

    // Receive single datagram (non-blocking)
    std::optional<Datagram> recv();

    // Wait for readability
    // Returns >0 if readable, 0 on timeout, -1 on error
    int poll_recv(int timeout_ms);

    // Get bound address
    [[nodiscard]] const SocketAddress& local_address() const { return local_addr_; }

    // Statistics
    [[nodiscard]] uint64_t datagrams_sent() const { return datagrams_sent_; }
    [[nodiscard]] uint64_t datagrams_received() const { return datagrams_received_; }
    [[nodiscard]] uint64_t bytes_received() const { return bytes_received_; }
    [[nodiscard]] uint64_t send_errors() const { return send_errors_; }
    [[nodiscard]] uint64_t recv_errors() const { return recv_errors_; }

private:
    int fd_{-1};
    int epoll_fd_{-1};
    SocketAddress local_addr_;
    UdpSocketConfig config_;
    std::vector<uint8_t> recv_buffer_;

    ErrorCallback error_callback_;

    // Statistics
    uint64_t datagrams_sent_{0};
    uint64_t datagrams_received_{0};
    uint64_t bytes_received_{0};
    uint64_t send_errors_{0};
    uint64_t recv_errors_{0};

    bool resolve(const std::string& host, void* in_addr);
    void handle_error(int error_code, const char* context);
};

}  // namespace stitch::transport
