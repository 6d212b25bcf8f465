#include "stitch/transport/udp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace stitch::transport {

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(other.fd_),
      epoll_fd_(other.epoll_fd_),
      local_addr_(std::move(other.local_addr_)),
      config_(other.config_),
      recv_buffer_(std::move(other.recv_buffer_)),
      error_callback_(std::move(other.error_callback_)),
      datagrams_sent_(other.datagrams_sent_),
      datagrams_received_(other.datagrams_received_),
      bytes_received_(other.bytes_received_),
      send_errors_(other.send_errors_),
      recv_errors_(other.recv_errors_) {
    other.fd_ = -1;
    other.epoll_fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        epoll_fd_ = other.epoll_fd_;
        local_addr_ = std::move(other.local_addr_);
        config_ = other.config_;
        recv_buffer_ = std::move(other.recv_buffer_);
        error_callback_ = std::move(other.error_callback_);
        datagrams_sent_ = other.datagrams_sent_;
        datagrams_received_ = other.datagrams_received_;
        bytes_received_ = other.bytes_received_;
        send_errors_ = other.send_errors_;
        recv_errors_ = other.recv_errors_;
        other.fd_ = -1;
        other.epoll_fd_ = -1;
    }
    return *this;
}

bool UdpSocket::resolve(const std::string& host, void* in_addr) {
    auto* addr = static_cast<struct in_addr*>(in_addr);
    if (inet_pton(AF_INET, host.c_str(), addr) == 1) {
        return true;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || !result) {
        if (error_callback_) {
            error_callback_(rc, "getaddrinfo(" + host + "): " + gai_strerror(rc));
        }
        return false;
    }

    *addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

bool UdpSocket::open(const UdpSocketConfig& config) {
    config_ = config;
    recv_buffer_.resize(config.max_datagram_size);

    fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        handle_error(errno, "socket()");
        return false;
    }

    int optval = 1;
    if (config.reuse_address) {
        if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
            handle_error(errno, "setsockopt(SO_REUSEADDR)");
        }
    }

    // Chunks of one image arrive in a burst; a small kernel buffer drops them
    int recv_buf = static_cast<int>(config.recv_buffer_size);
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &recv_buf, sizeof(recv_buf)) < 0) {
        handle_error(errno, "setsockopt(SO_RCVBUF)");
    }

    if (config.nonblocking) {
        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
            handle_error(errno, "fcntl(O_NONBLOCK)");
            close();
            return false;
        }
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config.bind_address.port);

    if (config.bind_address.host.empty() || config.bind_address.host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (!resolve(config.bind_address.host, &addr.sin_addr)) {
        close();
        return false;
    }

    if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        handle_error(errno, "bind()");
        close();
        return false;
    }

    // Get actual bound address
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
        local_addr_.host = ip_str;
        local_addr_.port = ntohs(addr.sin_port);
    }

    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ < 0) {
        handle_error(errno, "epoll_create1()");
        close();
        return false;
    }

    struct epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd_, &ev) < 0) {
        handle_error(errno, "epoll_ctl()");
        close();
        return false;
    }

    return true;
}

void UdpSocket::close() {
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }

    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void UdpSocket::set_error_callback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

bool UdpSocket::send_to(const SocketAddress& to, std::span<const uint8_t> data) {
    if (fd_ < 0) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(to.port);
    if (!resolve(to.host, &addr.sin_addr)) {
        ++send_errors_;
        return false;
    }

    ssize_t sent = sendto(fd_, data.data(), data.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ++send_errors_;
            handle_error(errno, "sendto()");
        }
        return false;
    }

    ++datagrams_sent_;
    return true;
}

std::optional<Datagram> UdpSocket::recv() {
    if (fd_ < 0) {
        return std::nullopt;
    }

    struct sockaddr_in from_addr{};
    socklen_t from_len = sizeof(from_addr);

    ssize_t received = recvfrom(fd_, recv_buffer_.data(), recv_buffer_.size(), 0,
                                reinterpret_cast<struct sockaddr*>(&from_addr), &from_len);
    if (received < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ++recv_errors_;
            handle_error(errno, "recvfrom()");
        }
        return std::nullopt;
    }

    ++datagrams_received_;
    bytes_received_ += received;

    Datagram datagram;
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &from_addr.sin_addr, ip_str, sizeof(ip_str));
    datagram.from.host = ip_str;
    datagram.from.port = ntohs(from_addr.sin_port);
    datagram.data.assign(recv_buffer_.begin(), recv_buffer_.begin() + received);

    return datagram;
}

int UdpSocket::poll_recv(int timeout_ms) {
    if (epoll_fd_ < 0) {
        return -1;
    }

    struct epoll_event events[4];
    int nfds = epoll_wait(epoll_fd_, events, 4, timeout_ms);
    if (nfds < 0 && errno == EINTR) {
        return 0;
    }
    return nfds;
}

void UdpSocket::handle_error(int error_code, const char* context) {
    if (error_callback_) {
        std::string msg = std::string(context) + ": " + std::strerror(error_code);
        error_callback_(error_code, msg);
    }
}

}  // namespace stitch::transport
