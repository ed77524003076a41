/**
 * @file udp_sender.cpp
 * @brief UdpSender implementation using POSIX sockets and getaddrinfo().
 */

#include "network/udp_sender.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace gelf_relay {

namespace {

/**
 * @brief Owns a getaddrinfo() result list.
 */
struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

UdpSender::UdpSender(int fd, uint16_t local_port)
    : fd_(fd), local_port_(local_port) {}

UdpSender::~UdpSender() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::unique_ptr<UdpSender>> UdpSender::bind(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Error{ErrorKind::IoFailure,
                     "Failed to create UDP socket: " + std::string(strerror(errno))};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto reason = std::string(strerror(errno));
        ::close(fd);
        return Error{ErrorKind::IoFailure,
                     "Bind to 0.0.0.0:" + std::to_string(port) + " failed: " + reason};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    uint16_t local_port = port;
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        local_port = ntohs(bound.sin_port);
    }

    return std::unique_ptr<UdpSender>(new UdpSender(fd, local_port));
}

// ─────────────────────────────────────────────
// Sending
// ─────────────────────────────────────────────

Result<void> UdpSender::send(std::span<const uint8_t> datagram, const std::string& address) {
    auto parts = split_host_port(address);
    if (!parts) return parts.error();
    const auto& [host, service] = *parts;

    addrinfo hints{};
    hints.ai_family = AF_INET;          // the socket is bound to an IPv4 address
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    if (rc != 0) {
        return Error{ErrorKind::IoFailure,
                     "Cannot resolve " + address + ": " + ::gai_strerror(rc)};
    }
    AddrInfoPtr resolved(raw);

    auto sent = ::sendto(fd_, datagram.data(), datagram.size(), 0,
                         resolved->ai_addr, resolved->ai_addrlen);
    if (sent < 0) {
        return Error{ErrorKind::IoFailure,
                     "sendto " + address + " failed: " + std::string(strerror(errno))};
    }
    if (static_cast<size_t>(sent) != datagram.size()) {
        return Error{ErrorKind::IoFailure, "Short datagram write to " + address};
    }

    return Result<void>{};
}

Result<std::pair<std::string, std::string>> split_host_port(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        return Error{ErrorKind::ParsingFailure, "Expected host:port, got \"" + address + "\""};
    }

    return std::pair{address.substr(0, colon), address.substr(colon + 1)};
}

}  // namespace gelf_relay
