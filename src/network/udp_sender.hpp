/**
 * @file udp_sender.hpp
 * @brief Fire-and-forget UDP datagram sender.
 *
 * One socket is bound for the sender's lifetime. The destination is given
 * per call as "host:port" and resolved on every send, so an address changed
 * by a config reload takes effect on the next record.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>

namespace gelf_relay {

/**
 * @brief Datagram output used by the ingestion loop.
 */
class IDatagramSender {
public:
    virtual ~IDatagramSender() = default;

    virtual Result<void> send(std::span<const uint8_t> datagram, const std::string& address) = 0;
};

class UdpSender : public IDatagramSender {
public:
    /**
     * @brief Bind a UDP socket to 0.0.0.0:port (0 = ephemeral).
     */
    static Result<std::unique_ptr<UdpSender>> bind(uint16_t port);

    ~UdpSender() override;

    // Non-copyable
    UdpSender(const UdpSender&) = delete;
    UdpSender& operator=(const UdpSender&) = delete;

    Result<void> send(std::span<const uint8_t> datagram, const std::string& address) override;

    [[nodiscard]] uint16_t local_port() const noexcept { return local_port_; }

private:
    UdpSender(int fd, uint16_t local_port);

    int fd_ = -1;
    uint16_t local_port_ = 0;
};

/**
 * @brief Split "host:port" at the last colon.
 */
Result<std::pair<std::string, std::string>> split_host_port(const std::string& address);

}  // namespace gelf_relay
