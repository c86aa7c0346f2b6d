#pragma once

#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/DatagramPacket.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"
#include "lumina/net/UdpSocket.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace lumina::luminaire {

struct Datagram {
    std::string payload;
    std::string sourceAddress;
    std::uint16_t sequence = 0;
};

/**
 * @brief Connectionless request/response endpoint on the datagram port.
 *
 * Each channel owns its socket and its sequence counter, so discovery
 * workers can each hold one without sharing mutable state. `receive`
 * reporting `Errc::NoReply` is the normal outcome of probing a silent
 * address and is never logged above debug level.
 */
class DatagramChannel {
public:
    explicit DatagramChannel(unsigned short remotePort = config::DATAGRAM_PORT_DEFAULT);
    ~DatagramChannel();

    DatagramChannel(const DatagramChannel&) = delete;
    DatagramChannel& operator=(const DatagramChannel&) = delete;

    /// Open an IPv4 socket on an ephemeral local port. Called lazily by sendTo.
    expected<void> open();
    expected<void> enableBroadcast();

    /// Send one command line; returns the sequence tag used.
    expected<std::uint16_t> sendTo(const std::string& address, std::string_view message);
    expected<std::uint16_t> sendTo(const net::udp::endpoint& endpoint, std::string_view message);

    /// Wait up to `timeout` for one well-formed datagram. Malformed packets are skipped.
    expected<Datagram> receive(std::chrono::milliseconds timeout);

    void close();
    bool isOpen() const { return socket_.is_open(); }
    unsigned short remotePort() const { return remotePort_; }

private:
    net::UdpSocket socket_;
    unsigned short remotePort_;
    std::uint16_t sequence_ = 1;
    std::array<std::uint8_t, config::DATAGRAM_HEADER_SIZE + config::DATAGRAM_MAX_PAYLOAD> rx_{};
};

} // namespace lumina::luminaire
