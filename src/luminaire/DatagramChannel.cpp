#include "lumina/luminaire/DatagramChannel.hpp"

#include "lumina/log/Log.hpp"

namespace lumina::luminaire {

namespace asio = lumina::net::asio;
using Clock = std::chrono::steady_clock;

DatagramChannel::DatagramChannel(unsigned short remotePort)
: remotePort_(remotePort)
{}

DatagramChannel::~DatagramChannel() {
    close();
}

expected<void> DatagramChannel::open() {
    if (socket_.is_open()) {
        return {};
    }
    if (auto ec = socket_.open_v4(); ec) {
        return fail(Errc::ConnectFailed, "datagram socket: " + ec.message());
    }
    if (auto ec = socket_.bind_any(0); ec) {
        socket_.close();
        return fail(Errc::ConnectFailed, "datagram bind: " + ec.message());
    }
    return {};
}

expected<void> DatagramChannel::enableBroadcast() {
    if (auto opened = open(); !opened) {
        return opened;
    }
    if (auto ec = socket_.enable_broadcast(true); ec) {
        return fail(Errc::ConnectFailed, "enable broadcast: " + ec.message());
    }
    return {};
}

expected<std::uint16_t>
DatagramChannel::sendTo(const std::string& address, std::string_view message) {
    std::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
        return fail(Errc::InvalidConfig, "invalid datagram target '" + address + "'");
    }
    return sendTo(net::udp::endpoint(ip, remotePort_), message);
}

expected<std::uint16_t>
DatagramChannel::sendTo(const net::udp::endpoint& endpoint, std::string_view message) {
    if (auto opened = open(); !opened) {
        return unexpected(opened.error());
    }

    DatagramPacket packet;
    packet.sequence = sequence_;
    packet.payload = std::string(message);

    auto encoded = packet.encode();
    if (!encoded) {
        return unexpected(encoded.error());
    }

    if (auto ec = socket_.send_to(encoded->data(), encoded->size(), endpoint,
                                  config::PROBE_TIMEOUT_DEFAULT); ec) {
        return fail(Errc::ConnectFailed,
                    "send to " + endpoint.address().to_string() + ": " + ec.message());
    }

    const auto used = sequence_;
    sequence_ = nextSequence(sequence_);
    return used;
}

expected<Datagram> DatagramChannel::receive(std::chrono::milliseconds timeout) {
    if (!socket_.is_open()) {
        return fail(Errc::NotConnected, "datagram channel is closed");
    }

    const auto deadline = Clock::now() + timeout;
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) {
            return fail(Errc::NoReply);
        }

        net::udp::endpoint from;
        std::size_t received = 0;
        auto ec = socket_.recv_from(rx_.data(), rx_.size(), from, received, left);
        if (ec == asio::error::timed_out) {
            return fail(Errc::NoReply);
        }
        if (ec == asio::error::operation_aborted) {
            return fail(Errc::Cancelled, "datagram receive aborted");
        }
        if (ec) {
            // ICMP errors surface here on some stacks; the address simply did not answer.
            logDebug("[DatagramChannel] receive: ", ec.message(), "\n");
            return fail(Errc::NoReply, ec.message());
        }

        auto packet = DatagramPacket::decode(rx_.data(), received);
        if (!packet) {
            logDebug("[DatagramChannel] dropping packet from ", from.address().to_string(),
                     ": ", packet.error().detail, "\n");
            continue;
        }

        Datagram datagram;
        datagram.payload = std::move(packet->payload);
        datagram.sourceAddress = from.address().to_string();
        datagram.sequence = packet->sequence;
        return datagram;
    }
}

void DatagramChannel::close() {
    socket_.close();
}

} // namespace lumina::luminaire
