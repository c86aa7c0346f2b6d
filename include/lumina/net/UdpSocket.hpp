#pragma once
#include "lumina/net/NetConfig.hpp"
#include "lumina/net/Deadline.hpp"
#include "lumina/net/NetService.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace lumina::net {

/**
 * UdpSocket
 *
 * Small helper for datagram use-cases like subnet probing and broadcast.
 *
 * `send_to` / `recv_from` use the same `with_deadline` pattern as TCP so a
 * silent peer costs at most one timeout. Each socket owns its own strand so
 * several sockets can be used from different threads at once.
 */
class UdpSocket {
public:
    UdpSocket()
    : io_(shared_io_context())
    , sock_(asio::make_strand(*io_))
    {}

    explicit UdpSocket(asio::io_context& io) : sock_(asio::make_strand(io)) {}

    ~UdpSocket() { close(); }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    error_code bind_any(std::uint16_t port) {
        error_code ec;
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    error_code enable_broadcast(bool on = true) {
        error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }

    // Send a datagram, fail if not sent within timeout.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        auto ex = sock_.get_executor();
        return with_deadline(ex, timeout,
            [&](auto cb){
                sock_.async_send_to(asio::buffer(data, n), ep, 0,
                    [cb](const error_code& ec, std::size_t){ cb(ec); });
            },
            [&]{ cancel(); });
    }

    // Receive one datagram, with timeout. Returns ec + fills out_ep + out_n.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout) {
        auto ex = sock_.get_executor();
        out_n = 0;
        return with_deadline(ex, timeout,
            [&](auto cb){
                sock_.async_receive_from(asio::buffer(data, max), out_ep, 0,
                    [&, cb](const error_code& ec, std::size_t n){
                        out_n = n; cb(ec);
                    });
            },
            [&]{ cancel(); });
    }

    bool is_open() const { return sock_.is_open(); }

    void cancel() { error_code ignore; sock_.cancel(ignore); }

    udp::socket& raw() { return sock_; }
    void close() { error_code ignore; sock_.close(ignore); }

private:
    std::shared_ptr<asio::io_context> io_;
    udp::socket sock_;
};

} // namespace lumina::net
