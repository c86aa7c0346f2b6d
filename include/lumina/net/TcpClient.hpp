#pragma once
#include "lumina/net/NetConfig.hpp"
#include "lumina/net/Deadline.hpp"
#include "lumina/net/NetService.hpp"
#include "lumina/log/Log.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace lumina::net {
using duration = std::chrono::milliseconds;

/**
 * @brief Thin wrapper around `tcp::socket` that adds deadlines and low-latency options.
 *
 * Highlights:
 * - `connect(...)` tries each endpoint and respects a per-attempt timeout.
 * - `read_until(...)`, `read_exact(...)` and `write_all(...)` block the caller
 *   while enforcing deadlines.
 * - `setLowLatency()` enables TCP_NODELAY and keepalive.
 * - All socket work is serialized by a strand executor.
 *
 * Timeouts are per instance; there is no process-wide default.
 * The caller must keep the owning `asio::io_context` running while using the API.
 */
class TcpClient {
public:
    static constexpr std::size_t DEFAULT_MAX_FRAME = 64 * 1024;

    explicit TcpClient(duration defaultTimeout = duration{5000},
                       duration connectTimeout = duration{10000})
    : io_(shared_io_context())
    , strand_(asio::make_strand(*io_))
    , socket_(strand_)
    , defaultTimeout_(sanitize(defaultTimeout))
    , connectTimeout_(sanitize(connectTimeout))
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    void setDefaultTimeout(duration timeout) {
        defaultTimeout_ = sanitize(timeout);
    }

    duration defaultTimeout() const { return defaultTimeout_; }

    void setConnectTimeout(duration timeout) {
        connectTimeout_ = sanitize(timeout);
    }

    duration connectTimeout() const { return connectTimeout_; }

    tcp::socket& socket() { return socket_; }

    // Each attempt resets the socket before calling connect_one().
    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        return connect_one(endpoint, timeout);
    }

    std::error_code connect(const tcp::endpoint& endpoint) {
        return connect(endpoint, connectTimeout_);
    }

    // Connect from resolver results (entries have .endpoint()); first success wins.
    template <typename Results>
    std::error_code connect(Results results, duration timeout,
                       decltype(std::declval<typename Results::value_type>().endpoint(), 0) = 0) {
        std::error_code last = asio::error::host_not_found;

        for (auto& e : results) {
            auto ec = connect(e.endpoint(), timeout);
            if (!ec) return ec;
            last = ec;
        }
        return last;
    }

    template <typename Results>
    std::error_code connect(Results results,
                       decltype(std::declval<typename Results::value_type>().endpoint(), 0) = 0) {
        return connect(results, connectTimeout_);
    }

    /**
     * @brief Read until @p delimiter is present in @p buffer.
     *
     * Bytes are appended to @p buffer; on success @p frameLengthOut receives
     * the length of the prefix ending with the delimiter. Anything after that
     * prefix is already-received data for the next frame and must be kept by
     * the caller. Fails with `asio::error::not_found` when @p maxFrame bytes
     * arrive without a delimiter.
     */
    std::error_code read_until(std::string& buffer, char delimiter, duration timeout,
                               std::size_t* frameLengthOut = nullptr,
                               std::size_t maxFrame = DEFAULT_MAX_FRAME) {
        auto ex = socket_.get_executor();
        std::size_t frameLength = 0;
        auto ec = with_deadline(ex, sanitize(timeout),
            [&](auto completion){
                asio::async_read_until(socket_, asio::dynamic_buffer(buffer, maxFrame), delimiter,
                    [&, completion](const std::error_code& op_ec, std::size_t n){
                        frameLength = n;
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
        if (frameLengthOut) {
            *frameLengthOut = ec ? 0 : frameLength;
        }
        return ec;
    }

    std::error_code read_until(std::string& buffer, char delimiter,
                               std::size_t* frameLengthOut = nullptr) {
        return read_until(buffer, delimiter, defaultTimeout_, frameLengthOut);
    }

    std::error_code read_exact(void* buf, std::size_t n, duration timeout,
                               std::size_t* bytesTransferredOut = nullptr) {
        auto ex = socket_.get_executor();
        std::size_t bytesTransferred = 0;
        auto ec = with_deadline(ex, sanitize(timeout),
            [&](auto completion){
                asio::async_read(socket_, asio::buffer(buf, n),
                    [&, completion](const std::error_code& op_ec, std::size_t transferred){
                        bytesTransferred = transferred;
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
        if (bytesTransferredOut) {
            *bytesTransferredOut = bytesTransferred;
        }
        return ec;
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [&](auto completion){
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
    }

    std::error_code read_exact(void* buf, std::size_t n, std::size_t* bytesTransferredOut = nullptr) {
        return read_exact(buf, n, defaultTimeout_, bytesTransferredOut);
    }

    std::error_code write_all(const void* buf, std::size_t n) {
        return write_all(buf, n, defaultTimeout_);
    }

    void setLowLatency() {
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
        socket_.set_option(asio::socket_base::keep_alive(true), ec);
    }

    bool is_open() const { return socket_.is_open(); }

    // Best-effort cancellation of pending ops on the socket.
    void cancel() {
        std::error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        logDebug("[TcpClient] close()\n");
        std::error_code ec;
        // cancel -> shutdown -> close
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    std::error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [&](auto completion){ socket_.async_connect(ep, completion); },
            [&]{ cancel(); }
        );
    }

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    duration defaultTimeout_;
    duration connectTimeout_;
};

} // namespace lumina::net
