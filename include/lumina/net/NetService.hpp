#pragma once
#include "lumina/net/NetConfig.hpp"
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace lumina::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs dedicated I/O threads.
 *
 * Every synchronous helper in lumina (`TcpClient`, `UdpSocket`) starts an
 * async operation and blocks the caller in `with_deadline` while these
 * threads run the completion handlers. Handlers are short, so one thread is
 * enough even when a discovery pool has dozens of probes in flight.
 *
 * Lifetime notes:
 * - Destroy network clients before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the threads.
 *
 * `shared_io_context()` returns the process-wide instance for callers that
 * do not need a dedicated loop.
 */
class NetService {
public:
    explicit NetService(std::size_t threadCount = 1);
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }
    std::size_t threadCount() const { return threads_.size(); }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
};

NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();
asio::io_context& io_context();

} // namespace lumina::net
