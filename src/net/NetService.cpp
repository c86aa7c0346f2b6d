#include "lumina/net/NetService.hpp"
#include "lumina/log/Log.hpp"

#include <algorithm>

namespace lumina::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService(std::size_t threadCount)
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
{
    const std::size_t count = std::max<std::size_t>(threadCount, 1);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([io = io_]{ io->run(); });
    }
    logDebug("[NetService] started ", count, " I/O thread(s)\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

NetService& ensureNetService() {
    return static_service();
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

asio::io_context& io_context() {
    return *static_service().io();
}

} // namespace lumina::net
