#pragma once

#include <atomic>
#include <memory>

namespace lumina::core {

/**
 * @brief Shared cancellation flag for long-running jobs (discovery, transfers).
 *
 * Copies share one flag. Jobs poll `cancelled()` between probes or blocks,
 * so a cancel takes effect at the next boundary, never mid-exchange.
 * A default-constructed token is live; `CancelToken::none()` never fires.
 */
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    static CancelToken none() { return CancelToken(nullptr); }

    void cancel() const {
        if (flag_) flag_->store(true, std::memory_order_release);
    }

    bool cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    explicit CancelToken(std::nullptr_t) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace lumina::core
