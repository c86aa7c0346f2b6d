#pragma once
#include "lumina/net/NetConfig.hpp"
#include "lumina/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - If the timer fires first it calls `cancel()`, which forces the operation
 *   to complete with `operation_aborted`; the call then reports `timed_out`.
 * - The calling thread blocks on a condition variable until the operation's
 *   own completion handler has run.
 *
 * Safety notes:
 * - Because we always wait for the operation handler (even after a timeout),
 *   callers may capture stack variables by reference in their completion
 *   lambdas: nothing touches them after this function returns.
 * - Handlers capture a `shared_ptr<State>` so a late timer callback never
 *   touches destroyed synchronisation primitives.
 * - The `cancel()` functor must cancel the socket that launched the
 *   operation; socket cancellation always completes pending operations.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running on another
 *   thread while we block, otherwise the wait never completes.
 */
namespace lumina::net {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool opDone = false;
        bool timedOut = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    // Completion of the user async op
    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            st->opDone = true;
            if (!st->timedOut) {
                st->ec = op_ec;
            }
        }
        st->cv.notify_one();
        timer->cancel(); // handler below must be benign when aborted
    };

    start_async(op_handler);

    // Arm the deadline
    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timeout](const std::error_code& tec) mutable {
        if (tec == asio::error::operation_aborted) {
            return; // operation finished first
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->opDone) {
                return;
            }
            st->timedOut = true;
            st->ec = asio::error::timed_out;
        }
        logDebug("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
        cancel(); // op completes with operation_aborted and wakes the waiter
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->opDone; });
    return st->ec;
}

} // namespace lumina::net
