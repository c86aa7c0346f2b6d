#pragma once

#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/Command.hpp"
#include "lumina/luminaire/Device.hpp"
#include "lumina/luminaire/FramedTransport.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"
#include "lumina/luminaire/Response.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lumina::luminaire {

/**
 * @brief Live command session bound to exactly one luminaire.
 *
 * The session owns its `FramedTransport`; nothing else reads or writes the
 * socket. A per-session mutex keeps at most one command on the wire, so
 * concurrent callers queue instead of interleaving. `acquire()` hands out an
 * `Exclusive` guard that keeps the session locked across several exchanges,
 * which is how file transfers keep other commands off the stream.
 *
 * Retry discipline (applied inside every exchange):
 * - only commands flagged idempotent are retried;
 * - only after `ResponseTimeout` or `ConnectionLost`;
 * - each retry waits `retryBackoff` and reconnects the stream first, so a
 *   late reply to the failed attempt can never be read as the next answer.
 *
 * A transport failure that survives the retries kills the session: the
 * device state becomes `Error`, the socket is closed and every later call
 * fails at once with `NotConnected`.
 *
 * Sessions are created by `SessionManager::connect`.
 */
class Session {
public:
    class Exclusive {
    public:
        Exclusive(Exclusive&&) noexcept = default;
        Exclusive& operator=(Exclusive&&) noexcept = default;

        /// Send and parse; a non-zero status is still a successful exchange.
        expected<Response> exchange(const Command& command);

        /// Like exchange(), but a non-zero status fails with `CommandFailed`.
        expected<Response> execute(const Command& command);

        expected<void> sendNoWait(const std::string& command);

        /// Wait for one more reply frame (commands that answer late, e.g. FORMAT).
        expected<Response> awaitReply(std::chrono::milliseconds timeout);

        Capability capability() const;
        Session& session() { return *session_; }

    private:
        friend class Session;
        Exclusive(Session& session, std::unique_lock<std::mutex> lock)
        : session_(&session), lock_(std::move(lock)) {}

        Session* session_;
        std::unique_lock<std::mutex> lock_;
    };

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Exclusive acquire();

    expected<Response> exchange(const Command& command);
    expected<Response> execute(const Command& command);
    expected<Response> exchange(const std::string& text) { return exchange(Command::classify(text)); }
    expected<Response> execute(const std::string& text) { return execute(Command::classify(text)); }
    expected<void> sendNoWait(const std::string& command);

    /// Snapshot of the device record, including live session state.
    Device device() const;
    const std::string& address() const { return address_; }
    Capability capability() const;
    bool isAlive() const;
    int lastStatus() const;

    void setTraceSink(TraceSink sink);

    /// Close the stream; idempotent. Leaves the device Disconnected unless it is in Error.
    void close();

private:
    friend class SessionManager;

    using ReleaseHook = std::function<void(const std::string&)>;

    Session(Device device, Config config, std::unique_ptr<FramedTransport> transport,
            ReleaseHook release);

    expected<Response> exchangeLocked(const Command& command);
    expected<Response> executeLocked(const Command& command);
    expected<void> sendNoWaitLocked(const std::string& command);
    expected<Response> awaitLocked(std::chrono::milliseconds timeout);
    expected<void> checkUsableLocked() const;
    void markDead(const Error& error);
    void closeLocked(ConnectionState finalState);
    void recordStatus(int status);

    mutable std::mutex commandMutex_;  // one command on the wire
    mutable std::mutex stateMutex_;    // guards device_ for snapshots
    Device device_;
    const std::string address_;
    const Config config_;
    std::unique_ptr<FramedTransport> transport_;
    bool dead_ = false;
    bool closed_ = false;
    ReleaseHook release_;
};

} // namespace lumina::luminaire
