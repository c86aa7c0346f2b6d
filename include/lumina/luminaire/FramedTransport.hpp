#pragma once

#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"
#include "lumina/net/NetConfig.hpp"
#include "lumina/net/TcpClient.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace lumina::luminaire {

enum class TraceDirection {
    Outbound,
    Inbound
};

/// Diagnostic mirror of every exchange; must not block.
using TraceSink = std::function<void(TraceDirection, std::string_view)>;

/**
 * @brief Terminator-framed command channel over one TCP stream.
 *
 * Commands go out with a trailing carriage return; replies are read up to
 * and including the `;` terminator. Bytes that arrive after a terminator
 * stay buffered and start the next reply.
 *
 * Error mapping:
 * - connect refusal, unreachable host or timeout: `ConnectFailed`
 * - no terminator before the deadline: `ResponseTimeout` (the stream is
 *   then marked suspect and should be reconnected)
 * - peer close or reset: `ConnectionLost`
 *
 * Not thread-safe; `Session` serialises access.
 */
class FramedTransport {
public:
    explicit FramedTransport(std::chrono::milliseconds commandTimeout = config::COMMAND_TIMEOUT_DEFAULT);
    ~FramedTransport();

    FramedTransport(const FramedTransport&) = delete;
    FramedTransport& operator=(const FramedTransport&) = delete;

    expected<void> connect(const net::tcp::endpoint& endpoint, std::chrono::milliseconds timeout);
    expected<void> connect(const std::string& address, unsigned short port,
                           std::chrono::milliseconds timeout);

    /// Reconnect to the last endpoint, dropping buffered bytes.
    expected<void> reconnect(std::chrono::milliseconds timeout);

    /// Write `command` and return the raw reply frame including its terminator.
    expected<std::string> send(std::string_view command);
    expected<std::string> send(std::string_view command, std::chrono::milliseconds timeout);

    /// Write only; used for commands whose reply is not awaited (RESET).
    expected<void> sendNoWait(std::string_view command);

    /// Wait for one more frame without sending anything.
    expected<std::string> receive(std::chrono::milliseconds timeout);

    void close();
    bool isOpen() const { return client_.is_open(); }
    bool suspect() const { return suspect_; }

    void setCommandTimeout(std::chrono::milliseconds timeout) { commandTimeout_ = timeout; }
    std::chrono::milliseconds commandTimeout() const { return commandTimeout_; }

    void setTraceSink(TraceSink sink) { trace_ = std::move(sink); }

    std::optional<net::tcp::endpoint> remoteEndpoint() const { return remote_; }

private:
    expected<void> writeLine(std::string_view command, std::chrono::milliseconds timeout);
    Error transportError(const std::error_code& ec, std::string_view what);
    void trace(TraceDirection direction, std::string_view text) const;

    net::TcpClient client_;
    std::chrono::milliseconds commandTimeout_;
    std::string pending_;
    std::optional<net::tcp::endpoint> remote_;
    bool suspect_ = false;
    TraceSink trace_;
};

} // namespace lumina::luminaire
