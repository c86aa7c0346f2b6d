#pragma once

#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/Command.hpp"
#include "lumina/luminaire/Device.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"
#include "lumina/luminaire/Response.hpp"
#include "lumina/luminaire/Session.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace lumina::luminaire {

/**
 * @brief Turns `Device` records into live `Session`s and tears them down.
 *
 * connect():
 * - opens the command port with `connectTimeout` (`ConnectFailed` on
 *   refusal, unreachable host or timeout);
 * - reads the identity (VER, NS, ID, GETSERNO on full-featured models,
 *   GETIP) and merges it into the caller's record; a conflicting identity
 *   is `ConnectFailed`;
 * - reports `AlreadyConnected` when the luminaire accepts and immediately
 *   drops the stream or answers with a busy banner (its single-client
 *   slot is taken), and when this manager already holds a live session to
 *   the same address.
 *
 * The address registry belongs to this manager only; sessions release their
 * slot when they close, even if they outlive the manager.
 */
class SessionManager {
public:
    explicit SessionManager(Config config = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Connect and update `device` in place (identity, state, firmware).
    expected<std::shared_ptr<Session>> connect(Device& device);

    /// Connect by IP address or host name.
    expected<std::shared_ptr<Session>> connect(const std::string& address);

    expected<Response> execute(Session& session, const Command& command);
    expected<Response> execute(Session& session, const std::string& command);
    expected<Response> exchange(Session& session, const Command& command);

    /// Best-effort notify, then close. Never fails locally.
    void disconnect(Session& session);

    /// Ask the luminaire at `address` to drop whichever client holds its session.
    expected<void> requestRemoteDisconnect(const std::string& address);

    /// Host names are resolved first; the registry holds IP addresses.
    bool hasLiveSession(const std::string& address) const;
    const Config& config() const { return config_; }

private:
    struct Registry {
        std::mutex mutex;
        std::set<std::string> addresses;
    };

    expected<std::string> resolveAddress(const std::string& address) const;
    expected<Identity> readIdentity(FramedTransport& transport, const std::string& address,
                                    std::string& firmwareVersion) const;

    Config config_;
    std::shared_ptr<Registry> registry_;
};

} // namespace lumina::luminaire
