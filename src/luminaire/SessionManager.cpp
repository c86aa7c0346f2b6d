#include "lumina/luminaire/SessionManager.hpp"

#include "lumina/log/Log.hpp"
#include "lumina/luminaire/ChannelMap.hpp"
#include "lumina/luminaire/FramedTransport.hpp"
#include "lumina/net/NetService.hpp"
#include "lumina/net/Resolve.hpp"
#include "lumina/net/TcpClient.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace lumina::luminaire {

namespace asio = lumina::net::asio;

namespace {

constexpr std::array<std::string_view, 4> BUSY_MARKERS{{
    "busy", "refused", "in use", "already connected"
}};

bool looksBusy(const std::string& payload) {
    std::string lower(payload);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return std::any_of(BUSY_MARKERS.begin(), BUSY_MARKERS.end(),
                       [&](std::string_view marker){ return lower.find(marker) != std::string::npos; });
}

std::string lastToken(const std::string& text) {
    const auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return {};
    }
    const auto begin = text.find_last_of(" \t\r\n", end);
    return text.substr(begin == std::string::npos ? 0 : begin + 1,
                       end - (begin == std::string::npos ? 0 : begin + 1) + 1);
}

std::string modelNameFrom(const std::string& idReply, LuminaireModel model) {
    switch (capabilityFor(model)) {
        case Capability::Legacy:
            return toString(model);
        case Capability::FullFeatured: {
            std::string name = idReply.substr(0, idReply.find(':'));
            const auto first = name.find_first_not_of(" \t\r\n");
            const auto last = name.find_last_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return toString(model);
            }
            return name.substr(first, last - first + 1);
        }
    }
    return toString(model);
}

} // namespace

SessionManager::SessionManager(Config config)
: config_(std::move(config))
, registry_(std::make_shared<Registry>())
{}

SessionManager::~SessionManager() = default;

expected<std::string> SessionManager::resolveAddress(const std::string& address) const {
    if (address.empty()) {
        return fail(Errc::ConnectFailed, "empty device address");
    }
    if (net::is_ip_literal(address)) {
        return address;
    }

    net::tcp::resolver::results_type results;
    if (auto ec = net::resolve(net::io_context(), address, std::to_string(config_.commandPort), results); ec) {
        return fail(Errc::ConnectFailed, "cannot resolve '" + address + "': " + ec.message());
    }
    for (const auto& entry : results) {
        if (entry.endpoint().address().is_v4()) {
            return entry.endpoint().address().to_string();
        }
    }
    if (results.begin() != results.end()) {
        return results.begin()->endpoint().address().to_string();
    }
    return fail(Errc::ConnectFailed, "'" + address + "' resolved to no addresses");
}

expected<Identity>
SessionManager::readIdentity(FramedTransport& transport, const std::string& address,
                             std::string& firmwareVersion) const {
    bool firstQuery = true;
    auto query = [&](const std::string& command) -> expected<Response> {
        const bool first = std::exchange(firstQuery, false);
        auto frame = transport.send(command, config_.commandTimeout);
        if (!frame) {
            const Error& error = frame.error();
            if (first && error.is(Errc::ConnectionLost)) {
                return fail(Errc::AlreadyConnected,
                            address + " dropped the connection on '" + command +
                            "'; another client holds its session");
            }
            return fail(Errc::ConnectFailed,
                        address + ": identity query '" + command + "' failed: " + error.describe());
        }
        Response response = Response::parse(*frame);
        if (looksBusy(response.payload)) {
            return fail(Errc::AlreadyConnected, address + ": " + response.payload, response.status);
        }
        return response;
    };

    Identity identity;

    auto version = query("VER");
    if (!version) return unexpected(version.error());
    if (!version->ok()) {
        return fail(Errc::ConnectFailed, address + ": VER rejected", version->status);
    }
    firmwareVersion = version->payload;

    auto serial = query("NS");
    if (!serial) return unexpected(serial.error());
    if (!serial->ok() || serial->payload.empty()) {
        return fail(Errc::ConnectFailed, address + ": no electronic serial", serial->status);
    }
    identity.electronicSerial = serial->payload;

    auto id = query("ID");
    if (!id) return unexpected(id.error());
    identity.model = modelFromIdReply(id->payload);
    identity.modelName = modelNameFrom(id->payload, identity.model);

    switch (capabilityFor(identity.model)) {
        case Capability::FullFeatured: {
            auto serno = query("GETSERNO");
            if (!serno) return unexpected(serno.error());
            if (serno->ok()) {
                identity.luminaireSerial = serno->payload;
            } else {
                logWarning("[SessionManager] ", address, ": GETSERNO returned status ",
                           serno->status, "\n");
            }
            break;
        }
        case Capability::Legacy:
            identity.luminaireSerial = identity.electronicSerial;
            break;
    }

    auto ip = query("GETIP");
    if (!ip) return unexpected(ip.error());
    if (ip->ok()) {
        identity.macAddress = lastToken(ip->payload);
    } else {
        logWarning("[SessionManager] ", address, ": GETIP returned status ", ip->status, "\n");
    }

    return identity;
}

expected<std::shared_ptr<Session>> SessionManager::connect(Device& device) {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto resolved = resolveAddress(device.address());
    if (!resolved) {
        device.setState(ConnectionState::Error);
        logError("[SessionManager] ", resolved.error().describe(), "\n");
        return unexpected(resolved.error());
    }
    const std::string key = *resolved;

    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        if (!registry_->addresses.insert(key).second) {
            return fail(Errc::AlreadyConnected, "a session to " + key + " is already open");
        }
    }

    std::weak_ptr<Registry> weakRegistry = registry_;
    auto release = [weakRegistry, key](const std::string&) {
        if (auto registry = weakRegistry.lock()) {
            std::lock_guard<std::mutex> lock(registry->mutex);
            registry->addresses.erase(key);
        }
    };

    auto abandon = [&](const Error& error) -> expected<std::shared_ptr<Session>> {
        release(key);
        device.setState(error.is(Errc::AlreadyConnected) ? ConnectionState::Disconnected
                                                         : ConnectionState::Error);
        logError("[SessionManager] connect to ", key, " failed: ", error.describe(), "\n");
        return unexpected(error);
    };

    device.setState(ConnectionState::Connecting);

    auto transport = std::make_unique<FramedTransport>(config_.commandTimeout);
    if (auto connected = transport->connect(key, config_.commandPort, config_.connectTimeout); !connected) {
        return abandon(connected.error());
    }

    std::string firmwareVersion;
    auto identity = readIdentity(*transport, key, firmwareVersion);
    if (!identity) {
        transport->close();
        return abandon(identity.error());
    }

    if (auto merged = device.mergeIdentity(*identity); !merged) {
        transport->close();
        return abandon(makeError(Errc::ConnectFailed, merged.error().detail));
    }

    device.setFirmwareVersion(firmwareVersion);
    device.setChannelCount(channel_map::fullChannelCount(device.capability()));
    device.setLastStatus(wire_status::SUCCESS);
    device.setState(ConnectionState::Connected);

    logInfo("[SessionManager] connected: ", device.describe(), "\n");

    return std::shared_ptr<Session>(new Session(device, config_, std::move(transport), release));
}

expected<std::shared_ptr<Session>> SessionManager::connect(const std::string& address) {
    Device device(address);
    return connect(device);
}

expected<Response> SessionManager::execute(Session& session, const Command& command) {
    return session.execute(command);
}

expected<Response> SessionManager::execute(Session& session, const std::string& command) {
    return session.execute(Command::classify(command));
}

expected<Response> SessionManager::exchange(Session& session, const Command& command) {
    return session.exchange(command);
}

void SessionManager::disconnect(Session& session) {
    if (config_.notifyDisconnectPort && session.isAlive()) {
        if (auto notified = requestRemoteDisconnect(session.address()); !notified) {
            logDebug("[SessionManager] disconnect notify to ", session.address(),
                     " skipped: ", notified.error().describe(), "\n");
        }
    }
    session.close();
    logInfo("[SessionManager] disconnected from ", session.address(), "\n");
}

expected<void> SessionManager::requestRemoteDisconnect(const std::string& address) {
    auto resolved = resolveAddress(address);
    if (!resolved) {
        return unexpected(resolved.error());
    }

    std::error_code ec;
    auto ip = asio::ip::make_address(*resolved, ec);
    if (ec) {
        return fail(Errc::ConnectFailed, "invalid address '" + *resolved + "'");
    }

    net::TcpClient client(config_.commandTimeout, config_.connectTimeout);
    if (auto connectEc = client.connect(net::tcp::endpoint(ip, config_.disconnectPort)); connectEc) {
        return fail(Errc::ConnectFailed,
                    *resolved + ":" + std::to_string(config_.disconnectPort) + ": " + connectEc.message());
    }
    client.close();
    logInfo("[SessionManager] requested remote disconnect of ", *resolved, "\n");
    return {};
}

bool SessionManager::hasLiveSession(const std::string& address) const {
    auto resolved = resolveAddress(address);
    if (!resolved) {
        logDebug("[SessionManager] ", resolved.error().describe(), "\n");
        return false;
    }
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->addresses.count(*resolved) > 0;
}

} // namespace lumina::luminaire
