#pragma once

#include "lumina/core/Expected.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace lumina::luminaire {

/**
 * @brief Command-set family of a luminaire.
 *
 * Legacy devices (Light Replicator) lack the temperature, uptime, LRC and
 * current-script queries, encode drive levels as PWM/AM pairs and transfer
 * files without checksums. Components branch on this value with exhaustive
 * switches rather than on the model.
 */
enum class Capability {
    FullFeatured,
    Legacy
};

enum class LuminaireModel {
    Octa,
    Penta,
    LightReplicator,
    Unknown
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Error
};

const char* toString(Capability capability);
const char* toString(LuminaireModel model);
const char* toString(ConnectionState state);

Capability capabilityFor(LuminaireModel model);

/// Classify the reply to `ID`. Light Replicators answer with a voltage/current line.
LuminaireModel modelFromIdReply(const std::string& reply);

/**
 * @brief Identity of a luminaire as learned from discovery or identity queries.
 *
 * Empty strings (and `LuminaireModel::Unknown`) mean "not learned yet".
 */
struct Identity {
    std::string address;
    std::string macAddress;
    std::string electronicSerial;
    std::string luminaireSerial;
    std::string modelName;
    LuminaireModel model = LuminaireModel::Unknown;
};

/**
 * @brief Value object describing one discovered or connected luminaire.
 *
 * Identity fields are write-once: `mergeIdentity` fills fields that are
 * still empty and reports a conflicting non-empty value as a mismatch
 * instead of overwriting it. Session state and cached telemetry are freely
 * mutable.
 *
 * The connection state is shared by every copy of a record. A `Session`
 * built from the caller's record therefore moves that record to
 * `Disconnected` or `Error` when it closes or dies.
 */
class Device {
public:
    Device() = default;
    explicit Device(std::string address);

    static Device discovered(std::string address, std::string electronicSerial);

    const Identity& identity() const { return identity_; }
    const std::string& address() const { return identity_.address; }
    const std::string& macAddress() const { return identity_.macAddress; }
    const std::string& electronicSerial() const { return identity_.electronicSerial; }
    const std::string& luminaireSerial() const { return identity_.luminaireSerial; }
    const std::string& modelName() const { return identity_.modelName; }
    LuminaireModel model() const { return identity_.model; }
    Capability capability() const { return capabilityFor(identity_.model); }

    /// Fails with `Errc::ProtocolError` naming the first conflicting field.
    expected<void> mergeIdentity(const Identity& incoming);

    ConnectionState state() const { return state_->load(); }
    void setState(ConnectionState state) { state_->store(state); }

    int lastStatus() const { return lastStatus_; }
    void setLastStatus(int status) { lastStatus_ = status; }

    std::size_t channelCount() const { return channelCount_; }
    void setChannelCount(std::size_t count) { channelCount_ = count; }

    const std::string& firmwareVersion() const { return firmwareVersion_; }
    void setFirmwareVersion(std::string version) { firmwareVersion_ = std::move(version); }

    std::string describe() const;

private:
    Identity identity_{};
    std::shared_ptr<std::atomic<ConnectionState>> state_ =
        std::make_shared<std::atomic<ConnectionState>>(ConnectionState::Disconnected);
    int lastStatus_ = Error::NO_STATUS;
    std::size_t channelCount_ = 0;
    std::string firmwareVersion_{};
};

} // namespace lumina::luminaire
