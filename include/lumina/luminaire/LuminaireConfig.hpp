#pragma once

#include "lumina/core/Expected.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lumina::luminaire::config {

/**
 * @brief Protocol constants and configuration defaults for luminaires.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units. Anything a deployment may need to change is also a
 * field of `Config` below; the constants are only its defaults.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short COMMAND_PORT_DEFAULT = 57007;
constexpr unsigned short DISCONNECT_PORT_DEFAULT = 57011;
constexpr unsigned short DATAGRAM_PORT_DEFAULT = 57000;

constexpr std::chrono::milliseconds CONNECT_TIMEOUT_DEFAULT{10000};
constexpr std::chrono::milliseconds COMMAND_TIMEOUT_DEFAULT{5000};
constexpr std::chrono::milliseconds DISCOVERY_TIMEOUT_DEFAULT{30000}; // per subnet
constexpr std::chrono::milliseconds PROBE_TIMEOUT_DEFAULT{500};
constexpr std::chrono::milliseconds FORMAT_TIMEOUT_DEFAULT{400000};

// Command framing -------------------------------------------------------------
constexpr char COMMAND_TERMINATOR = '\r';
constexpr char RESPONSE_TERMINATOR = ';';

// Datagram framing ------------------------------------------------------------
constexpr std::uint16_t DATAGRAM_TYPE_COMMAND = 0xAEEC;
constexpr std::size_t DATAGRAM_HEADER_SIZE = 10;
constexpr std::size_t DATAGRAM_MAX_PAYLOAD = 1400;

// Discovery -------------------------------------------------------------------
constexpr int HOST_RANGE_FIRST_DEFAULT = 2;
constexpr int HOST_RANGE_LAST_DEFAULT = 253;
constexpr std::size_t DISCOVERY_CONCURRENCY_DEFAULT = 64;

// Retries ---------------------------------------------------------------------
constexpr int MAX_RETRIES_DEFAULT = 3;
constexpr std::chrono::milliseconds RETRY_BACKOFF_DEFAULT{500};

// File transfer ---------------------------------------------------------------
constexpr std::size_t FILE_BLOCK_SIZE = 512;
constexpr int MAX_BLOCK_RETRIES_DEFAULT = 10;

std::vector<std::string> defaultSubnets();

} // namespace lumina::luminaire::config

namespace lumina::luminaire {

/**
 * @brief Everything a deployment can tune, passed by value to each component.
 *
 * There is no process-wide configuration: `DiscoveryEngine`,
 * `SessionManager` and `FileTransferEngine` each copy the `Config` they are
 * constructed with.
 */
struct Config {
    unsigned short commandPort = config::COMMAND_PORT_DEFAULT;
    unsigned short disconnectPort = config::DISCONNECT_PORT_DEFAULT;
    unsigned short datagramPort = config::DATAGRAM_PORT_DEFAULT;

    std::chrono::milliseconds connectTimeout = config::CONNECT_TIMEOUT_DEFAULT;
    std::chrono::milliseconds commandTimeout = config::COMMAND_TIMEOUT_DEFAULT;
    std::chrono::milliseconds discoveryTimeout = config::DISCOVERY_TIMEOUT_DEFAULT;
    std::chrono::milliseconds probeTimeout = config::PROBE_TIMEOUT_DEFAULT;
    std::chrono::milliseconds formatTimeout = config::FORMAT_TIMEOUT_DEFAULT;

    std::vector<std::string> subnets = config::defaultSubnets();
    int hostRangeFirst = config::HOST_RANGE_FIRST_DEFAULT;
    int hostRangeLast = config::HOST_RANGE_LAST_DEFAULT;   // inclusive
    std::size_t discoveryConcurrency = config::DISCOVERY_CONCURRENCY_DEFAULT;
    bool stopAtFirstPopulatedSubnet = false;
    bool broadcastProbe = false;

    int maxRetries = config::MAX_RETRIES_DEFAULT;
    std::chrono::milliseconds retryBackoff = config::RETRY_BACKOFF_DEFAULT;

    std::size_t fileBlockSize = config::FILE_BLOCK_SIZE;   // the firmware only takes 512
    int maxBlockRetries = config::MAX_BLOCK_RETRIES_DEFAULT;

    bool notifyDisconnectPort = false;

    /// Rejects values no component can work with (`Errc::InvalidConfig`).
    expected<void> validate() const;
};

/**
 * @brief Normalise a subnet prefix to the "a.b.c." form.
 *
 * Accepts "a.b.c" or "a.b.c." with each octet in 0..255.
 */
expected<std::string> normaliseSubnetPrefix(const std::string& prefix);

} // namespace lumina::luminaire
