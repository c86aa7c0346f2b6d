#pragma once

#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"
#include "lumina/luminaire/Session.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lumina::luminaire::control {

/**
 * @brief Typed command helpers over a live session.
 *
 * Each helper issues one command (two for `getCurrentScript` and the legacy
 * `stop`) and decodes the reply. Queries a legacy luminaire does not
 * implement fail with `Errc::Unsupported` without touching the wire; a
 * non-zero status fails with `Errc::CommandFailed` carrying the status.
 */

// Identity and telemetry -----------------------------------------------------
expected<std::string> getVersion(Session& session);
expected<std::string> getElectronicSerial(Session& session);
expected<std::string> getLuminaireSerial(Session& session);
expected<std::string> getMacAddress(Session& session);
expected<double> getTemperature(Session& session);
expected<std::string> getUptime(Session& session);

// Storage --------------------------------------------------------------------
expected<std::vector<std::string>> getDirectory(Session& session);
expected<std::uint32_t> getFileChecksum(Session& session, const std::string& remoteName);
expected<void> deleteFile(Session& session, const std::string& remoteName);
expected<void> formatStorage(Session& session,
                             std::chrono::milliseconds timeout = config::FORMAT_TIMEOUT_DEFAULT);

// Drive levels ---------------------------------------------------------------
expected<std::vector<double>> getDriveLevels(Session& session);
expected<std::vector<std::uint16_t>> getDriveLevelsRaw(Session& session);
expected<void> setDriveLevels(Session& session, const std::vector<double>& levels);
expected<void> setDriveLevelsRaw(Session& session, const std::vector<std::uint16_t>& raw);
expected<void> setDriveLevel(Session& session, std::size_t channel, double level);

/// Expand the 13 named wavelengths to the full layout and set them (full-featured only).
expected<void> setNamedLevels(Session& session, const std::vector<double>& named);
expected<void> goDark(Session& session);

// Playback -------------------------------------------------------------------
expected<std::string> getCurrentScript(Session& session);
expected<void> play(Session& session, const std::string& remoteName = {}, bool paused = false);
expected<void> pause(Session& session);
expected<void> resume(Session& session);
expected<void> stop(Session& session);

/// Reboot the luminaire. The reply is not awaited and the session is closed.
expected<void> reset(Session& session);

// Reply decoders, exposed for reuse by the transfer engine and tests ----------
expected<double> parseTemperature(const std::string& payload);
expected<std::uint32_t> parseLrc(const std::string& payload);
std::vector<std::string> parseDirectory(Capability capability, const std::string& payload);

} // namespace lumina::luminaire::control
