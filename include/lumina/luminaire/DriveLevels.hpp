// DriveLevels.hpp
// -----------------------------------------------------------------------------
// Text encodings for drive-level commands and their readback.
//   * FullFeatured: "PS" + %04X per channel, single channel "P<nn>%04X".
//   * Legacy: "PA" + %04X%02X PWM/AM pair per channel, single channel
//     "PC<nn>%04X%02X".
//   * "PS?" readback is a comma separated list of hex words; legacy
//     readback alternates PWM and AM words.

#pragma once

#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/Device.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lumina::luminaire::drive {

constexpr double RAW_SCALE = 65535.0;
constexpr int AM_MIN = 4;
constexpr int AM_MAX = 63;                 // 6-bit amplitude
constexpr double PWM_AM_SCALE = 4128705.0; // 65535 * 63

struct PwmAm {
    std::uint16_t pwm = 0;
    std::uint8_t am = AM_MIN;
};

/// Clamp `level` to [0, 1] and scale to 0..65535 (truncating).
std::uint16_t toRaw(double level) noexcept;
double fromRaw(std::uint16_t raw) noexcept;

/// Split a normalised level into the PWM/AM pair a legacy device expects.
PwmAm toPwmAm(double level) noexcept;
double fromPwmAm(std::uint16_t pwm, std::uint8_t am) noexcept;

std::string encodeSetAll(Capability capability, const std::vector<double>& levels);
std::string encodeSetAllRaw(Capability capability, const std::vector<std::uint16_t>& raw);
std::string encodeSetOne(Capability capability, std::size_t channel, double level);

/// Decode a `PS?` payload into normalised levels.
expected<std::vector<double>> decodeReadback(Capability capability, const std::string& payload);

/// Decode a `PS?` payload into raw 16-bit words (FullFeatured layout only).
expected<std::vector<std::uint16_t>> decodeReadbackRaw(const std::string& payload);

} // namespace lumina::luminaire::drive
