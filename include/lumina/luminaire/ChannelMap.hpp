// ChannelMap.hpp
// -----------------------------------------------------------------------------
// Mapping between the reduced "named wavelength" view of a full-featured
// luminaire and its full channel vector.
//   * The full layout has 24 channels, ultraviolet first, infrared last.
//   * The 13 named wavelengths RB1..R2 occupy full indices 4..16.
//   * expand() and reduce() are pure; neither allocates beyond its result.

#pragma once

#include "lumina/luminaire/Device.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace lumina::luminaire::channel_map {

constexpr std::size_t FULL_CHANNEL_COUNT = 24;
constexpr std::size_t NAMED_CHANNEL_COUNT = 13;
constexpr std::size_t FIRST_NAMED_INDEX = 4;
constexpr std::size_t LEGACY_CHANNEL_COUNT = 32;

const std::array<std::string_view, FULL_CHANNEL_COUNT>& fullChannelNames();
const std::array<std::string_view, NAMED_CHANNEL_COUNT>& namedChannelNames();

/// Index of `name` in the full layout (case-sensitive, e.g. "PC-A").
std::optional<std::size_t> fullIndexOf(std::string_view name);

/// Full index of named channel `namedIndex`, or nullopt past the 13th.
std::optional<std::size_t> fullIndexForNamed(std::size_t namedIndex);

/**
 * @brief Place each named value at its fixed full index.
 *
 * Always returns FULL_CHANNEL_COUNT values. Short inputs are zero-padded;
 * values past the 13th have no mapped index and are ignored.
 */
std::vector<double> expand(const std::vector<double>& named);

/// Inverse view of expand(): the 13 named values read out of a full vector.
std::vector<double> reduce(const std::vector<double>& full);

/// Number of drive channels a device of this capability accepts in one set.
std::size_t fullChannelCount(Capability capability);

} // namespace lumina::luminaire::channel_map
