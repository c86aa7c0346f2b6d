// DatagramPacket.hpp
// -----------------------------------------------------------------------------
// Wire format of the luminaire datagram port.
//   bytes 0-1  message type (0xAEEC for a command line)
//   bytes 2-3  sequence tag, 1..65535
//   bytes 4-7  reserved, zero
//   bytes 8-9  payload length
//   bytes 10-  ASCII payload, at most 1400 bytes
// All header fields are big-endian.

#pragma once

#include "lumina/core/ByteBuffer.hpp"
#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace lumina::luminaire {

struct DatagramPacket {
    std::uint16_t type = config::DATAGRAM_TYPE_COMMAND;
    std::uint16_t sequence = 1;
    std::string payload;

    /// Fails with `Errc::ProtocolError` when the payload exceeds the limit.
    expected<core::ByteBuffer> encode() const;

    /// Rejects packets shorter than the header and length fields that overrun.
    static expected<DatagramPacket> decode(const std::uint8_t* data, std::size_t size);
};

/// Next tag after `current`: 1..65535, wrapping past zero.
constexpr std::uint16_t nextSequence(std::uint16_t current) noexcept {
    return current == 0xFFFFu ? std::uint16_t{1} : static_cast<std::uint16_t>(current + 1);
}

} // namespace lumina::luminaire
