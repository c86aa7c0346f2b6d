#include "lumina/luminaire/DatagramPacket.hpp"

namespace lumina::luminaire {

expected<core::ByteBuffer> DatagramPacket::encode() const {
    if (payload.size() > config::DATAGRAM_MAX_PAYLOAD) {
        return fail(Errc::ProtocolError,
                    "datagram payload of " + std::to_string(payload.size()) +
                    " bytes exceeds " + std::to_string(config::DATAGRAM_MAX_PAYLOAD));
    }

    core::ByteBuffer buffer;
    buffer.appendUInt16(type);
    buffer.appendUInt16(sequence);
    buffer.appendZeros(4);
    buffer.appendUInt16(static_cast<std::uint16_t>(payload.size()));
    buffer.appendText(payload);
    return buffer;
}

expected<DatagramPacket> DatagramPacket::decode(const std::uint8_t* data, std::size_t size) {
    if (!data || size < config::DATAGRAM_HEADER_SIZE) {
        return fail(Errc::ProtocolError,
                    "datagram of " + std::to_string(size) + " bytes is shorter than its header");
    }

    core::ByteReader reader(data, size);
    DatagramPacket packet;
    std::uint16_t length = 0;
    reader.readUInt16(packet.type);
    reader.readUInt16(packet.sequence);
    reader.skip(4);
    reader.readUInt16(length);

    if (length > reader.remaining() || length > config::DATAGRAM_MAX_PAYLOAD) {
        return fail(Errc::ProtocolError,
                    "datagram length field " + std::to_string(length) +
                    " overruns " + std::to_string(reader.remaining()) + " payload bytes");
    }

    packet.payload.assign(reinterpret_cast<const char*>(reader.cursor()), length);
    return packet;
}

} // namespace lumina::luminaire
