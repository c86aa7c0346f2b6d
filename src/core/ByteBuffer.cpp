#include "lumina/core/ByteBuffer.hpp"

namespace lumina::core {

ByteBuffer::ByteBuffer() {
    buffer.reserve(1500); // one Ethernet frame
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt16(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendUInt32(std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendZeros(std::size_t count) {
    buffer.insert(buffer.end(), count, std::uint8_t{0});
}

void ByteBuffer::appendText(std::string_view text) {
    buffer.insert(buffer.end(), text.begin(), text.end());
}

bool ByteReader::readUInt8(std::uint8_t& out) noexcept {
    if (remaining() < 1) return false;
    out = data_[offset_++];
    return true;
}

bool ByteReader::readUInt16(std::uint16_t& out) noexcept {
    if (remaining() < 2) return false;
    out = static_cast<std::uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return true;
}

bool ByteReader::readUInt32(std::uint32_t& out) noexcept {
    if (remaining() < 4) return false;
    out = (static_cast<std::uint32_t>(data_[offset_]) << 24)
        | (static_cast<std::uint32_t>(data_[offset_ + 1]) << 16)
        | (static_cast<std::uint32_t>(data_[offset_ + 2]) << 8)
        | static_cast<std::uint32_t>(data_[offset_ + 3]);
    offset_ += 4;
    return true;
}

bool ByteReader::skip(std::size_t count) noexcept {
    if (remaining() < count) return false;
    offset_ += count;
    return true;
}

} // namespace lumina::core
