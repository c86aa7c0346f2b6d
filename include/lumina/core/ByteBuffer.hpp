#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace lumina::core {

/**
 * @brief Growable byte buffer with network-order (big-endian) writers.
 *
 * Used to assemble datagram headers; `ByteReader` is the matching cursor for
 * decoding them.
 */
class ByteBuffer {
public:
    ByteBuffer();

    void clear();
    void appendUInt8(std::uint8_t value);
    void appendUInt16(std::uint16_t value);
    void appendUInt32(std::uint32_t value);
    void appendZeros(std::size_t count);
    void appendText(std::string_view text);

    const std::uint8_t* data() const { return buffer.data(); }
    std::uint8_t* data() { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

private:
    std::vector<std::uint8_t> buffer;
};

class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
    : data_(data), size_(size) {}

    std::size_t remaining() const noexcept { return size_ - offset_; }

    bool readUInt8(std::uint8_t& out) noexcept;
    bool readUInt16(std::uint16_t& out) noexcept;
    bool readUInt32(std::uint32_t& out) noexcept;
    bool skip(std::size_t count) noexcept;
    const std::uint8_t* cursor() const noexcept { return data_ + offset_; }

private:
    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t offset_ = 0;
};

} // namespace lumina::core
