#pragma once

#include "lumina/core/Expected.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace lumina::luminaire {

/**
 * @brief Block/file integrity code used by the transfer sub-protocol.
 *
 * The firmware's algorithm is a property of the device, so it is a strategy
 * the transfer engine is constructed with. Implementations must satisfy
 * `combine(compute(a), compute(b)) == compute(a + b)` for data split on
 * block boundaries; the engine relies on it to check whole files.
 */
class ChecksumStrategy {
public:
    virtual ~ChecksumStrategy() = default;

    virtual std::uint32_t compute(const std::uint8_t* data, std::size_t size) const = 0;
    virtual std::uint32_t combine(std::uint32_t accumulated, std::uint32_t block) const = 0;
    virtual std::uint32_t initial() const { return 0; }
    virtual const char* name() const = 0;
};

/**
 * @brief XOR of little-endian 32-bit words, data zero-padded to a word.
 *
 * Padding to a full 512-byte block does not change the result, so the value
 * of a padded final block equals the value of its unpadded bytes.
 */
class Xor32Checksum final : public ChecksumStrategy {
public:
    std::uint32_t compute(const std::uint8_t* data, std::size_t size) const override;
    std::uint32_t combine(std::uint32_t accumulated, std::uint32_t block) const override {
        return accumulated ^ block;
    }
    const char* name() const override { return "xor32"; }
};

std::shared_ptr<const ChecksumStrategy> defaultChecksum();

/// Checksum of a local file, read in 512-byte blocks. Fails with `FileTransferError`.
expected<std::uint32_t> computeChecksum(const std::string& localPath,
                                        const ChecksumStrategy& strategy = *defaultChecksum());

/// Eight upper-case hex digits, as the device prints it.
std::string formatChecksum(std::uint32_t value);

} // namespace lumina::luminaire
