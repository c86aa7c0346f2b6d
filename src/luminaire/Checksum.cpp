#include "lumina/luminaire/Checksum.hpp"

#include "lumina/luminaire/LuminaireConfig.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace lumina::luminaire {

std::uint32_t Xor32Checksum::compute(const std::uint8_t* data, std::size_t size) const {
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < size; i += 4) {
        std::uint32_t word = 0;
        for (std::size_t b = 0; b < 4 && i + b < size; ++b) {
            word |= static_cast<std::uint32_t>(data[i + b]) << (8 * b);
        }
        sum ^= word;
    }
    return sum;
}

std::shared_ptr<const ChecksumStrategy> defaultChecksum() {
    static const auto strategy = std::make_shared<const Xor32Checksum>();
    return strategy;
}

expected<std::uint32_t> computeChecksum(const std::string& localPath, const ChecksumStrategy& strategy) {
    std::ifstream in(localPath, std::ios::binary);
    if (!in) {
        return fail(Errc::FileTransferError, "cannot open '" + localPath + "'");
    }

    std::array<char, config::FILE_BLOCK_SIZE> block{};
    std::uint32_t sum = strategy.initial();
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        std::fill(block.begin() + static_cast<std::ptrdiff_t>(got), block.end(), '\0');
        sum = strategy.combine(sum, strategy.compute(reinterpret_cast<const std::uint8_t*>(block.data()),
                                                     block.size()));
    }
    if (in.bad()) {
        return fail(Errc::FileTransferError, "read error on '" + localPath + "'");
    }
    return sum;
}

std::string formatChecksum(std::uint32_t value) {
    std::ostringstream os;
    os << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << value;
    return os.str();
}

} // namespace lumina::luminaire
