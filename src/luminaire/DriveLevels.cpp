#include "lumina/luminaire/DriveLevels.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace lumina::luminaire::drive {
namespace {

void appendHex(std::ostringstream& os, unsigned value, int width) {
    os << std::hex << std::uppercase << std::setfill('0') << std::setw(width) << value
       << std::dec << std::nouppercase;
}

void appendChannel(std::ostringstream& os, std::size_t channel) {
    os << std::setfill('0') << std::setw(2) << channel;
}

void appendPwmAm(std::ostringstream& os, const PwmAm& pair) {
    appendHex(os, pair.pwm, 4);
    appendHex(os, pair.am, 2);
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

expected<std::vector<std::uint32_t>> splitHexWords(const std::string& payload) {
    std::vector<std::uint32_t> words;
    std::istringstream in(trim(payload));
    std::string token;
    while (std::getline(in, token, ',')) {
        token = trim(token);
        if (token.empty() || token.size() > 8) {
            return fail(Errc::ProtocolError, "malformed drive level readback '" + payload + "'");
        }
        for (char c : token) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return fail(Errc::ProtocolError, "malformed drive level readback '" + payload + "'");
            }
        }
        words.push_back(static_cast<std::uint32_t>(std::stoul(token, nullptr, 16)));
    }
    if (words.empty()) {
        return fail(Errc::ProtocolError, "empty drive level readback");
    }
    return words;
}

} // namespace

std::uint16_t toRaw(double level) noexcept {
    const double clamped = std::clamp(level, 0.0, 1.0);
    return static_cast<std::uint16_t>(clamped * RAW_SCALE);
}

double fromRaw(std::uint16_t raw) noexcept {
    return static_cast<double>(raw) / RAW_SCALE;
}

PwmAm toPwmAm(double level) noexcept {
    const double fam = static_cast<double>(AM_MAX) * std::clamp(level, 0.0, 1.0);
    // AM rounds up so PWM = fam * 65535 / AM never exceeds 16 bits.
    const int am = std::clamp(static_cast<int>(std::ceil(fam - 1e-9)), AM_MIN, AM_MAX);
    const double pwm = std::min(fam * RAW_SCALE / static_cast<double>(am), RAW_SCALE);

    PwmAm pair;
    pair.pwm = static_cast<std::uint16_t>(pwm);
    pair.am = static_cast<std::uint8_t>(am);
    return pair;
}

double fromPwmAm(std::uint16_t pwm, std::uint8_t am) noexcept {
    return static_cast<double>(pwm) * static_cast<double>(am) / PWM_AM_SCALE;
}

std::string encodeSetAll(Capability capability, const std::vector<double>& levels) {
    std::ostringstream os;
    switch (capability) {
        case Capability::FullFeatured:
            os << "PS";
            for (double level : levels) {
                appendHex(os, toRaw(level), 4);
            }
            break;
        case Capability::Legacy:
            os << "PA";
            for (double level : levels) {
                appendPwmAm(os, toPwmAm(level));
            }
            break;
    }
    return os.str();
}

std::string encodeSetAllRaw(Capability capability, const std::vector<std::uint16_t>& raw) {
    switch (capability) {
        case Capability::FullFeatured: {
            std::ostringstream os;
            os << "PS";
            for (auto value : raw) {
                appendHex(os, value, 4);
            }
            return os.str();
        }
        case Capability::Legacy: {
            std::vector<double> levels;
            levels.reserve(raw.size());
            for (auto value : raw) {
                levels.push_back(fromRaw(value));
            }
            return encodeSetAll(capability, levels);
        }
    }
    return {};
}

std::string encodeSetOne(Capability capability, std::size_t channel, double level) {
    std::ostringstream os;
    switch (capability) {
        case Capability::FullFeatured:
            os << 'P';
            appendChannel(os, channel);
            appendHex(os, toRaw(level), 4);
            break;
        case Capability::Legacy:
            os << "PC";
            appendChannel(os, channel);
            appendPwmAm(os, toPwmAm(level));
            break;
    }
    return os.str();
}

expected<std::vector<double>> decodeReadback(Capability capability, const std::string& payload) {
    auto words = splitHexWords(payload);
    if (!words) {
        return unexpected(words.error());
    }

    std::vector<double> levels;
    switch (capability) {
        case Capability::FullFeatured:
            levels.reserve(words->size());
            for (auto word : *words) {
                levels.push_back(static_cast<double>(word) / RAW_SCALE);
            }
            break;
        case Capability::Legacy:
            if (words->size() % 2 != 0) {
                return fail(Errc::ProtocolError, "legacy readback has an unpaired PWM word");
            }
            levels.reserve(words->size() / 2);
            for (std::size_t i = 0; i < words->size(); i += 2) {
                levels.push_back(static_cast<double>((*words)[i]) *
                                 static_cast<double>((*words)[i + 1]) / PWM_AM_SCALE);
            }
            break;
    }
    return levels;
}

expected<std::vector<std::uint16_t>> decodeReadbackRaw(const std::string& payload) {
    auto words = splitHexWords(payload);
    if (!words) {
        return unexpected(words.error());
    }

    std::vector<std::uint16_t> raw;
    raw.reserve(words->size());
    for (auto word : *words) {
        if (word > 0xFFFFu) {
            return fail(Errc::ProtocolError, "drive level word exceeds 16 bits");
        }
        raw.push_back(static_cast<std::uint16_t>(word));
    }
    return raw;
}

} // namespace lumina::luminaire::drive
