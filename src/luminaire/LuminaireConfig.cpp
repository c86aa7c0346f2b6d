#include "lumina/luminaire/LuminaireConfig.hpp"

#include <cctype>
#include <sstream>

namespace lumina::luminaire {

namespace config {

std::vector<std::string> defaultSubnets() {
    std::vector<std::string> subnets;
    for (int i = 0; i <= 11; ++i) {
        subnets.push_back("192.168." + std::to_string(i) + ".");
    }
    return subnets;
}

} // namespace config

expected<std::string> normaliseSubnetPrefix(const std::string& prefix) {
    std::string text = prefix;
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }

    std::istringstream in(text);
    std::string octet;
    std::string normalised;
    int count = 0;
    while (std::getline(in, octet, '.')) {
        if (octet.empty() || octet.size() > 3) {
            return fail(Errc::InvalidConfig, "malformed subnet prefix '" + prefix + "'");
        }
        for (char c : octet) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return fail(Errc::InvalidConfig, "malformed subnet prefix '" + prefix + "'");
            }
        }
        if (std::stoi(octet) > 255) {
            return fail(Errc::InvalidConfig, "subnet octet out of range in '" + prefix + "'");
        }
        normalised += octet;
        normalised += '.';
        ++count;
    }

    if (count != 3) {
        return fail(Errc::InvalidConfig, "subnet prefix must have three octets: '" + prefix + "'");
    }
    return normalised;
}

expected<void> Config::validate() const {
    if (subnets.empty()) {
        return fail(Errc::InvalidConfig, "no candidate subnets");
    }
    for (const auto& subnet : subnets) {
        if (auto normalised = normaliseSubnetPrefix(subnet); !normalised) {
            return unexpected(normalised.error());
        }
    }
    if (hostRangeFirst < 1 || hostRangeLast > 254 || hostRangeFirst > hostRangeLast) {
        return fail(Errc::InvalidConfig,
                    "host range " + std::to_string(hostRangeFirst) + ".." +
                    std::to_string(hostRangeLast) + " is not within 1..254");
    }
    if (discoveryConcurrency == 0) {
        return fail(Errc::InvalidConfig, "discovery concurrency must be at least 1");
    }
    if (fileBlockSize != config::FILE_BLOCK_SIZE) {
        return fail(Errc::InvalidConfig,
                    "file block size must be " + std::to_string(config::FILE_BLOCK_SIZE) +
                    " bytes, got " + std::to_string(fileBlockSize));
    }
    if (maxRetries < 0 || maxBlockRetries < 0) {
        return fail(Errc::InvalidConfig, "retry budgets must not be negative");
    }
    if (commandTimeout.count() <= 0 || connectTimeout.count() <= 0 ||
        probeTimeout.count() <= 0 || discoveryTimeout.count() <= 0) {
        return fail(Errc::InvalidConfig, "timeouts must be positive");
    }
    if (commandPort == 0 || datagramPort == 0) {
        return fail(Errc::InvalidConfig, "ports must be non-zero");
    }
    return {};
}

} // namespace lumina::luminaire
