#pragma once

#include "lumina/core/Cancellation.hpp"
#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/Device.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace lumina::luminaire {

struct DiscoveryResult {
    std::vector<Device> devices;   // arrival order, unique by address
    bool partial = false;          // cancelled before every subnet was scanned
    std::size_t probesSent = 0;
    std::vector<std::string> subnetsScanned;
};

/**
 * @brief Finds luminaires by probing every candidate address with `NS`.
 *
 * For each subnet prefix a pool of at most `discoveryConcurrency` workers,
 * each owning its own `DatagramChannel`, pulls addresses from a shared
 * index, sends one probe and waits up to `probeTimeout` for the serial
 * number. The subnet as a whole is bounded by `discoveryTimeout`: workers
 * stop taking addresses once it passes and every wait is clipped to what is
 * left of it, so an empty subnet costs at most that budget.
 *
 * Silent subnets yield no devices and no error; only an unusable
 * configuration fails the call.
 */
class DiscoveryEngine {
public:
    explicit DiscoveryEngine(Config config = {});

    expected<DiscoveryResult> discover(const core::CancelToken& cancel = core::CancelToken::none());
    expected<DiscoveryResult> discover(const std::vector<std::string>& subnets,
                                       const core::CancelToken& cancel = core::CancelToken::none());

    const Config& config() const { return config_; }

    /// Alphanumerics plus '-', '_' and '.', non-empty.
    static bool isWellFormedSerial(const std::string& serial);

    /// "a.b.c." x [first, last] in ascending host order.
    static expected<std::vector<std::string>>
    candidateAddresses(const std::string& prefix, int first, int last);

private:
    class Aggregator;

    void scanSubnet(const std::vector<std::string>& addresses,
                    Aggregator& found,
                    const core::CancelToken& cancel);
    void broadcastProbe(const std::string& prefix, Aggregator& found);

    Config config_;
};

} // namespace lumina::luminaire
