#include "lumina/luminaire/Discovery.hpp"

#include "lumina/log/Log.hpp"
#include "lumina/luminaire/DatagramChannel.hpp"
#include "lumina/luminaire/Response.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <utility>

namespace lumina::luminaire {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {
constexpr const char* PROBE_COMMAND = "NS";

milliseconds remainingUntil(Clock::time_point deadline) {
    return std::chrono::duration_cast<milliseconds>(deadline - Clock::now());
}
} // namespace

class DiscoveryEngine::Aggregator {
public:
    // Returns true if `address` was new.
    bool add(const std::string& address, const std::string& serial) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!seen_.insert(address).second) {
            return false;
        }
        devices_.push_back(Device::discovered(address, serial));
        return true;
    }

    void countProbe() { probes_.fetch_add(1, std::memory_order_relaxed); }
    std::size_t probes() const { return probes_.load(std::memory_order_relaxed); }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.size();
    }

    std::vector<Device> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::move(devices_);
    }

    void accept(const Datagram& reply) {
        const auto response = Response::parse(reply.payload);
        if (!response.statusParsed || !response.ok() || !isWellFormedSerial(response.payload)) {
            logDebug("[Discovery] ignoring reply from ", reply.sourceAddress,
                     " (status ", response.status, ")\n");
            return;
        }
        if (add(reply.sourceAddress, response.payload)) {
            logInfo("[Discovery] found ", response.payload, " at ", reply.sourceAddress, "\n");
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<Device> devices_;
    std::unordered_set<std::string> seen_;
    std::atomic<std::size_t> probes_{0};
};

DiscoveryEngine::DiscoveryEngine(Config config)
: config_(std::move(config))
{}

bool DiscoveryEngine::isWellFormedSerial(const std::string& serial) {
    if (serial.empty()) {
        return false;
    }
    return std::all_of(serial.begin(), serial.end(), [](unsigned char c){
        return std::isalnum(c) || c == '-' || c == '_' || c == '.';
    });
}

expected<std::vector<std::string>>
DiscoveryEngine::candidateAddresses(const std::string& prefix, int first, int last) {
    auto normalised = normaliseSubnetPrefix(prefix);
    if (!normalised) {
        return unexpected(normalised.error());
    }
    if (first < 1 || last > 254 || first > last) {
        return fail(Errc::InvalidConfig, "invalid host range");
    }

    std::vector<std::string> addresses;
    addresses.reserve(static_cast<std::size_t>(last - first + 1));
    for (int host = first; host <= last; ++host) {
        addresses.push_back(*normalised + std::to_string(host));
    }
    return addresses;
}

expected<DiscoveryResult> DiscoveryEngine::discover(const core::CancelToken& cancel) {
    return discover(config_.subnets, cancel);
}

expected<DiscoveryResult>
DiscoveryEngine::discover(const std::vector<std::string>& subnets, const core::CancelToken& cancel) {
    Config effective = config_;
    effective.subnets = subnets;
    if (auto valid = effective.validate(); !valid) {
        logError("[Discovery] ", valid.error().describe(), "\n");
        return unexpected(valid.error());
    }

    DiscoveryResult result;
    Aggregator found;

    for (const auto& subnet : subnets) {
        if (cancel.cancelled()) {
            result.partial = true;
            break;
        }

        auto addresses = candidateAddresses(subnet, config_.hostRangeFirst, config_.hostRangeLast);
        if (!addresses) {
            return unexpected(addresses.error());
        }
        const std::string prefix = *normaliseSubnetPrefix(subnet);

        const auto started = Clock::now();
        const std::size_t before = found.size();

        if (config_.broadcastProbe) {
            broadcastProbe(prefix, found);
        }
        scanSubnet(*addresses, found, cancel);

        const auto elapsed = std::chrono::duration_cast<milliseconds>(Clock::now() - started);
        const std::size_t added = found.size() - before;
        logInfo("[Discovery] subnet ", prefix, "x: ", added, " device(s) in ", elapsed.count(), "ms\n");
        result.subnetsScanned.push_back(prefix);

        if (cancel.cancelled()) {
            result.partial = true;
            break;
        }
        if (config_.stopAtFirstPopulatedSubnet && added > 0) {
            break;
        }
    }

    result.devices = found.take();
    result.probesSent = found.probes();
    if (result.partial) {
        logInfo("[Discovery] cancelled; returning ", result.devices.size(), " device(s) found so far\n");
    }
    return result;
}

void DiscoveryEngine::scanSubnet(const std::vector<std::string>& addresses,
                                 Aggregator& found,
                                 const core::CancelToken& cancel) {
    if (addresses.empty()) {
        return;
    }

    const auto deadline = Clock::now() + config_.discoveryTimeout;
    const std::size_t workerCount = std::min(config_.discoveryConcurrency, addresses.size());
    std::atomic<std::size_t> nextIndex{0};

    auto worker = [&]() {
        DatagramChannel channel(config_.datagramPort);
        if (auto opened = channel.open(); !opened) {
            logWarning("[Discovery] worker could not open a socket: ", opened.error().describe(), "\n");
            return;
        }

        while (!cancel.cancelled() && remainingUntil(deadline).count() > 0) {
            const std::size_t index = nextIndex.fetch_add(1, std::memory_order_relaxed);
            if (index >= addresses.size()) {
                break;
            }
            const auto& target = addresses[index];

            if (auto sent = channel.sendTo(target, PROBE_COMMAND); !sent) {
                logDebug("[Discovery] probe to ", target, " not sent: ", sent.error().describe(), "\n");
                continue;
            }
            found.countProbe();

            const auto probeDeadline = std::min(Clock::now() + config_.probeTimeout, deadline);
            while (!cancel.cancelled()) {
                const auto left = remainingUntil(probeDeadline);
                if (left.count() <= 0) {
                    break;
                }
                auto reply = channel.receive(left);
                if (!reply) {
                    logDebug("[Discovery] ", target, ": ", reply.error().describe(), "\n");
                    break;
                }
                found.accept(*reply);
                if (reply->sourceAddress == target) {
                    break;
                }
            }
        }
        channel.close();
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }
}

void DiscoveryEngine::broadcastProbe(const std::string& prefix, Aggregator& found) {
    DatagramChannel channel(config_.datagramPort);
    if (auto enabled = channel.enableBroadcast(); !enabled) {
        logWarning("[Discovery] broadcast unavailable: ", enabled.error().describe(), "\n");
        return;
    }
    if (auto sent = channel.sendTo(prefix + "255", PROBE_COMMAND); !sent) {
        logDebug("[Discovery] broadcast to ", prefix, "255 not sent: ", sent.error().describe(), "\n");
        return;
    }
    found.countProbe();

    const auto deadline = Clock::now() + std::min(config_.probeTimeout, config_.discoveryTimeout);
    while (true) {
        const auto left = remainingUntil(deadline);
        if (left.count() <= 0) {
            break;
        }
        auto reply = channel.receive(left);
        if (!reply) {
            break;
        }
        found.accept(*reply);
    }
}

} // namespace lumina::luminaire
