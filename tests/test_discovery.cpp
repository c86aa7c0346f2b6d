#include "lumina/luminaire/Discovery.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <thread>

using namespace lumina::luminaire;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

static Config loopbackConfig(unsigned short datagramPort) {
    Config config;
    config.subnets = {"127.0.0."};
    config.hostRangeFirst = 1;
    config.hostRangeLast = 1;
    config.datagramPort = datagramPort;
    config.probeTimeout = 300ms;
    config.discoveryTimeout = 2000ms;
    config.discoveryConcurrency = 4;
    return config;
}

static void testFindsResponder() {
    lumina::test::FakeDatagramResponder responder("LUM-0001");
    DiscoveryEngine engine(loopbackConfig(responder.port()));

    auto result = engine.discover();
    ASSERT_TRUE(result.has_value(), "discover succeeds");
    if (!result) return;
    ASSERT_EQ(result->devices.size(), std::size_t{1}, "one device");
    if (!result->devices.empty()) {
        ASSERT_STR_EQ(result->devices[0].address(), "127.0.0.1", "address from the reply source");
        ASSERT_STR_EQ(result->devices[0].electronicSerial(), "LUM-0001", "serial from the payload");
    }
    ASSERT_TRUE(!result->partial, "complete scan");
    ASSERT_EQ(result->probesSent, std::size_t{1}, "one probe");
}

static void testDuplicateRepliesCollapse() {
    lumina::test::FakeDatagramResponder responder("LUM-0002", 3);
    Config config = loopbackConfig(responder.port());
    // The same subnet twice: the address is probed twice and answers six times.
    config.subnets = {"127.0.0.", "127.0.0"};
    DiscoveryEngine engine(config);

    auto result = engine.discover();
    ASSERT_TRUE(result.has_value(), "discover succeeds");
    if (!result) return;
    ASSERT_EQ(result->devices.size(), std::size_t{1}, "unique by address");
    ASSERT_EQ(result->subnetsScanned.size(), std::size_t{2}, "both prefixes scanned");
}

static void testStopAtFirstPopulatedSubnet() {
    lumina::test::FakeDatagramResponder responder("LUM-0003");
    Config config = loopbackConfig(responder.port());
    config.subnets = {"127.0.0.", "127.0.1."};
    config.stopAtFirstPopulatedSubnet = true;
    DiscoveryEngine engine(config);

    auto result = engine.discover();
    ASSERT_TRUE(result.has_value(), "discover succeeds");
    if (!result) return;
    ASSERT_EQ(result->subnetsScanned.size(), std::size_t{1}, "stopped after the first subnet");
}

static void testSilentSubnetIsBounded() {
    // Nothing listens on this port; 20 hosts x 300ms would take 1.5s with four workers.
    Config config = loopbackConfig(lumina::test::closedTcpPort());
    config.hostRangeLast = 20;
    config.discoveryTimeout = 400ms;

    DiscoveryEngine engine(config);
    const auto started = Clock::now();
    auto result = engine.discover();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

    ASSERT_TRUE(result.has_value(), "silence is not an error");
    if (result) {
        ASSERT_TRUE(result->devices.empty(), "no devices");
        ASSERT_TRUE(!result->partial, "not partial");
    }
    ASSERT_TRUE(elapsed < 1000ms, "subnet budget respected");
}

static void testCancelReturnsPartial() {
    Config config = loopbackConfig(lumina::test::closedTcpPort());
    config.hostRangeLast = 40;
    config.discoveryConcurrency = 2;
    config.discoveryTimeout = 10000ms;

    DiscoveryEngine engine(config);
    lumina::core::CancelToken cancel;
    std::thread canceller([cancel]{
        std::this_thread::sleep_for(200ms);
        cancel.cancel();
    });

    const auto started = Clock::now();
    auto result = engine.discover(cancel);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    canceller.join();

    ASSERT_TRUE(result.has_value(), "cancelled discovery still returns");
    if (result) {
        ASSERT_TRUE(result->partial, "marked partial");
    }
    ASSERT_TRUE(elapsed < 2000ms, "cancel takes effect at the next probe");
}

static void testInvalidConfig() {
    Config config = loopbackConfig(57000);
    config.subnets = {"not.a.subnet"};
    DiscoveryEngine engine(config);
    auto result = engine.discover();
    ASSERT_TRUE(!result && result.error().is(lumina::Errc::InvalidConfig), "bad prefix rejected");

    auto addresses = DiscoveryEngine::candidateAddresses("10.1.2", 2, 4);
    ASSERT_TRUE(addresses && addresses->size() == 3, "three candidates");
    if (addresses && addresses->size() == 3) {
        ASSERT_STR_EQ(addresses->front(), "10.1.2.2", "ascending from first");
        ASSERT_STR_EQ(addresses->back(), "10.1.2.4", "last inclusive");
    }

    ASSERT_TRUE(DiscoveryEngine::isWellFormedSerial("LUM-0001_a.b"), "serial characters");
    ASSERT_TRUE(!DiscoveryEngine::isWellFormedSerial("bad serial"), "no spaces");
    ASSERT_TRUE(!DiscoveryEngine::isWellFormedSerial(""), "non-empty");
}

int main() {
    testFindsResponder();
    testDuplicateRepliesCollapse();
    testStopAtFirstPopulatedSubnet();
    testSilentSubnetIsBounded();
    testCancelReturnsPartial();
    testInvalidConfig();
    return lumina::test::finish("Discovery tests");
}
