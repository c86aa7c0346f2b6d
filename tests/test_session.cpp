#include "lumina/log/Log.hpp"
#include "lumina/luminaire/LuminaireControl.hpp"
#include "lumina/luminaire/SessionManager.hpp"
#include "TestSupport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace lumina::luminaire;
using lumina::Errc;
using lumina::test::FakeLuminaire;
using lumina::test::Reply;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

static Config sessionConfig(unsigned short port) {
    Config config;
    config.commandPort = port;
    config.connectTimeout = 1000ms;
    config.commandTimeout = 500ms;
    config.retryBackoff = 20ms;
    config.maxRetries = 2;
    return config;
}

static Reply octa(const std::string& command) {
    if (auto identity = lumina::test::octaIdentity(command)) return *identity;
    return Reply::frame("", 0);
}

static void testConnectReadsIdentity() {
    FakeLuminaire fake([](const std::string& command, int) { return octa(command); });
    SessionManager manager(sessionConfig(fake.port()));

    Device device = Device::discovered("127.0.0.1", "LUM-0001");
    auto session = manager.connect(device);
    ASSERT_TRUE(session.has_value(), "connect succeeds");
    if (!session) return;

    ASSERT_TRUE(device.state() == ConnectionState::Connected, "device connected");
    ASSERT_TRUE(device.model() == LuminaireModel::Octa, "model from ID");
    ASSERT_STR_EQ(device.luminaireSerial(), "OCTA-1234", "luminaire serial");
    ASSERT_STR_EQ(device.macAddress(), "00:11:22:33:44:55", "mac from GETIP");
    ASSERT_STR_EQ(device.firmwareVersion(), "2.4.1", "firmware");
    ASSERT_EQ(device.channelCount(), std::size_t{24}, "full channel layout");
    ASSERT_TRUE(manager.hasLiveSession("127.0.0.1"), "registered");
    ASSERT_TRUE(manager.hasLiveSession("localhost"), "host name finds the resolved address");

    manager.disconnect(**session);
    ASSERT_TRUE(!(*session)->isAlive(), "closed");
    ASSERT_TRUE(!manager.hasLiveSession("127.0.0.1"), "slot released");
    ASSERT_TRUE((*session)->device().state() == ConnectionState::Disconnected, "disconnected state");
    ASSERT_TRUE(device.state() == ConnectionState::Disconnected, "caller's record disconnected too");
}

static void testConnectRefused() {
    SessionManager manager(sessionConfig(lumina::test::closedTcpPort()));
    Device device("127.0.0.1");
    auto session = manager.connect(device);
    ASSERT_TRUE(!session && session.error().is(Errc::ConnectFailed), "refused is ConnectFailed");
    ASSERT_TRUE(device.state() == ConnectionState::Error, "device in error");
    ASSERT_TRUE(!manager.hasLiveSession("127.0.0.1"), "nothing registered");
}

static void testConnectToSilentEndpointTimesOut() {
    lumina::test::BlackholeListener blackhole;
    Config config = sessionConfig(blackhole.port());
    config.connectTimeout = 300ms;
    SessionManager manager(config);

    Device device("127.0.0.1");
    const auto started = Clock::now();
    auto session = manager.connect(device);
    const auto elapsed = Clock::now() - started;
    ASSERT_TRUE(!session && session.error().is(Errc::ConnectFailed), "unanswered connect is ConnectFailed");
    ASSERT_TRUE(elapsed < 1500ms, "bounded by the connect deadline");
    ASSERT_TRUE(device.state() == ConnectionState::Error, "device in error");
    ASSERT_TRUE(!manager.hasLiveSession("127.0.0.1"), "nothing registered");
}

static void testAcceptThenDropIsAlreadyConnected() {
    FakeLuminaire fake([](const std::string&, int) { return Reply::drop(); });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(!session && session.error().is(Errc::AlreadyConnected), "dropped stream means busy");
}

static void testBusyBannerIsAlreadyConnected() {
    FakeLuminaire fake([](const std::string&, int) {
        return Reply::frame("Connection refused: session in use", 0);
    });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(!session && session.error().is(Errc::AlreadyConnected), "busy banner");
}

static void testDuplicateSessionInSameManager() {
    FakeLuminaire fake([](const std::string& command, int) { return octa(command); });
    SessionManager manager(sessionConfig(fake.port()));

    auto first = manager.connect("127.0.0.1");
    ASSERT_TRUE(first.has_value(), "first session");
    auto second = manager.connect("127.0.0.1");
    ASSERT_TRUE(!second && second.error().is(Errc::AlreadyConnected), "second session rejected");
    ASSERT_EQ(fake.connectionsAccepted(), 1, "no second socket opened");

    if (first) {
        (*first)->close();
    }
    ASSERT_TRUE(!manager.hasLiveSession("127.0.0.1"), "close releases the slot");
}

static void testIdentityMismatch() {
    FakeLuminaire fake([](const std::string& command, int) { return octa(command); });
    SessionManager manager(sessionConfig(fake.port()));

    Device device = Device::discovered("127.0.0.1", "SOMEONE-ELSE");
    auto session = manager.connect(device);
    ASSERT_TRUE(!session && session.error().is(Errc::ConnectFailed), "identity mismatch fails connect");
    ASSERT_STR_EQ(device.electronicSerial(), "SOMEONE-ELSE", "record untouched");
    ASSERT_TRUE(!manager.hasLiveSession("127.0.0.1"), "slot released");
}

static void testConcurrentCallersAreSerialised() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (command.compare(0, 5, "ECHO ") == 0) {
            std::this_thread::sleep_for(1ms);
            return Reply::frame(command.substr(5), 0);
        }
        return octa(command);
    });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    std::atomic<int> mismatches{0};
    std::atomic<int> errors{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&, t] {
            for (int i = 0; i < 20; ++i) {
                const std::string tag = "t" + std::to_string(t) + "-" + std::to_string(i);
                auto reply = (*session)->execute("ECHO " + tag);
                if (!reply) {
                    ++errors;
                } else if (reply->payload != tag) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& c : callers) c.join();

    ASSERT_EQ(errors.load(), 0, "no errors");
    ASSERT_EQ(mismatches.load(), 0, "every caller got its own reply");
}

static void testIdempotentQueryIsRetried() {
    FakeLuminaire fake([](const std::string& command, int connection) {
        if (command == "TEMPC") {
            if (connection == 0) return Reply::drop();
            return Reply::frame("Temp(C): 38.25", 0);
        }
        return octa(command);
    });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    auto temperature = control::getTemperature(**session);
    ASSERT_TRUE(temperature.has_value(), "retried on a fresh connection");
    if (temperature) {
        ASSERT_TRUE(*temperature == 38.25, "temperature decoded");
    }
    ASSERT_EQ(fake.connectionsAccepted(), 2, "reconnected once");
    ASSERT_TRUE((*session)->isAlive(), "session survives");
}

static void testActionIsNotRetried() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (command == "PLAY show.lsc") return Reply::drop();
        return octa(command);
    });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    auto played = control::play(**session, "show.lsc");
    ASSERT_TRUE(!played && played.error().is(Errc::ConnectionLost), "lost connection surfaces");
    ASSERT_EQ(fake.countCommands("PLAY"), std::size_t{1}, "sent exactly once");
    ASSERT_TRUE(!(*session)->isAlive(), "session is dead");
    ASSERT_TRUE((*session)->device().state() == ConnectionState::Error, "device in error");
}

static void testPowerOffThenFastFailure() {
    std::atomic<bool> poweredOff{false};
    FakeLuminaire fake([&](const std::string& command, int) {
        if (poweredOff.load()) return Reply::silent();
        return octa(command);
    });
    Config config = sessionConfig(fake.port());
    config.commandTimeout = 200ms;
    config.maxRetries = 1;
    SessionManager manager(config);
    Device device("127.0.0.1");
    auto session = manager.connect(device);
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;
    ASSERT_TRUE(device.state() == ConnectionState::Connected, "connected");

    poweredOff.store(true);
    auto version = control::getVersion(**session);
    ASSERT_TRUE(!version && version.error().is(Errc::ResponseTimeout), "timeout while powered off");

    const auto started = Clock::now();
    auto again = control::getVersion(**session);
    const auto elapsed = Clock::now() - started;
    ASSERT_TRUE(!again && again.error().is(Errc::NotConnected), "dead session fails fast");
    ASSERT_TRUE(elapsed < 50ms, "no network wait");
    ASSERT_TRUE(!manager.hasLiveSession("127.0.0.1"), "dead session leaves the registry");
    ASSERT_TRUE(device.state() == ConnectionState::Error, "caller's record in error");
}

static void testNonZeroStatusIsCommandFailed() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (command == "DELETE missing.lsc") return Reply::frame("", 9);
        return octa(command);
    });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    auto deleted = control::deleteFile(**session, "missing.lsc");
    ASSERT_TRUE(!deleted && deleted.error().is(Errc::CommandFailed), "status 9 fails");
    if (!deleted) {
        ASSERT_EQ(deleted.error().status, 9, "status carried");
    }
    ASSERT_TRUE((*session)->isAlive(), "a failed command keeps the session");
    ASSERT_EQ((*session)->lastStatus(), 9, "last status recorded");
}

static void testLegacyUnsupported() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (auto identity = lumina::test::replicatorIdentity(command)) return *identity;
        return Reply::frame("", 0);
    });
    SessionManager manager(sessionConfig(fake.port()));
    Device device("127.0.0.1");
    auto session = manager.connect(device);
    ASSERT_TRUE(session.has_value(), "legacy connect");
    if (!session) return;

    ASSERT_TRUE(device.capability() == Capability::Legacy, "legacy class");
    ASSERT_STR_EQ(device.luminaireSerial(), "LR-0042", "serial copied from NS");
    ASSERT_EQ(device.channelCount(), std::size_t{32}, "legacy channels");

    const auto before = fake.commands().size();
    auto temperature = control::getTemperature(**session);
    ASSERT_TRUE(!temperature && temperature.error().is(Errc::Unsupported), "no temperature");
    ASSERT_EQ(fake.commands().size(), before, "nothing sent");

    ASSERT_TRUE(control::goDark(**session).has_value(), "legacy dark");
    ASSERT_STR_EQ(fake.commands().back(), "B", "B blanks a legacy device");
}

static void testLegacyStopLogsStatus() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (command == "Q8") return Reply::frame("", 5);
        if (auto identity = lumina::test::replicatorIdentity(command)) return *identity;
        return Reply::frame("", 0);
    });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "legacy connect");
    if (!session) return;

    std::mutex mutex;
    std::vector<std::string> warnings;
    lumina::setErrorLogHandler([&](std::string_view text) {
        std::lock_guard<std::mutex> lock(mutex);
        warnings.emplace_back(text);
    });
    auto stopped = control::stop(**session);
    lumina::resetLogHandlers();

    ASSERT_TRUE(stopped.has_value(), "stop still blanks the output");
    ASSERT_STR_EQ(fake.commands().back(), "B", "went dark after Q8");
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_TRUE(std::any_of(warnings.begin(), warnings.end(), [](const std::string& w) {
                    return w.find("Q8 returned status 5") != std::string::npos;
                }), "Q8 status reported");
}

static void testDriveLevelHelpers() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (command == "PS?") return Reply::frame("0000,FFFF,8000", 0);
        return octa(command);
    });
    SessionManager manager(sessionConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    auto raw = control::getDriveLevelsRaw(**session);
    ASSERT_TRUE(raw && raw->size() == 3 && (*raw)[2] == 0x8000, "raw readback");

    ASSERT_TRUE(control::setDriveLevel(**session, 5, 1.0).has_value(), "set one");
    ASSERT_STR_EQ(fake.commands().back(), "P05FFFF", "single channel command");

    auto outOfRange = control::setDriveLevel(**session, 24, 1.0);
    ASSERT_TRUE(!outOfRange && outOfRange.error().is(Errc::InvalidConfig), "channel range checked");

    ASSERT_TRUE(control::setNamedLevels(**session, {1.0}).has_value(), "named levels");
    const std::string sent = fake.commands().back();
    ASSERT_EQ(sent.size(), std::size_t{2 + 24 * 4}, "expanded to the full layout");
    ASSERT_STR_EQ(sent.substr(2 + 4 * 4, 4), "FFFF", "RB1 placed at index 4");
}

static void testRemoteDisconnectPoke() {
    FakeLuminaire disconnectPort([](const std::string&, int) { return Reply::silent(); });
    Config config = sessionConfig(lumina::test::closedTcpPort());
    config.disconnectPort = disconnectPort.port();
    SessionManager manager(config);

    auto poked = manager.requestRemoteDisconnect("127.0.0.1");
    ASSERT_TRUE(poked.has_value(), "poke delivered");
    ASSERT_TRUE(lumina::test::waitFor([&]{ return disconnectPort.connectionsAccepted() == 1; }, 1000ms),
                "disconnect port saw a connection");
}

int main() {
    testConnectReadsIdentity();
    testConnectRefused();
    testConnectToSilentEndpointTimesOut();
    testAcceptThenDropIsAlreadyConnected();
    testBusyBannerIsAlreadyConnected();
    testDuplicateSessionInSameManager();
    testIdentityMismatch();
    testConcurrentCallersAreSerialised();
    testIdempotentQueryIsRetried();
    testActionIsNotRetried();
    testPowerOffThenFastFailure();
    testNonZeroStatusIsCommandFailed();
    testLegacyUnsupported();
    testLegacyStopLogsStatus();
    testDriveLevelHelpers();
    testRemoteDisconnectPoke();
    return lumina::test::finish("Session tests");
}
