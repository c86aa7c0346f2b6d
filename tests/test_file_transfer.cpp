#include "lumina/luminaire/FileTransfer.hpp"
#include "lumina/luminaire/SessionManager.hpp"
#include "TestSupport.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>

using namespace lumina::luminaire;
using lumina::Errc;
using lumina::test::FakeLuminaire;
using lumina::test::Reply;
using namespace std::chrono_literals;

namespace {

std::vector<std::uint8_t> pattern(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 7 + 3) & 0xFF);
    }
    return data;
}

std::string writeLocal(const std::string& path, std::size_t size) {
    const auto data = pattern(size);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
}

std::vector<std::uint8_t> readLocal(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

Config transferConfig(unsigned short port) {
    Config config;
    config.commandPort = port;
    config.connectTimeout = 1000ms;
    config.commandTimeout = 1000ms;
    config.retryBackoff = 10ms;
    return config;
}

/**
 * Storage side of a full-featured luminaire: acknowledges WRITE blocks,
 * keeps the XOR of the accepted block checksums and reports it for LRC.
 * `rejectBlock`/`rejections` make the device answer 42 for that block.
 */
struct UploadTarget {
    std::mutex mutex;
    std::uint32_t lrc = 0;
    std::size_t accepted = 0;
    long rejectBlock = -1;
    int rejections = 0;

    Reply handle(const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex);
        if (command.compare(0, 6, "WRITE ") == 0) {
            const auto colon = command.find(':');
            if (colon == std::string::npos) {
                ++accepted;
                return Reply::frame("", 0);
            }
            if (static_cast<long>(accepted) == rejectBlock && rejections != 0) {
                if (rejections > 0) --rejections;
                return Reply::frame("", 42);
            }
            lrc ^= static_cast<std::uint32_t>(std::stoul(command.substr(6, colon - 6), nullptr, 16));
            ++accepted;
            return Reply::frame("", 0);
        }
        if (command.compare(0, 4, "LRC ") == 0) {
            return Reply::frame(command.substr(4) + "\r\nLRC: " + formatChecksum(lrc), 0);
        }
        if (auto identity = lumina::test::octaIdentity(command)) return *identity;
        return Reply::frame("", 0);
    }
};

} // namespace

static void testUploadBlockCounts() {
    for (std::size_t size : {std::size_t{1024}, std::size_t{1100}}) {
        UploadTarget target;
        FakeLuminaire fake([&](const std::string& command, int) { return target.handle(command); });
        SessionManager manager(transferConfig(fake.port()));
        auto session = manager.connect("127.0.0.1");
        ASSERT_TRUE(session.has_value(), "connect");
        if (!session) return;

        const std::string local = writeLocal("lumina_upload.bin", size);
        FileTransferEngine engine(transferConfig(fake.port()));
        auto report = engine.upload(**session, local, "show.lsc");
        ASSERT_TRUE(report.has_value(), "upload succeeds");
        if (!report) continue;

        const std::size_t blocks = (size + 511) / 512;
        ASSERT_EQ(report->blocksSent, blocks, "block count");
        ASSERT_EQ(fake.countCommands("WRITE "), blocks, "one WRITE per block");
        ASSERT_EQ(report->bytes, size, "bytes");
        ASSERT_EQ(report->retransmissions, std::size_t{0}, "no retransmissions");
        ASSERT_TRUE(report->verified, "verified against LRC");

        auto localSum = engine.computeChecksum(local);
        ASSERT_TRUE(localSum && *localSum == report->checksum, "report checksum matches local file");

        const auto commands = fake.commands();
        ASSERT_STR_EQ(commands[5], "CREATE show.lsc", "CREATE follows identity");
        const std::string expectedClose = size == 1024 ? "CLOSEPAUSED,00000400" : "CLOSEPAUSED,0000044c";
        ASSERT_EQ(fake.countCommands(expectedClose), std::size_t{1}, "close carries the real length");

        const std::string firstWrite = commands[6];
        ASSERT_EQ(firstWrite.size(), std::size_t{6 + 8 + 1 + 1024}, "checksum and a full padded block");
        std::remove(local.c_str());
    }
}

static void testUploadWithoutIdle() {
    UploadTarget target;
    FakeLuminaire fake([&](const std::string& command, int) { return target.handle(command); });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    const std::string local = writeLocal("lumina_upload_play.bin", 1100);
    FileTransferEngine engine(transferConfig(fake.port()));
    TransferOptions options;
    options.idleAfterLoad = false;
    options.verify = false;
    auto report = engine.upload(**session, local, "show.lsc", options);
    ASSERT_TRUE(report.has_value(), "upload succeeds");
    ASSERT_EQ(fake.countCommands("CLOSE,0000044c"), std::size_t{1}, "plain CLOSE");
    ASSERT_EQ(fake.countCommands("LRC"), std::size_t{0}, "no verification requested");
    std::remove(local.c_str());
}

static void testSingleRetransmission() {
    UploadTarget target;
    target.rejectBlock = 1;
    target.rejections = 1;
    FakeLuminaire fake([&](const std::string& command, int) { return target.handle(command); });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    const std::string local = writeLocal("lumina_upload_retry.bin", 1100);
    FileTransferEngine engine(transferConfig(fake.port()));
    auto report = engine.upload(**session, local, "show.lsc");
    ASSERT_TRUE(report.has_value(), "upload recovers");
    if (report) {
        ASSERT_EQ(report->retransmissions, std::size_t{1}, "one retransmission");
        ASSERT_EQ(report->blocksSent, std::size_t{3}, "three blocks");
        ASSERT_TRUE(report->verified, "file verified");
    }
    ASSERT_EQ(fake.countCommands("WRITE "), std::size_t{4}, "block 2 sent twice");
    std::remove(local.c_str());
}

static void testRetryBudgetExhausted() {
    UploadTarget target;
    target.rejectBlock = 0;
    target.rejections = -1; // forever
    FakeLuminaire fake([&](const std::string& command, int) { return target.handle(command); });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    Config config = transferConfig(fake.port());
    config.maxBlockRetries = 2;
    const std::string local = writeLocal("lumina_upload_budget.bin", 1100);
    FileTransferEngine engine(config);
    auto report = engine.upload(**session, local, "show.lsc");
    ASSERT_TRUE(!report && report.error().is(Errc::FileTransferError), "job fails");
    if (!report) {
        ASSERT_EQ(report.error().status, 42, "last device status kept");
    }
    ASSERT_EQ(fake.countCommands("WRITE "), std::size_t{3}, "first attempt plus two retries");
    ASSERT_EQ(fake.countCommands("CLOSE"), std::size_t{0}, "never closed");
    ASSERT_TRUE((*session)->isAlive(), "session stays usable");
    std::remove(local.c_str());
}

static void testLegacyUploadHasNoChecksums() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (auto identity = lumina::test::replicatorIdentity(command)) return *identity;
        return Reply::frame("", 0);
    });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    const std::string local = writeLocal("lumina_upload_legacy.bin", 1100);
    FileTransferEngine engine(transferConfig(fake.port()));
    auto report = engine.upload(**session, local, "PAT1");
    ASSERT_TRUE(report.has_value(), "legacy upload");
    if (report) {
        ASSERT_TRUE(!report->verified, "legacy files are not verified");
    }

    std::size_t writes = 0;
    for (const auto& command : fake.commands()) {
        if (command.compare(0, 6, "WRITE ") == 0) {
            ++writes;
            ASSERT_TRUE(command.find(':') == std::string::npos, "no checksum prefix");
            ASSERT_EQ(command.size(), std::size_t{6 + 1024}, "raw hex block");
        }
    }
    ASSERT_EQ(writes, std::size_t{3}, "three blocks");
    ASSERT_EQ(fake.countCommands("CLOSE,0000044c"), std::size_t{1}, "legacy never idles after load");
    ASSERT_EQ(fake.countCommands("LRC"), std::size_t{0}, "no LRC on legacy");
    std::remove(local.c_str());
}

static void testCancelledUpload() {
    UploadTarget target;
    FakeLuminaire fake([&](const std::string& command, int) { return target.handle(command); });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    const std::string local = writeLocal("lumina_upload_cancel.bin", 2048);
    FileTransferEngine engine(transferConfig(fake.port()));
    TransferOptions options;
    options.cancel = lumina::core::CancelToken();
    std::size_t progressCalls = 0;
    options.progress = [&](std::size_t done, std::size_t) {
        ++progressCalls;
        if (done == 1) options.cancel.cancel();
    };
    auto report = engine.upload(**session, local, "show.lsc", options);
    ASSERT_TRUE(!report && report.error().is(Errc::Cancelled), "cancelled between blocks");
    ASSERT_EQ(fake.countCommands("WRITE "), std::size_t{1}, "stopped after the first block");
    ASSERT_EQ(progressCalls, std::size_t{1}, "one progress report");
    std::remove(local.c_str());
}

static void testEmptyOrMissingLocalFile() {
    FileTransferEngine engine;
    FakeLuminaire fake([](const std::string& command, int) {
        if (auto identity = lumina::test::octaIdentity(command)) return *identity;
        return Reply::frame("", 0);
    });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    auto missing = engine.upload(**session, "no/such/file.bin", "x.lsc");
    ASSERT_TRUE(!missing && missing.error().is(Errc::FileTransferError), "missing local file");

    const std::string empty = writeLocal("lumina_empty.bin", 0);
    auto none = engine.upload(**session, empty, "x.lsc");
    ASSERT_TRUE(!none && none.error().is(Errc::FileTransferError), "empty local file");
    ASSERT_EQ(fake.countCommands("CREATE"), std::size_t{0}, "nothing created remotely");
    std::remove(empty.c_str());
}

static void testDownloadRetriesCorruptBlock() {
    const auto content = pattern(1100);
    std::mutex mutex;
    bool corrupted = false;

    FakeLuminaire fake([&](const std::string& command, int) {
        if (command == "OPEN show.lsc") return Reply::frame("", 0);
        if (command.compare(0, 7, "READAT ") == 0) {
            const std::size_t offset = std::stoul(command.substr(7));
            if (offset >= content.size()) return Reply::frame("", 1);
            const std::size_t length = std::min<std::size_t>(512, content.size() - offset);
            const std::uint8_t* block = content.data() + offset;
            const std::uint32_t sum = Xor32Checksum().compute(block, length);
            std::string hex = FileTransferEngine::toHex(block, length);
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (offset == 512 && !corrupted) {
                    corrupted = true;
                    hex[0] = hex[0] == '0' ? '1' : '0';
                }
            }
            return Reply::frame(hex + " =" + std::to_string(offset / 512) + ":" + formatChecksum(sum), 0);
        }
        if (auto identity = lumina::test::octaIdentity(command)) return *identity;
        return Reply::frame("", 0);
    });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    const std::string local = "lumina_download.bin";
    FileTransferEngine engine(transferConfig(fake.port()));
    auto report = engine.download(**session, "show.lsc", local);
    ASSERT_TRUE(report.has_value(), "download succeeds");
    if (report) {
        ASSERT_EQ(report->retransmissions, std::size_t{1}, "corrupt block re-read once");
        ASSERT_EQ(report->bytes, std::size_t{1100}, "all bytes");
    }
    ASSERT_EQ(fake.countCommands("READAT 512"), std::size_t{2}, "second block read twice");
    ASSERT_TRUE(readLocal(local) == content, "content intact");
    ASSERT_TRUE(!std::filesystem::exists(local + ".part"), "part file renamed");
    std::remove(local.c_str());
}

static void testDownloadMissingRemoteFile() {
    FakeLuminaire fake([](const std::string& command, int) {
        if (command.compare(0, 5, "OPEN ") == 0) return Reply::frame("", 9);
        if (auto identity = lumina::test::octaIdentity(command)) return *identity;
        return Reply::frame("", 0);
    });
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    const std::string local = "lumina_download_missing.bin";
    FileTransferEngine engine(transferConfig(fake.port()));
    auto report = engine.download(**session, "gone.lsc", local);
    ASSERT_TRUE(!report && report.error().is(Errc::FileTransferError), "download fails");
    if (!report) {
        ASSERT_EQ(report.error().status, 9, "file not found status");
    }
    ASSERT_TRUE(!std::filesystem::exists(local), "no output");
    ASSERT_TRUE(!std::filesystem::exists(local + ".part"), "part file removed");
}

/// Legacy READ replies in order; the last entry repeats.
static lumina::test::CommandHandler legacyReader(std::vector<Reply> reads) {
    auto index = std::make_shared<std::size_t>(0);
    auto replies = std::make_shared<std::vector<Reply>>(std::move(reads));
    return [index, replies](const std::string& command, int) {
        if (command.compare(0, 5, "OPEN ") == 0) return Reply::frame("", 0);
        if (command == "READ") {
            const std::size_t at = std::min(*index, replies->size() - 1);
            ++*index;
            return (*replies)[at];
        }
        if (auto identity = lumina::test::replicatorIdentity(command)) return *identity;
        return Reply::frame("", 0);
    };
}

static void testLegacyDownload() {
    FakeLuminaire fake(legacyReader({
        Reply::frame("00000000: 41 42 43 44\r\n00000004: 45 46", 0),
        Reply::frame("", 1),
    }));
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;
    ASSERT_TRUE((*session)->capability() == Capability::Legacy, "legacy device");

    const std::string local = "lumina_legacy_download.bin";
    FileTransferEngine engine(transferConfig(fake.port()));
    auto report = engine.download(**session, "show.lr", local);
    ASSERT_TRUE(report.has_value(), "legacy download succeeds");
    if (report) {
        ASSERT_EQ(report->bytes, std::size_t{6}, "both dump lines decoded");
    }
    const auto data = readLocal(local);
    ASSERT_STR_EQ(std::string(data.begin(), data.end()), "ABCDEF", "dump content");
    ASSERT_EQ(fake.countCommands("READ"), std::size_t{2}, "stopped at end of file");
    ASSERT_TRUE(!std::filesystem::exists(local + ".part"), "part file renamed");
    std::remove(local.c_str());
}

static void testLegacyDownloadFailsMidStream() {
    FakeLuminaire fake(legacyReader({
        Reply::frame("00000000: 41 42", 0),
        Reply::frame("", 11),
    }));
    SessionManager manager(transferConfig(fake.port()));
    auto session = manager.connect("127.0.0.1");
    ASSERT_TRUE(session.has_value(), "connect");
    if (!session) return;

    const std::string local = "lumina_legacy_failed.bin";
    FileTransferEngine engine(transferConfig(fake.port()));
    auto report = engine.download(**session, "show.lr", local);
    ASSERT_TRUE(!report && report.error().is(Errc::FileTransferError), "no-response is not end of file");
    if (!report) {
        ASSERT_EQ(report.error().status, 11, "device status kept");
    }
    ASSERT_TRUE(!std::filesystem::exists(local), "no output");
    ASSERT_TRUE(!std::filesystem::exists(local + ".part"), "part file removed");
}

static void testHexHelpers() {
    const std::uint8_t bytes[3] = {0x00, 0xAB, 0x7F};
    ASSERT_STR_EQ(FileTransferEngine::toHex(bytes, 3), "00AB7F", "upper-case hex");
    auto back = FileTransferEngine::fromHex("00ab7F");
    ASSERT_TRUE(back && back->size() == 3 && (*back)[1] == 0xAB, "mixed case decodes");
    ASSERT_TRUE(!FileTransferEngine::fromHex("ABC"), "odd length rejected");
    ASSERT_TRUE(!FileTransferEngine::fromHex("ZZ"), "non-hex rejected");

    FileTransferEngine engine;
    const auto job = engine.plan(Capability::Legacy, "a", "b", 1100, TransferOptions{});
    ASSERT_EQ(job.totalBlocks, std::size_t{3}, "planned blocks");
    ASSERT_TRUE(!job.checksumMode && !job.idleAfterLoad, "legacy plan");
}

int main() {
    testUploadBlockCounts();
    testUploadWithoutIdle();
    testSingleRetransmission();
    testRetryBudgetExhausted();
    testLegacyUploadHasNoChecksums();
    testCancelledUpload();
    testEmptyOrMissingLocalFile();
    testDownloadRetriesCorruptBlock();
    testDownloadMissingRemoteFile();
    testLegacyDownload();
    testLegacyDownloadFailsMidStream();
    testHexHelpers();
    return lumina::test::finish("File transfer tests");
}
