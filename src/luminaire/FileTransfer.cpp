#include "lumina/luminaire/FileTransfer.hpp"

#include "lumina/log/Log.hpp"
#include "lumina/luminaire/LuminaireControl.hpp"
#include "lumina/luminaire/Response.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <optional>
#include <sstream>

namespace lumina::luminaire {

namespace fs = std::filesystem;

namespace {

tl::unexpected<Error> transferFailure(const std::string& context, const Error& cause) {
    if (cause.is(Errc::Cancelled)) {
        return unexpected(cause);
    }
    return fail(Errc::FileTransferError, context + ": " + cause.describe(), cause.status);
}

tl::unexpected<Error> rejected(const std::string& context, const Response& response) {
    return fail(Errc::FileTransferError,
                context + ": " + toString(response.code()) +
                (response.payload.empty() ? std::string{} : " (" + response.payload + ")"),
                response.status);
}

bool isRetryableBlockStatus(int status) {
    return status == wire_status::CHECKSUM_INVALID || status == wire_status::NO_RESPONSE;
}

std::string lengthField(std::size_t length) {
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(8) << length;
    return os.str();
}

} // namespace

FileTransferEngine::FileTransferEngine(Config config, std::shared_ptr<const ChecksumStrategy> checksum)
: config_(std::move(config))
, checksum_(checksum ? std::move(checksum) : defaultChecksum())
{}

std::string FileTransferEngine::toHex(const std::uint8_t* data, std::size_t size) {
    static constexpr char DIGITS[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(DIGITS[data[i] >> 4]);
        out.push_back(DIGITS[data[i] & 0x0F]);
    }
    return out;
}

expected<std::vector<std::uint8_t>> FileTransferEngine::fromHex(const std::string& text) {
    if (text.size() % 2 != 0) {
        return fail(Errc::ProtocolError, "odd-length hex data");
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = nibble(text[i]);
        const int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return fail(Errc::ProtocolError, "invalid hex digit in block data");
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

expected<std::uint32_t> FileTransferEngine::computeChecksum(const std::string& localPath) const {
    return luminaire::computeChecksum(localPath, *checksum_);
}

TransferJob FileTransferEngine::plan(Capability capability, const std::string& localPath,
                                     const std::string& remoteName, std::size_t fileLength,
                                     const TransferOptions& options) const {
    TransferJob job;
    job.localPath = localPath;
    job.remoteName = remoteName;
    job.blockSize = config_.fileBlockSize;
    job.fileLength = fileLength;
    job.totalBlocks = (fileLength + job.blockSize - 1) / job.blockSize;
    job.maxBlockRetries = config_.maxBlockRetries;

    switch (capability) {
        case Capability::FullFeatured:
            job.checksumMode = true;
            job.idleAfterLoad = options.idleAfterLoad;
            break;
        case Capability::Legacy:
            job.checksumMode = false;
            job.idleAfterLoad = false;
            break;
    }
    return job;
}

expected<TransferReport> FileTransferEngine::upload(Session& session,
                                                    const std::string& localPath,
                                                    const std::string& remoteName,
                                                    const TransferOptions& options) {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    std::ifstream in(localPath, std::ios::binary);
    if (!in) {
        return fail(Errc::FileTransferError, "cannot open '" + localPath + "'");
    }
    const std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)),
                                         std::istreambuf_iterator<char>());
    if (in.bad()) {
        return fail(Errc::FileTransferError, "read error on '" + localPath + "'");
    }
    if (data.empty()) {
        return fail(Errc::FileTransferError, "'" + localPath + "' is empty");
    }

    auto exclusive = session.acquire();
    const Capability capability = exclusive.capability();
    const TransferJob job = plan(capability, localPath, remoteName, data.size(), options);

    logInfo("[FileTransfer] upload ", localPath, " -> ", session.address(), ":", remoteName,
            " (", job.fileLength, " bytes, ", job.totalBlocks, " blocks, ",
            job.checksumMode ? "checked" : "unchecked", ")\n");

    auto created = exclusive.exchange(Command::action("CREATE " + remoteName));
    if (!created) {
        return transferFailure("CREATE " + remoteName, created.error());
    }
    if (!created->ok()) {
        return rejected("CREATE " + remoteName, *created);
    }

    TransferReport report;
    report.checksum = checksum_->initial();
    std::vector<std::uint8_t> block(job.blockSize, 0);

    for (std::size_t index = 0; index < job.totalBlocks; ++index) {
        if (options.cancel.cancelled()) {
            return fail(Errc::Cancelled, "upload cancelled after " + std::to_string(index) + " blocks");
        }

        const std::size_t offset = index * job.blockSize;
        const std::size_t length = std::min(job.blockSize, data.size() - offset);
        std::fill(block.begin(), block.end(), std::uint8_t{0});
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), length, block.begin());

        const std::uint32_t blockSum = checksum_->compute(block.data(), block.size());
        report.checksum = checksum_->combine(report.checksum, blockSum);

        std::string command = "WRITE ";
        if (job.checksumMode) {
            command += formatChecksum(blockSum) + ":";
        }
        command += toHex(block.data(), block.size());

        const std::string context = "block " + std::to_string(index + 1) + "/" +
                                    std::to_string(job.totalBlocks);
        int retries = 0;
        while (true) {
            auto ack = exclusive.exchange(Command::action(command));
            if (!ack) {
                return transferFailure(context, ack.error());
            }
            if (!job.checksumMode || ack->ok()) {
                break;
            }
            if (!isRetryableBlockStatus(ack->status)) {
                return rejected(context, *ack);
            }
            if (retries >= job.maxBlockRetries) {
                return fail(Errc::FileTransferError,
                            context + ": retry budget of " + std::to_string(job.maxBlockRetries) +
                            " exhausted (" + toString(ack->code()) + ")",
                            ack->status);
            }
            ++retries;
            ++report.retransmissions;
            logWarning("[FileTransfer] ", context, ": ", toString(ack->code()),
                       ", resending (", retries, "/", job.maxBlockRetries, ")\n");
        }

        ++report.blocksSent;
        report.bytes += length;
        if (options.progress) {
            options.progress(report.blocksSent, job.totalBlocks);
        }
    }

    const std::string closeCommand =
        (job.idleAfterLoad ? "CLOSEPAUSED," : "CLOSE,") + lengthField(job.fileLength);
    auto closed = exclusive.exchange(Command::action(closeCommand));
    if (!closed) {
        return transferFailure("CLOSE", closed.error());
    }
    if (job.checksumMode && !closed->ok()) {
        return rejected("CLOSE", *closed);
    }

    if (job.checksumMode && options.verify) {
        auto lrc = exclusive.execute(Command::query("LRC " + remoteName));
        if (!lrc) {
            return transferFailure("LRC " + remoteName, lrc.error());
        }
        auto remoteSum = control::parseLrc(lrc->payload);
        if (!remoteSum) {
            return transferFailure("LRC " + remoteName, remoteSum.error());
        }
        if (*remoteSum != report.checksum) {
            return fail(Errc::FileTransferError,
                        "verification failed: device LRC " + formatChecksum(*remoteSum) +
                        ", local " + formatChecksum(report.checksum));
        }
        report.verified = true;
    }

    logInfo("[FileTransfer] uploaded ", remoteName, ": ", report.blocksSent, " blocks, ",
            report.retransmissions, " retransmission(s), checksum ", formatChecksum(report.checksum), "\n");
    return report;
}

expected<TransferReport> FileTransferEngine::download(Session& session,
                                                      const std::string& remoteName,
                                                      const std::string& localPath,
                                                      const TransferOptions& options) {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    const std::string partPath = localPath + ".part";
    std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(Errc::FileTransferError, "cannot create '" + partPath + "'");
    }

    auto discard = [&]() {
        out.close();
        std::error_code ec;
        fs::remove(partPath, ec);
    };

    auto exclusive = session.acquire();
    const Capability capability = exclusive.capability();

    logInfo("[FileTransfer] download ", session.address(), ":", remoteName, " -> ", localPath, "\n");

    auto opened = exclusive.exchange(Command::action("OPEN " + remoteName));
    if (!opened) {
        discard();
        return transferFailure("OPEN " + remoteName, opened.error());
    }
    if (!opened->ok()) {
        discard();
        return rejected("OPEN " + remoteName, *opened);
    }

    expected<TransferReport> result = [&]() -> expected<TransferReport> {
        switch (capability) {
            case Capability::FullFeatured: return downloadBlocks(exclusive, remoteName, out, options);
            case Capability::Legacy:       return downloadLegacy(exclusive, remoteName, out, options);
        }
        return fail(Errc::Unsupported, "unknown capability");
    }();

    if (!result) {
        discard();
        return result;
    }

    out.close();
    if (!out) {
        discard();
        return fail(Errc::FileTransferError, "write error on '" + partPath + "'");
    }

    std::error_code ec;
    fs::rename(partPath, localPath, ec);
    if (ec) {
        discard();
        return fail(Errc::FileTransferError, "cannot move '" + partPath + "' into place: " + ec.message());
    }

    logInfo("[FileTransfer] downloaded ", remoteName, ": ", result->bytes, " bytes, ",
            result->retransmissions, " retransmission(s)\n");
    return result;
}

expected<TransferReport> FileTransferEngine::downloadBlocks(Session::Exclusive& exclusive,
                                                            const std::string& remoteName,
                                                            std::ostream& out,
                                                            const TransferOptions& options) {
    TransferReport report;
    report.checksum = checksum_->initial();
    std::size_t offset = 0;

    while (true) {
        if (options.cancel.cancelled()) {
            return fail(Errc::Cancelled, "download of " + remoteName + " cancelled at offset " +
                        std::to_string(offset));
        }

        const std::string command = "READAT " + std::to_string(offset);
        const std::string context = "READAT " + std::to_string(offset);
        int retries = 0;
        bool finished = false;

        while (true) {
            auto reply = exclusive.exchange(Command::action(command));
            if (!reply) {
                return transferFailure(context, reply.error());
            }
            if (reply->status == wire_status::END_OF_FILE) {
                finished = true;
                break;
            }
            if (!reply->ok() && !isRetryableBlockStatus(reply->status)) {
                return rejected(context, *reply);
            }

            std::vector<std::uint8_t> data;
            std::optional<std::uint32_t> claimed;
            bool malformed = !reply->ok();
            if (reply->ok()) {
                std::istringstream tokens(reply->payload);
                std::string token;
                while (tokens >> token) {
                    if (token.front() == '=') {
                        const auto colon = token.find(':');
                        const std::string sum = colon == std::string::npos ? std::string{} : token.substr(colon + 1);
                        if (sum.empty() || sum.size() > 8 ||
                            !std::all_of(sum.begin(), sum.end(),
                                         [](unsigned char c){ return std::isxdigit(c) != 0; })) {
                            malformed = true;
                            continue;
                        }
                        claimed = static_cast<std::uint32_t>(std::stoul(sum, nullptr, 16));
                        continue;
                    }
                    auto bytes = fromHex(token);
                    if (!bytes) {
                        malformed = true;
                        continue;
                    }
                    data.insert(data.end(), bytes->begin(), bytes->end());
                }
                if (data.empty() && !claimed && !malformed) {
                    finished = true;   // nothing left to read
                    break;
                }
            }

            const bool intact = !malformed && claimed &&
                                *claimed == checksum_->compute(data.data(), data.size());
            if (intact) {
                out.write(reinterpret_cast<const char*>(data.data()),
                          static_cast<std::streamsize>(data.size()));
                report.checksum = checksum_->combine(report.checksum,
                                                     checksum_->compute(data.data(), data.size()));
                report.bytes += data.size();
                ++report.blocksSent;
                offset += config_.fileBlockSize;
                break;
            }

            if (retries >= config_.maxBlockRetries) {
                return fail(Errc::FileTransferError,
                            context + ": retry budget of " + std::to_string(config_.maxBlockRetries) +
                            " exhausted", reply->status);
            }
            ++retries;
            ++report.retransmissions;
            logWarning("[FileTransfer] ", context, ": ",
                       reply->ok() ? "checksum mismatch" : toString(reply->code()),
                       ", re-reading (", retries, "/", config_.maxBlockRetries, ")\n");
        }

        if (finished) {
            return report;
        }
        if (options.progress) {
            options.progress(report.blocksSent, 0);
        }
    }
}

expected<TransferReport> FileTransferEngine::downloadLegacy(Session::Exclusive& exclusive,
                                                            const std::string& remoteName,
                                                            std::ostream& out,
                                                            const TransferOptions& options) {
    TransferReport report;
    report.checksum = checksum_->initial();

    while (true) {
        if (options.cancel.cancelled()) {
            return fail(Errc::Cancelled, "download of " + remoteName + " cancelled after " +
                        std::to_string(report.bytes) + " bytes");
        }

        auto reply = exclusive.exchange(Command::action("READ"));
        if (!reply) {
            return transferFailure("READ", reply.error());
        }
        if (reply->status == wire_status::END_OF_FILE) {
            return report;
        }
        if (!reply->ok()) {
            return rejected("READ after " + std::to_string(report.bytes) + " bytes", *reply);
        }

        // Dump lines: "<addr>: <hex bytes>".
        std::vector<std::uint8_t> data;
        for (const auto& line : reply->lines()) {
            const auto colon = line.find(':');
            if (colon == std::string::npos || colon == 0) {
                continue;
            }
            std::string hex;
            for (char c : line.substr(colon + 1)) {
                if (!std::isspace(static_cast<unsigned char>(c))) hex.push_back(c);
            }
            auto bytes = fromHex(hex);
            if (!bytes) {
                return transferFailure("READ", bytes.error());
            }
            data.insert(data.end(), bytes->begin(), bytes->end());
        }
        if (data.empty()) {
            return report;
        }

        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        report.checksum = checksum_->combine(report.checksum, checksum_->compute(data.data(), data.size()));
        report.bytes += data.size();
        ++report.blocksSent;
        if (options.progress) {
            options.progress(report.blocksSent, 0);
        }
    }
}

expected<void> FileTransferEngine::deleteRemote(Session& session, const std::string& remoteName) {
    return control::deleteFile(session, remoteName);
}

} // namespace lumina::luminaire
