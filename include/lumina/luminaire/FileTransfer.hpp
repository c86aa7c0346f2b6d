#pragma once

#include "lumina/core/Cancellation.hpp"
#include "lumina/core/Expected.hpp"
#include "lumina/luminaire/Checksum.hpp"
#include "lumina/luminaire/Device.hpp"
#include "lumina/luminaire/LuminaireConfig.hpp"
#include "lumina/luminaire/Session.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace lumina::luminaire {

struct TransferOptions {
    bool idleAfterLoad = true;      // CLOSEPAUSED instead of CLOSE (full-featured only)
    bool verify = true;             // compare LRC <name> with the local checksum afterwards
    core::CancelToken cancel = core::CancelToken::none();
    std::function<void(std::size_t blocksDone, std::size_t blocksTotal)> progress{};
};

/**
 * @brief Plan for one upload: what is sent and how it is acknowledged.
 *
 * Blocks are sent strictly in order. A job either completes every block or
 * fails, and a failed job leaves an invalid remote file behind.
 */
struct TransferJob {
    std::string localPath;
    std::string remoteName;
    std::size_t blockSize = config::FILE_BLOCK_SIZE;
    std::size_t fileLength = 0;
    std::size_t totalBlocks = 0;
    bool checksumMode = true;       // per-block checksum and ack checking
    int maxBlockRetries = config::MAX_BLOCK_RETRIES_DEFAULT;
    bool idleAfterLoad = true;
};

struct TransferReport {
    std::size_t blocksSent = 0;
    std::size_t retransmissions = 0;
    std::size_t bytes = 0;
    std::uint32_t checksum = 0;
    bool verified = false;
};

/**
 * @brief Chunked upload/download over a session's command stream.
 *
 * Upload: `CREATE`, one `WRITE` per block, then `CLOSE`/`CLOSEPAUSED` with
 * the real length. Full-featured luminaires get `WRITE <LRC8>:<hex>` and a
 * block is resent while the device answers checksum-invalid (42) or
 * no-response (11), up to `maxBlockRetries`; the job then aborts and no
 * further block is sent. Legacy luminaires get `WRITE <hex>` and their
 * replies are read only to keep the stream framed.
 *
 * Download: `OPEN`, then `READAT <offset>` until status 1 on full-featured
 * models, or `READ` until status 1 (or an empty dump) on legacy ones; any
 * other non-zero legacy status aborts the job. Output goes to
 * `<dest>.part` and is renamed into place only when the job succeeds.
 *
 * Jobs hold `Session::acquire()` for their whole duration and honour the
 * cancel token between blocks.
 */
class FileTransferEngine {
public:
    explicit FileTransferEngine(Config config = {},
                                std::shared_ptr<const ChecksumStrategy> checksum = defaultChecksum());

    expected<TransferReport> upload(Session& session,
                                    const std::string& localPath,
                                    const std::string& remoteName,
                                    const TransferOptions& options = {});

    expected<TransferReport> download(Session& session,
                                      const std::string& remoteName,
                                      const std::string& localPath,
                                      const TransferOptions& options = {});

    /// Remove a remote file, e.g. the remains of a failed upload.
    expected<void> deleteRemote(Session& session, const std::string& remoteName);

    expected<std::uint32_t> computeChecksum(const std::string& localPath) const;

    TransferJob plan(Capability capability, const std::string& localPath,
                     const std::string& remoteName, std::size_t fileLength,
                     const TransferOptions& options) const;

    const ChecksumStrategy& checksum() const { return *checksum_; }

    static std::string toHex(const std::uint8_t* data, std::size_t size);
    static expected<std::vector<std::uint8_t>> fromHex(const std::string& text);

private:
    expected<TransferReport> downloadBlocks(Session::Exclusive& exclusive,
                                            const std::string& remoteName,
                                            std::ostream& out,
                                            const TransferOptions& options);
    expected<TransferReport> downloadLegacy(Session::Exclusive& exclusive,
                                            const std::string& remoteName,
                                            std::ostream& out,
                                            const TransferOptions& options);

    Config config_;
    std::shared_ptr<const ChecksumStrategy> checksum_;
};

} // namespace lumina::luminaire
