#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lumina::luminaire {

/**
 * @brief Decoded meaning of a luminaire status token.
 *
 * The raw value is always kept on `Response::status`; `Generic` covers every
 * code without a dedicated meaning.
 */
enum class StatusCode {
    Success = 0,
    FileNotFound = 9,
    NoResponse = 11,
    ChecksumInvalid = 42,
    Generic
};

namespace wire_status {
constexpr int SUCCESS = 0;
constexpr int END_OF_FILE = 1;   // READAT / READ past the last block
constexpr int FILE_NOT_FOUND = 9;
constexpr int NO_RESPONSE = 11;
constexpr int CHECKSUM_INVALID = 42;
} // namespace wire_status

StatusCode classifyStatus(int raw) noexcept;
const char* toString(StatusCode code);

/**
 * @brief One framed reply: payload text plus its status token.
 *
 * Replies look like `<payload>\r\n<status>;`. The status is the last token
 * before the terminator; when it is glued to the payload only the final two
 * digits are taken. A frame without any status digits decodes as
 * `NoResponse` with `statusParsed == false`.
 */
struct Response {
    int status = wire_status::NO_RESPONSE;
    bool statusParsed = false;
    std::string payload;

    static Response parse(std::string_view frame);

    StatusCode code() const noexcept { return classifyStatus(status); }
    bool ok() const noexcept { return status == wire_status::SUCCESS; }

    /// Payload split on line breaks, carriage returns dropped.
    std::vector<std::string> lines() const;
};

} // namespace lumina::luminaire
