// Error.hpp
// -----------------------------------------------------------------------------
// Error taxonomy shared by every lumina component. `Errc` plugs into
// std::error_code so transport failures (asio) and protocol failures can be
// compared the same way; `Error` adds the luminaire status code that came
// with the failure, when there was one.

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace lumina {

enum class Errc {
    ConnectFailed = 1,  ///< socket could not be opened (refused, unreachable, timeout)
    AlreadyConnected,   ///< the device's single session slot is taken
    ResponseTimeout,    ///< no terminator within the deadline; session is suspect
    CommandFailed,      ///< well-formed exchange with a non-zero status
    FileTransferError,  ///< transfer job failed as a whole
    NoReply,            ///< expected, non-fatal: nothing answered in time
    InvalidConfig,      ///< configuration rejected before any I/O
    NotConnected,       ///< session closed or dead
    ConnectionLost,     ///< peer closed or reset the stream mid-exchange
    Unsupported,        ///< operation not available for this capability class
    Cancelled,          ///< aborted through a CancelToken
    ProtocolError       ///< malformed frame or payload
};

const std::error_category& lumina_category() noexcept;
std::error_code make_error_code(Errc e) noexcept;

/**
 * @brief Failure value carried by `lumina::expected`.
 *
 * `status` is the best available device status code (`NO_STATUS` when the
 * failure happened below the command layer). `detail` holds the
 * human-readable cause, typically the underlying socket error.
 */
struct Error {
    static constexpr int NO_STATUS = -1;

    std::error_code code{};
    int status = NO_STATUS;
    std::string detail{};

    bool is(Errc e) const noexcept { return code == make_error_code(e); }
    bool hasStatus() const noexcept { return status != NO_STATUS; }
    std::string describe() const;
};

Error makeError(Errc e, std::string detail = {}, int status = Error::NO_STATUS);

} // namespace lumina

namespace std {
template<>
struct is_error_code_enum<lumina::Errc> : true_type {};
} // namespace std
