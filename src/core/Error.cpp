#include "lumina/core/Error.hpp"

#include <sstream>

namespace lumina {
namespace {

class LuminaCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "lumina"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::ConnectFailed:     return "connect failed";
            case Errc::AlreadyConnected:  return "device session already in use";
            case Errc::ResponseTimeout:   return "response timeout";
            case Errc::CommandFailed:     return "command failed";
            case Errc::FileTransferError: return "file transfer failed";
            case Errc::NoReply:           return "no reply";
            case Errc::InvalidConfig:     return "invalid configuration";
            case Errc::NotConnected:      return "not connected";
            case Errc::ConnectionLost:    return "connection lost";
            case Errc::Unsupported:       return "unsupported on this luminaire";
            case Errc::Cancelled:         return "cancelled";
            case Errc::ProtocolError:     return "protocol error";
        }
        return "unknown lumina error";
    }
};

} // namespace

const std::error_category& lumina_category() noexcept {
    static const LuminaCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), lumina_category()};
}

std::string Error::describe() const {
    std::ostringstream os;
    os << code.message();
    if (hasStatus()) {
        os << " (status " << status << ")";
    }
    if (!detail.empty()) {
        os << ": " << detail;
    }
    return os.str();
}

Error makeError(Errc e, std::string detail, int status) {
    Error error;
    error.code = make_error_code(e);
    error.status = status;
    error.detail = std::move(detail);
    return error;
}

} // namespace lumina
