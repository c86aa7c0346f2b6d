#include "lumina/luminaire/FramedTransport.hpp"

#include "lumina/log/Log.hpp"

#include <utility>

namespace lumina::luminaire {

namespace asio = lumina::net::asio;

FramedTransport::FramedTransport(std::chrono::milliseconds commandTimeout)
: client_(commandTimeout)
, commandTimeout_(commandTimeout)
{}

FramedTransport::~FramedTransport() {
    close();
}

expected<void>
FramedTransport::connect(const net::tcp::endpoint& endpoint, std::chrono::milliseconds timeout) {
    pending_.clear();
    suspect_ = false;

    if (auto ec = client_.connect(endpoint, timeout); ec) {
        logDebug("[FramedTransport] connect to ", endpoint.address().to_string(), ":",
                 endpoint.port(), " failed: ", ec.message(), "\n");
        client_.close();
        const bool timedOut = ec == asio::error::timed_out;
        return fail(Errc::ConnectFailed,
                    endpoint.address().to_string() + ":" + std::to_string(endpoint.port()) + ": " +
                    (timedOut ? "connect timed out after " + std::to_string(timeout.count()) + "ms"
                              : ec.message()));
    }

    client_.setLowLatency();
    remote_ = endpoint;
    return {};
}

expected<void>
FramedTransport::connect(const std::string& address, unsigned short port,
                         std::chrono::milliseconds timeout) {
    std::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        return fail(Errc::ConnectFailed, "invalid address '" + address + "': " + ec.message());
    }
    return connect(net::tcp::endpoint(ip, port), timeout);
}

expected<void> FramedTransport::reconnect(std::chrono::milliseconds timeout) {
    if (!remote_) {
        return fail(Errc::NotConnected, "transport was never connected");
    }
    const auto endpoint = *remote_;
    close();
    return connect(endpoint, timeout);
}

expected<std::string> FramedTransport::send(std::string_view command) {
    return send(command, commandTimeout_);
}

expected<std::string>
FramedTransport::send(std::string_view command, std::chrono::milliseconds timeout) {
    if (auto written = writeLine(command, timeout); !written) {
        return unexpected(written.error());
    }
    return receive(timeout);
}

expected<void> FramedTransport::sendNoWait(std::string_view command) {
    return writeLine(command, commandTimeout_);
}

expected<std::string> FramedTransport::receive(std::chrono::milliseconds timeout) {
    if (!client_.is_open()) {
        return fail(Errc::NotConnected, "transport is closed");
    }

    std::size_t frameLength = 0;
    if (auto ec = client_.read_until(pending_, config::RESPONSE_TERMINATOR, timeout, &frameLength); ec) {
        return unexpected(transportError(ec, "read"));
    }

    std::string frame = pending_.substr(0, frameLength);
    pending_.erase(0, frameLength);
    trace(TraceDirection::Inbound, frame);
    return frame;
}

void FramedTransport::close() {
    client_.close();
    pending_.clear();
}

expected<void>
FramedTransport::writeLine(std::string_view command, std::chrono::milliseconds timeout) {
    if (!client_.is_open()) {
        return fail(Errc::NotConnected, "transport is closed");
    }

    std::string line(command);
    line.push_back(config::COMMAND_TERMINATOR);
    trace(TraceDirection::Outbound, command);

    if (auto ec = client_.write_all(line.data(), line.size(), timeout); ec) {
        return unexpected(transportError(ec, "write"));
    }
    return {};
}

Error FramedTransport::transportError(const std::error_code& ec, std::string_view what) {
    const std::string detail = std::string(what) + ": " + ec.message();

    if (ec == asio::error::timed_out) {
        suspect_ = true;
        return makeError(Errc::ResponseTimeout, detail);
    }
    if (ec == asio::error::not_found) {
        suspect_ = true;
        return makeError(Errc::ProtocolError, "reply exceeds frame limit without a terminator");
    }

    // eof, reset, aborted, broken pipe: the stream is gone.
    suspect_ = true;
    client_.close();
    return makeError(Errc::ConnectionLost, detail);
}

void FramedTransport::trace(TraceDirection direction, std::string_view text) const {
    if (trace_) {
        trace_(direction, text);
    }
}

} // namespace lumina::luminaire
