#include "lumina/luminaire/Session.hpp"

#include "lumina/log/Log.hpp"

#include <thread>
#include <utility>

namespace lumina::luminaire {

// Exclusive -------------------------------------------------------------------

expected<Response> Session::Exclusive::exchange(const Command& command) {
    return session_->exchangeLocked(command);
}

expected<Response> Session::Exclusive::execute(const Command& command) {
    return session_->executeLocked(command);
}

expected<void> Session::Exclusive::sendNoWait(const std::string& command) {
    return session_->sendNoWaitLocked(command);
}

expected<Response> Session::Exclusive::awaitReply(std::chrono::milliseconds timeout) {
    return session_->awaitLocked(timeout);
}

Capability Session::Exclusive::capability() const {
    return session_->capability();
}

// Session ---------------------------------------------------------------------

Session::Session(Device device, Config config, std::unique_ptr<FramedTransport> transport,
                 ReleaseHook release)
: device_(std::move(device))
, address_(device_.address())
, config_(std::move(config))
, transport_(std::move(transport))
, release_(std::move(release))
{}

Session::~Session() {
    close();
}

Session::Exclusive Session::acquire() {
    return Exclusive(*this, std::unique_lock<std::mutex>(commandMutex_));
}

expected<Response> Session::exchange(const Command& command) {
    std::lock_guard<std::mutex> lock(commandMutex_);
    return exchangeLocked(command);
}

expected<Response> Session::execute(const Command& command) {
    std::lock_guard<std::mutex> lock(commandMutex_);
    return executeLocked(command);
}

expected<void> Session::sendNoWait(const std::string& command) {
    std::lock_guard<std::mutex> lock(commandMutex_);
    return sendNoWaitLocked(command);
}

Device Session::device() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return device_;
}

Capability Session::capability() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return device_.capability();
}

bool Session::isAlive() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return !dead_ && !closed_;
}

int Session::lastStatus() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return device_.lastStatus();
}

void Session::setTraceSink(TraceSink sink) {
    std::lock_guard<std::mutex> lock(commandMutex_);
    transport_->setTraceSink(std::move(sink));
}

void Session::close() {
    std::lock_guard<std::mutex> lock(commandMutex_);
    closeLocked(ConnectionState::Disconnected);
}

expected<void> Session::checkUsableLocked() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (dead_) {
        return fail(Errc::NotConnected, "session to " + address_ + " failed earlier");
    }
    if (closed_) {
        return fail(Errc::NotConnected, "session to " + address_ + " is closed");
    }
    return {};
}

expected<Response> Session::exchangeLocked(const Command& command) {
    if (auto usable = checkUsableLocked(); !usable) {
        return unexpected(usable.error());
    }

    const auto timeout = command.timeout.value_or(config_.commandTimeout);
    const int attempts = command.idempotent ? config_.maxRetries + 1 : 1;
    Error last;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            logWarning("[Session] ", address_, ": retrying '", command.text, "' (",
                       attempt, "/", config_.maxRetries, ") after ", last.describe(), "\n");
            std::this_thread::sleep_for(config_.retryBackoff);
            if (auto reconnected = transport_->reconnect(config_.connectTimeout); !reconnected) {
                last = makeError(Errc::ConnectionLost,
                                 "reconnect failed: " + reconnected.error().detail);
                continue;
            }
        }

        auto frame = transport_->send(command.text, timeout);
        if (frame) {
            Response response = Response::parse(*frame);
            recordStatus(response.status);
            return response;
        }

        last = frame.error();
        if (!last.is(Errc::ResponseTimeout) && !last.is(Errc::ConnectionLost)) {
            break;
        }
    }

    markDead(last);
    return unexpected(last);
}

expected<Response> Session::executeLocked(const Command& command) {
    auto response = exchangeLocked(command);
    if (!response) {
        return response;
    }
    if (!response->ok()) {
        return fail(Errc::CommandFailed,
                    command.text + ": " + toString(response->code()) +
                    (response->payload.empty() ? std::string{} : " (" + response->payload + ")"),
                    response->status);
    }
    return response;
}

expected<void> Session::sendNoWaitLocked(const std::string& command) {
    if (auto usable = checkUsableLocked(); !usable) {
        return usable;
    }
    if (auto sent = transport_->sendNoWait(command); !sent) {
        markDead(sent.error());
        return sent;
    }
    return {};
}

expected<Response> Session::awaitLocked(std::chrono::milliseconds timeout) {
    if (auto usable = checkUsableLocked(); !usable) {
        return unexpected(usable.error());
    }
    auto frame = transport_->receive(timeout);
    if (!frame) {
        markDead(frame.error());
        return unexpected(frame.error());
    }
    Response response = Response::parse(*frame);
    recordStatus(response.status);
    return response;
}

void Session::markDead(const Error& error) {
    logError("[Session] ", address_, ": session lost: ", error.describe(), "\n");
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        dead_ = true;
    }
    closeLocked(ConnectionState::Error);
}

void Session::closeLocked(ConnectionState finalState) {
    ReleaseHook release;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        if (device_.state() != ConnectionState::Error) {
            device_.setState(finalState);
        }
        release = std::move(release_);
    }

    transport_->close();
    logDebug("[Session] ", address_, ": closed\n");
    if (release) {
        release(address_);
    }
}

void Session::recordStatus(int status) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    device_.setLastStatus(status);
}

} // namespace lumina::luminaire
