#include "lumina/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace lumina::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<bool> debugEnabled{false};

LogHandler currentInfoHandler() {
    std::lock_guard lock(sinkMutex);
    return infoHandler;
}

LogHandler currentErrorHandler() {
    std::lock_guard lock(sinkMutex);
    return errorHandler;
}

void emit(const LogHandler& handler, std::string_view prefix, std::string_view message) {
    if (!handler) {
        return;
    }
    if (prefix.empty()) {
        handler(message);
        return;
    }
    std::string line;
    line.reserve(prefix.size() + message.size());
    line.append(prefix);
    line.append(message);
    handler(line);
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void setDebugLogging(bool enabled) {
    debugEnabled.store(enabled, std::memory_order_relaxed);
}

bool debugLoggingEnabled() {
    return debugEnabled.load(std::memory_order_relaxed);
}

void logDebug(std::string_view message) {
    if (!debugLoggingEnabled()) {
        return;
    }
    emit(currentInfoHandler(), "[debug] ", message);
}

void logInfo(std::string_view message) {
    emit(currentInfoHandler(), {}, message);
}

void logWarning(std::string_view message) {
    emit(currentErrorHandler(), "[warning] ", message);
}

void logError(std::string_view message) {
    emit(currentErrorHandler(), {}, message);
}

} // namespace lumina::log
