#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace lumina::log {

/**
 * @brief Replaceable sinks for library diagnostics.
 *
 * Two handlers are installed: the info handler receives `logInfo` and (when
 * enabled) `logDebug`; the error handler receives `logWarning` and
 * `logError`. Passing an empty handler restores the default sink
 * (`std::cout` / `std::cerr`).
 */
using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

/// Debug output is off by default (per-probe chatter during discovery).
void setDebugLogging(bool enabled);
bool debugLoggingEnabled();

void logDebug(std::string_view message);
void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableIfComposite = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest,
         typename = detail::EnableIfComposite<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!debugLoggingEnabled()) {
        return; // skip formatting entirely
    }
    logDebug(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableIfComposite<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableIfComposite<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    logWarning(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableIfComposite<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace lumina::log

namespace lumina {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::setDebugLogging;
using log::logDebug;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace lumina
