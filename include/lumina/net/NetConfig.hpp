#pragma once

#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif

#include <asio.hpp>
#include <chrono>
#include <system_error>   // std::error_code

namespace lumina::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `lumina::net::asio` as the standalone Asio namespace.
 * - `lumina::net::tcp` and `lumina::net::udp` as protocol aliases.
 * - `error_code` / `milliseconds` used by every socket helper.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace lumina::net
