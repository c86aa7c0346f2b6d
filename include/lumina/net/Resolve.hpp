#pragma once
#include "lumina/net/NetConfig.hpp"
#include <string>

namespace lumina::net {

/**
 * resolve
 *
 * Synchronous DNS lookup helper. Given `host` and `service` (e.g.
 * "lumina-octa.local" and "57007") it returns a list of endpoints that can be
 * handed to the `TcpClient::connect` overload accepting resolver results.
 */
inline error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    tcp::resolver::results_type& out)
{
    error_code ec;
    tcp::resolver r(io);
    out = r.resolve(host, service, ec);
    return ec;
}

// True when `text` is a literal IPv4/IPv6 address and needs no lookup.
inline bool is_ip_literal(const std::string& text) {
    error_code ec;
    asio::ip::make_address(text, ec);
    return !ec;
}

} // namespace lumina::net
