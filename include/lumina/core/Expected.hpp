// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// names the success/error pair consistently. The default error type is
// lumina::Error (error code + device status + detail); the socket layer in
// lumina::net keeps returning plain std::error_code.

#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "lumina/core/Error.hpp"

namespace lumina {

template <typename T, typename E = Error>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

/// Shorthand for `unexpected(makeError(...))`.
[[nodiscard]] inline unexpected_t<Error>
fail(Errc e, std::string detail = {}, int status = Error::NO_STATUS) {
    return unexpected_t<Error>(makeError(e, std::move(detail), status));
}

} // namespace lumina
