#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lumina::luminaire {

/**
 * @brief One command line plus the metadata the retry logic needs.
 *
 * `idempotent` is explicit: only commands that can be replayed without
 * changing the outcome (queries, absolute-level sets) are ever retried
 * after a timeout or a lost connection. `timeout` overrides the session's
 * command timeout for slow operations such as FORMAT.
 */
struct Command {
    std::string text;
    bool idempotent = false;
    std::optional<std::chrono::milliseconds> timeout{};

    static Command query(std::string text);
    static Command action(std::string text);

    /// Derive the idempotency flag from the command word.
    static Command classify(std::string text);

    Command withTimeout(std::chrono::milliseconds value) const;
};

bool isIdempotentCommand(const std::string& text);

} // namespace lumina::luminaire
