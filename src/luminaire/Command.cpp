#include "lumina/luminaire/Command.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace lumina::luminaire {
namespace {

constexpr std::array<std::string_view, 15> QUERY_WORDS{{
    "VER", "NS", "ID", "GETSERNO", "GETIP", "TEMPC", "UPTIME", "DIR", "LRC",
    "PS?", "CURRENT", "MAP-GET", "MR", "IYAM", "STREAM-INFO"
}};

std::string upperFirstWord(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_first_of(" \t\r\n", begin);
    std::string word = text.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return word;
}

bool allHex(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](unsigned char c){ return std::isxdigit(c) != 0; });
}

bool twoDigitsThenHex(std::string_view text) {
    return text.size() > 2
        && std::isdigit(static_cast<unsigned char>(text[0]))
        && std::isdigit(static_cast<unsigned char>(text[1]))
        && allHex(text.substr(2));
}

} // namespace

bool isIdempotentCommand(const std::string& text) {
    const std::string word = upperFirstWord(text);
    if (word.empty()) {
        return false;
    }
    if (std::find(QUERY_WORDS.begin(), QUERY_WORDS.end(), word) != QUERY_WORDS.end()) {
        return true;
    }
    if (word == "DARK" || word == "B") {
        return true;
    }

    // Absolute drive-level sets: PS<hex..>, PA<hex..>, P<nn><hex>, PC<nn><hex>.
    const std::string_view view(word);
    if (view.size() > 2 && (view.substr(0, 2) == "PS" || view.substr(0, 2) == "PA")) {
        if (allHex(view.substr(2))) {
            return true;
        }
    }
    if (view.size() > 2 && view.substr(0, 2) == "PC" && twoDigitsThenHex(view.substr(2))) {
        return true;
    }
    if (view.size() > 1 && view[0] == 'P' && twoDigitsThenHex(view.substr(1))) {
        return true;
    }
    return false;
}

Command Command::query(std::string text) {
    Command command;
    command.text = std::move(text);
    command.idempotent = true;
    return command;
}

Command Command::action(std::string text) {
    Command command;
    command.text = std::move(text);
    command.idempotent = false;
    return command;
}

Command Command::classify(std::string text) {
    Command command;
    command.idempotent = isIdempotentCommand(text);
    command.text = std::move(text);
    return command;
}

Command Command::withTimeout(std::chrono::milliseconds value) const {
    Command copy = *this;
    copy.timeout = value;
    return copy;
}

} // namespace lumina::luminaire
