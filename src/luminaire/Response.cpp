#include "lumina/luminaire/Response.hpp"

#include "lumina/luminaire/LuminaireConfig.hpp"

#include <cctype>
#include <sstream>

namespace lumina::luminaire {
namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string_view trimView(std::string_view text) {
    while (!text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back())) text.remove_suffix(1);
    return text;
}

} // namespace

StatusCode classifyStatus(int raw) noexcept {
    switch (raw) {
        case wire_status::SUCCESS:          return StatusCode::Success;
        case wire_status::FILE_NOT_FOUND:   return StatusCode::FileNotFound;
        case wire_status::NO_RESPONSE:      return StatusCode::NoResponse;
        case wire_status::CHECKSUM_INVALID: return StatusCode::ChecksumInvalid;
        default:                       return StatusCode::Generic;
    }
}

const char* toString(StatusCode code) {
    switch (code) {
        case StatusCode::Success:         return "success";
        case StatusCode::FileNotFound:    return "file not found";
        case StatusCode::NoResponse:      return "no response";
        case StatusCode::ChecksumInvalid: return "checksum invalid";
        case StatusCode::Generic:         return "error";
    }
    return "error";
}

Response Response::parse(std::string_view frame) {
    Response response;

    if (!frame.empty() && frame.back() == config::RESPONSE_TERMINATOR) {
        frame.remove_suffix(1);
    }
    std::string_view body = frame;
    while (!body.empty() && isSpace(body.back())) body.remove_suffix(1);

    std::size_t digits = 0;
    while (digits < body.size() && isDigit(body[body.size() - 1 - digits])) {
        ++digits;
    }

    if (digits > 0) {
        const std::size_t tokenStart = body.size() - digits;
        const bool separated = tokenStart == 0 || isSpace(body[tokenStart - 1]);
        if (!separated && digits > 2) {
            digits = 2;
        }
    }

    if (digits == 0 || digits > 9) {
        response.payload = std::string(trimView(frame));
        return response;
    }

    const std::size_t statusStart = body.size() - digits;
    response.status = std::stoi(std::string(body.substr(statusStart)));
    response.statusParsed = true;
    response.payload = std::string(trimView(body.substr(0, statusStart)));
    return response;
}

std::vector<std::string> Response::lines() const {
    std::vector<std::string> out;
    std::istringstream in(payload);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out.push_back(line);
    }
    return out;
}

} // namespace lumina::luminaire
