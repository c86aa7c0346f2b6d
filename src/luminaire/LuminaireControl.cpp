#include "lumina/luminaire/LuminaireControl.hpp"

#include "lumina/log/Log.hpp"
#include "lumina/luminaire/ChannelMap.hpp"
#include "lumina/luminaire/DriveLevels.hpp"
#include "lumina/luminaire/Response.hpp"

#include <cctype>
#include <cstdlib>

namespace lumina::luminaire::control {
namespace {

expected<std::string> queryText(Session& session, const char* command) {
    auto response = session.execute(Command::query(command));
    if (!response) {
        return unexpected(response.error());
    }
    return response->payload;
}

expected<void> runAction(Session& session, const Command& command) {
    auto response = session.execute(command);
    if (!response) {
        return unexpected(response.error());
    }
    return {};
}

tl::unexpected<Error> unsupported(const char* what) {
    return fail(Errc::Unsupported, std::string(what) + " is not available on Light Replicator");
}

std::string withoutLineBreaks(std::string text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '\r' && c != '\n') out.push_back(c);
    }
    return out;
}

} // namespace

// Decoders ---------------------------------------------------------------------

expected<double> parseTemperature(const std::string& payload) {
    static constexpr const char* TAG = "Temp(C):";
    const auto pos = payload.find(TAG);
    if (pos == std::string::npos) {
        return fail(Errc::ProtocolError, "no temperature in '" + payload + "'");
    }
    const char* begin = payload.c_str() + pos + std::char_traits<char>::length(TAG);
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin) {
        return fail(Errc::ProtocolError, "unreadable temperature in '" + payload + "'");
    }
    return value;
}

expected<std::uint32_t> parseLrc(const std::string& payload) {
    const std::string flat = withoutLineBreaks(payload);
    const auto pos = flat.find("LRC:");
    if (pos == std::string::npos) {
        return fail(Errc::ProtocolError, "no LRC in '" + flat + "'");
    }
    std::size_t i = pos + 4;
    while (i < flat.size() && std::isspace(static_cast<unsigned char>(flat[i]))) ++i;
    std::size_t j = i;
    while (j < flat.size() && std::isxdigit(static_cast<unsigned char>(flat[j])) && j - i < 8) ++j;
    if (j == i) {
        return fail(Errc::ProtocolError, "unreadable LRC in '" + flat + "'");
    }
    return static_cast<std::uint32_t>(std::stoul(flat.substr(i, j - i), nullptr, 16));
}

std::vector<std::string> parseDirectory(Capability capability, const std::string& payload) {
    Response parsed;
    parsed.payload = payload;
    const auto lines = parsed.lines();

    std::vector<std::string> files;
    switch (capability) {
        case Capability::FullFeatured:
            // One header line, three footer lines (totals and free space).
            if (lines.size() > 4) {
                files.assign(lines.begin() + 1, lines.end() - 3);
            }
            break;
        case Capability::Legacy:
            for (const auto& line : lines) {
                const auto tick = line.find('`');
                if (tick != std::string::npos && tick > 0) {
                    files.push_back(line.substr(0, tick));
                }
            }
            break;
    }
    return files;
}

// Identity and telemetry -------------------------------------------------------

expected<std::string> getVersion(Session& session) {
    return queryText(session, "VER");
}

expected<std::string> getElectronicSerial(Session& session) {
    return queryText(session, "NS");
}

expected<std::string> getLuminaireSerial(Session& session) {
    switch (session.capability()) {
        case Capability::FullFeatured: return queryText(session, "GETSERNO");
        case Capability::Legacy:       return queryText(session, "NS");
    }
    return unsupported("GETSERNO");
}

expected<std::string> getMacAddress(Session& session) {
    auto payload = queryText(session, "GETIP");
    if (!payload) {
        return payload;
    }
    const auto end = payload->find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return fail(Errc::ProtocolError, "empty GETIP reply");
    }
    const auto begin = payload->find_last_of(" \t\r\n", end);
    return payload->substr(begin == std::string::npos ? 0 : begin + 1,
                           end - (begin == std::string::npos ? 0 : begin + 1) + 1);
}

expected<double> getTemperature(Session& session) {
    switch (session.capability()) {
        case Capability::Legacy:
            return unsupported("temperature");
        case Capability::FullFeatured: {
            auto payload = queryText(session, "TEMPC");
            if (!payload) {
                return unexpected(payload.error());
            }
            return parseTemperature(*payload);
        }
    }
    return unsupported("temperature");
}

expected<std::string> getUptime(Session& session) {
    switch (session.capability()) {
        case Capability::Legacy:       return unsupported("uptime");
        case Capability::FullFeatured: return queryText(session, "UPTIME");
    }
    return unsupported("uptime");
}

// Storage ------------------------------------------------------------------------

expected<std::vector<std::string>> getDirectory(Session& session) {
    auto payload = queryText(session, "DIR");
    if (!payload) {
        return unexpected(payload.error());
    }
    return parseDirectory(session.capability(), *payload);
}

expected<std::uint32_t> getFileChecksum(Session& session, const std::string& remoteName) {
    switch (session.capability()) {
        case Capability::Legacy:
            return unsupported("LRC");
        case Capability::FullFeatured: {
            auto response = session.execute(Command::query("LRC " + remoteName));
            if (!response) {
                return unexpected(response.error());
            }
            return parseLrc(response->payload);
        }
    }
    return unsupported("LRC");
}

expected<void> deleteFile(Session& session, const std::string& remoteName) {
    switch (session.capability()) {
        case Capability::FullFeatured:
            return runAction(session, Command::action("DELETE " + remoteName));
        case Capability::Legacy: {
            auto response = session.exchange(Command::action("ERASE " + remoteName));
            if (!response) {
                return unexpected(response.error());
            }
            // Legacy firmware reports a missing file as 1; align with full-featured models.
            const int status = response->status == wire_status::END_OF_FILE ? wire_status::FILE_NOT_FOUND
                                                                             : response->status;
            if (status != wire_status::SUCCESS) {
                return fail(Errc::CommandFailed, "ERASE " + remoteName + ": " +
                            toString(classifyStatus(status)), status);
            }
            return {};
        }
    }
    return unsupported("ERASE");
}

expected<void> formatStorage(Session& session, std::chrono::milliseconds timeout) {
    logWarning("[LuminaireControl] formatting storage on ", session.address(), "\n");
    auto exclusive = session.acquire();
    if (auto sent = exclusive.sendNoWait("FORMAT"); !sent) {
        return sent;
    }
    auto response = exclusive.awaitReply(timeout);
    if (!response) {
        return unexpected(response.error());
    }
    if (!response->ok()) {
        return fail(Errc::CommandFailed, "FORMAT: " + std::string(toString(response->code())),
                    response->status);
    }
    return {};
}

// Drive levels -------------------------------------------------------------------

expected<std::vector<double>> getDriveLevels(Session& session) {
    auto payload = queryText(session, "PS?");
    if (!payload) {
        return unexpected(payload.error());
    }
    return drive::decodeReadback(session.capability(), *payload);
}

expected<std::vector<std::uint16_t>> getDriveLevelsRaw(Session& session) {
    switch (session.capability()) {
        case Capability::Legacy:
            return unsupported("raw drive level readback");
        case Capability::FullFeatured: {
            auto payload = queryText(session, "PS?");
            if (!payload) {
                return unexpected(payload.error());
            }
            return drive::decodeReadbackRaw(*payload);
        }
    }
    return unsupported("raw drive level readback");
}

expected<void> setDriveLevels(Session& session, const std::vector<double>& levels) {
    return runAction(session, Command::classify(drive::encodeSetAll(session.capability(), levels)));
}

expected<void> setDriveLevelsRaw(Session& session, const std::vector<std::uint16_t>& raw) {
    return runAction(session, Command::classify(drive::encodeSetAllRaw(session.capability(), raw)));
}

expected<void> setDriveLevel(Session& session, std::size_t channel, double level) {
    const auto capability = session.capability();
    if (channel >= channel_map::fullChannelCount(capability)) {
        return fail(Errc::InvalidConfig, "channel " + std::to_string(channel) + " out of range");
    }
    return runAction(session, Command::classify(drive::encodeSetOne(capability, channel, level)));
}

expected<void> setNamedLevels(Session& session, const std::vector<double>& named) {
    switch (session.capability()) {
        case Capability::Legacy:
            return unsupported("named wavelength levels");
        case Capability::FullFeatured:
            return setDriveLevels(session, channel_map::expand(named));
    }
    return unsupported("named wavelength levels");
}

expected<void> goDark(Session& session) {
    switch (session.capability()) {
        case Capability::FullFeatured: return runAction(session, Command::classify("DARK"));
        case Capability::Legacy:       return runAction(session, Command::classify("B"));
    }
    return unsupported("DARK");
}

// Playback -----------------------------------------------------------------------

expected<std::string> getCurrentScript(Session& session) {
    switch (session.capability()) {
        case Capability::Legacy:
            return unsupported("CURRENT");
        case Capability::FullFeatured: {
            auto exclusive = session.acquire();
            auto synced = exclusive.exchange(Command::action("SYNC"));
            if (!synced) {
                return unexpected(synced.error());
            }
            if (!synced->ok()) {
                logWarning("[LuminaireControl] ", session.address(), ": SYNC returned status ",
                           synced->status, "\n");
            }
            auto response = exclusive.execute(Command::query("CURRENT"));
            if (!response) {
                return unexpected(response.error());
            }
            return withoutLineBreaks(response->payload);
        }
    }
    return unsupported("CURRENT");
}

expected<void> play(Session& session, const std::string& remoteName, bool paused) {
    switch (session.capability()) {
        case Capability::FullFeatured:
            if (remoteName.empty()) {
                return runAction(session, Command::action("PLAY"));
            }
            return runAction(session, Command::action((paused ? "PLAYPAUSED " : "PLAY ") + remoteName));
        case Capability::Legacy:
            return runAction(session, Command::action("SETPAT=" + remoteName));
    }
    return unsupported("PLAY");
}

expected<void> pause(Session& session) {
    switch (session.capability()) {
        case Capability::FullFeatured: return runAction(session, Command::action("PAUSE"));
        case Capability::Legacy:       return runAction(session, Command::action("Q5"));
    }
    return unsupported("PAUSE");
}

expected<void> resume(Session& session) {
    switch (session.capability()) {
        case Capability::FullFeatured: return runAction(session, Command::action("RESUME"));
        case Capability::Legacy:       return runAction(session, Command::action("Q2"));
    }
    return unsupported("RESUME");
}

expected<void> stop(Session& session) {
    switch (session.capability()) {
        case Capability::FullFeatured:
            return runAction(session, Command::action("STOP"));
        case Capability::Legacy: {
            auto stopped = session.exchange(Command::action("Q8"));
            if (!stopped) {
                return unexpected(stopped.error());
            }
            if (!stopped->ok()) {
                logWarning("[LuminaireControl] ", session.address(), ": Q8 returned status ",
                           stopped->status, "\n");
            }
            return goDark(session);
        }
    }
    return unsupported("STOP");
}

expected<void> reset(Session& session) {
    logInfo("[LuminaireControl] resetting ", session.address(), "\n");
    if (auto sent = session.sendNoWait("RESET"); !sent) {
        return sent;
    }
    session.close();
    return {};
}

} // namespace lumina::luminaire::control
