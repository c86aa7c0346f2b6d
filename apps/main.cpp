#include "lumina/log/Log.hpp"
#include "lumina/luminaire/Discovery.hpp"
#include "lumina/luminaire/FileTransfer.hpp"
#include "lumina/luminaire/LuminaireControl.hpp"
#include "lumina/luminaire/SessionManager.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace lumina;
using namespace lumina::luminaire;

namespace {

void usage() {
    std::cerr <<
        "usage: lumina_probe [--debug] [--trace] [--port N] <command> [args]\n"
        "  discover [subnet ...]             probe subnets (default 192.168.0-11.x)\n"
        "  info <address>                    connect and print identity and telemetry\n"
        "  send <address> <command>          send one command line, print the reply\n"
        "  upload <address> <local> <remote> upload a script file\n"
        "  download <address> <remote> <local>\n";
}

int report(const Error& error) {
    std::cerr << "error: " << error.describe() << "\n";
    return 2;
}

int runDiscover(const Config& config, const std::vector<std::string>& args) {
    DiscoveryEngine engine(config);
    auto result = args.empty() ? engine.discover() : engine.discover(args);
    if (!result) {
        return report(result.error());
    }
    for (const auto& device : result->devices) {
        std::cout << device.address() << "  " << device.electronicSerial() << "\n";
    }
    std::cout << result->devices.size() << " luminaire(s), " << result->probesSent << " probe(s)\n";
    return 0;
}

int runInfo(SessionManager& manager, const std::string& address) {
    Device device(address);
    auto session = manager.connect(device);
    if (!session) {
        return report(session.error());
    }
    std::cout << device.describe() << "\n"
              << "  mac:       " << device.macAddress() << "\n"
              << "  serial:    " << device.electronicSerial() << "\n"
              << "  channels:  " << device.channelCount() << "\n";

    if (device.capability() == Capability::FullFeatured) {
        if (auto temperature = control::getTemperature(**session)) {
            std::cout << "  temp (C):  " << *temperature << "\n";
        }
        if (auto uptime = control::getUptime(**session)) {
            std::cout << "  uptime:    " << *uptime << "\n";
        }
        if (auto script = control::getCurrentScript(**session)) {
            std::cout << "  script:    " << *script << "\n";
        }
    }
    if (auto files = control::getDirectory(**session)) {
        std::cout << "  files:\n";
        for (const auto& file : *files) {
            std::cout << "    " << file << "\n";
        }
    }
    manager.disconnect(**session);
    return 0;
}

int runSend(SessionManager& manager, const std::string& address, const std::string& command) {
    auto session = manager.connect(address);
    if (!session) {
        return report(session.error());
    }
    auto response = manager.exchange(**session, Command::classify(command));
    manager.disconnect(**session);
    if (!response) {
        return report(response.error());
    }
    if (!response->payload.empty()) {
        std::cout << response->payload << "\n";
    }
    std::cout << "status " << response->status << " (" << toString(response->code()) << ")\n";
    return response->ok() ? 0 : 1;
}

int runTransfer(SessionManager& manager, const Config& config, bool upload,
                const std::string& address, const std::string& from, const std::string& to) {
    auto session = manager.connect(address);
    if (!session) {
        return report(session.error());
    }

    FileTransferEngine engine(config);
    TransferOptions options;
    options.progress = [](std::size_t done, std::size_t total) {
        if (total > 0) {
            std::cerr << "\r" << done << "/" << total << " blocks" << std::flush;
        } else {
            std::cerr << "\r" << done << " blocks" << std::flush;
        }
    };

    auto result = upload ? engine.upload(**session, from, to, options)
                         : engine.download(**session, from, to, options);
    std::cerr << "\n";
    manager.disconnect(**session);
    if (!result) {
        return report(result.error());
    }
    std::cout << result->bytes << " bytes, " << result->blocksSent << " blocks, "
              << result->retransmissions << " retransmission(s), checksum "
              << formatChecksum(result->checksum)
              << (result->verified ? " (verified)" : "") << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Config config;
    bool trace = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--debug") {
            setDebugLogging(true);
        } else if (arg == "--trace") {
            trace = true;
        } else if (arg == "--port" && i + 1 < argc) {
            config.commandPort = static_cast<unsigned short>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        usage();
        return 1;
    }

    if (auto valid = config.validate(); !valid) {
        return report(valid.error());
    }

    const std::string command = args.front();
    args.erase(args.begin());

    if (command == "discover") {
        return runDiscover(config, args);
    }

    SessionManager manager(config);
    if (command == "info" && args.size() == 1) {
        return runInfo(manager, args[0]);
    }
    if (command == "send" && args.size() == 2) {
        if (trace) {
            // Tracing needs the session before the first command, so connect here.
            auto session = manager.connect(args[0]);
            if (!session) {
                return report(session.error());
            }
            (*session)->setTraceSink([](TraceDirection direction, std::string_view text) {
                std::cerr << (direction == TraceDirection::Outbound ? ">> " : "<< ") << text << "\n";
            });
            auto response = (*session)->exchange(args[1]);
            manager.disconnect(**session);
            if (!response) {
                return report(response.error());
            }
            return response->ok() ? 0 : 1;
        }
        return runSend(manager, args[0], args[1]);
    }
    if (command == "upload" && args.size() == 3) {
        return runTransfer(manager, config, true, args[0], args[1], args[2]);
    }
    if (command == "download" && args.size() == 3) {
        return runTransfer(manager, config, false, args[0], args[1], args[2]);
    }

    usage();
    return 1;
}
