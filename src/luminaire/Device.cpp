#include "lumina/luminaire/Device.hpp"

#include <sstream>

namespace lumina::luminaire {
namespace {

expected<void> mergeField(std::string& current, const std::string& incoming, const char* name) {
    if (incoming.empty() || current == incoming) {
        return {};
    }
    if (current.empty()) {
        current = incoming;
        return {};
    }
    return fail(Errc::ProtocolError,
                std::string("identity mismatch on ") + name + ": have '" + current +
                "', device reported '" + incoming + "'");
}

} // namespace

const char* toString(Capability capability) {
    switch (capability) {
        case Capability::FullFeatured: return "full-featured";
        case Capability::Legacy:       return "legacy";
    }
    return "unknown";
}

const char* toString(LuminaireModel model) {
    switch (model) {
        case LuminaireModel::Octa:            return "Octa";
        case LuminaireModel::Penta:           return "Penta";
        case LuminaireModel::LightReplicator: return "LightReplicator";
        case LuminaireModel::Unknown:         return "Unknown";
    }
    return "Unknown";
}

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

Capability capabilityFor(LuminaireModel model) {
    switch (model) {
        case LuminaireModel::LightReplicator:
            return Capability::Legacy;
        case LuminaireModel::Octa:
        case LuminaireModel::Penta:
        case LuminaireModel::Unknown:
            return Capability::FullFeatured;
    }
    return Capability::FullFeatured;
}

LuminaireModel modelFromIdReply(const std::string& reply) {
    if (reply.find("mV") != std::string::npos && reply.find("mA") != std::string::npos) {
        return LuminaireModel::LightReplicator;
    }
    const std::string type = reply.substr(0, reply.find(':'));
    if (type.find("Octa") != std::string::npos) {
        return LuminaireModel::Octa;
    }
    if (type.find("Penta") != std::string::npos) {
        return LuminaireModel::Penta;
    }
    return LuminaireModel::Unknown;
}

Device::Device(std::string address) {
    identity_.address = std::move(address);
}

Device Device::discovered(std::string address, std::string electronicSerial) {
    Device device(std::move(address));
    device.identity_.electronicSerial = std::move(electronicSerial);
    return device;
}

expected<void> Device::mergeIdentity(const Identity& incoming) {
    // Validate every field before touching any, so a mismatch leaves the record intact.
    Identity merged = identity_;
    if (auto r = mergeField(merged.address, incoming.address, "address"); !r) return r;
    if (auto r = mergeField(merged.macAddress, incoming.macAddress, "MAC address"); !r) return r;
    if (auto r = mergeField(merged.electronicSerial, incoming.electronicSerial, "electronic serial"); !r) return r;
    if (auto r = mergeField(merged.luminaireSerial, incoming.luminaireSerial, "luminaire serial"); !r) return r;
    if (auto r = mergeField(merged.modelName, incoming.modelName, "model name"); !r) return r;

    if (incoming.model != LuminaireModel::Unknown) {
        if (merged.model == LuminaireModel::Unknown) {
            merged.model = incoming.model;
        } else if (merged.model != incoming.model) {
            return fail(Errc::ProtocolError,
                        std::string("identity mismatch on model: have ") + toString(merged.model) +
                        ", device reported " + toString(incoming.model));
        }
    }

    identity_ = std::move(merged);
    return {};
}

std::string Device::describe() const {
    std::ostringstream os;
    os << toString(identity_.model)
       << " @ " << (identity_.address.empty() ? "?" : identity_.address)
       << " serial=" << (identity_.luminaireSerial.empty() ? identity_.electronicSerial
                                                           : identity_.luminaireSerial)
       << " state=" << toString(state());
    if (!firmwareVersion_.empty()) {
        os << " fw=" << firmwareVersion_;
    }
    return os.str();
}

} // namespace lumina::luminaire
