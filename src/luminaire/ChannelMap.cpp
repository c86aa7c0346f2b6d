#include "lumina/luminaire/ChannelMap.hpp"

#include <algorithm>

namespace lumina::luminaire::channel_map {

const std::array<std::string_view, FULL_CHANNEL_COUNT>& fullChannelNames() {
    static constexpr std::array<std::string_view, FULL_CHANNEL_COUNT> names{{
        "UV1", "UV2", "V1", "V2",
        "RB1", "RB2", "B1", "B2", "C", "G1", "G2", "L", "PC-A", "A", "OR", "R1", "R2",
        "DR1", "DR2", "FR1", "FR2", "FR3", "IR1", "IR2"
    }};
    return names;
}

const std::array<std::string_view, NAMED_CHANNEL_COUNT>& namedChannelNames() {
    static constexpr std::array<std::string_view, NAMED_CHANNEL_COUNT> names{{
        "RB1", "RB2", "B1", "B2", "C", "G1", "G2", "L", "PC-A", "A", "OR", "R1", "R2"
    }};
    return names;
}

std::optional<std::size_t> fullIndexOf(std::string_view name) {
    const auto& names = fullChannelNames();
    const auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - names.begin());
}

std::optional<std::size_t> fullIndexForNamed(std::size_t namedIndex) {
    if (namedIndex >= NAMED_CHANNEL_COUNT) {
        return std::nullopt;
    }
    return FIRST_NAMED_INDEX + namedIndex;
}

std::vector<double> expand(const std::vector<double>& named) {
    std::vector<double> full(FULL_CHANNEL_COUNT, 0.0);
    const std::size_t count = std::min(named.size(), NAMED_CHANNEL_COUNT);
    for (std::size_t i = 0; i < count; ++i) {
        full[FIRST_NAMED_INDEX + i] = named[i];
    }
    return full;
}

std::vector<double> reduce(const std::vector<double>& full) {
    std::vector<double> named(NAMED_CHANNEL_COUNT, 0.0);
    for (std::size_t i = 0; i < NAMED_CHANNEL_COUNT; ++i) {
        const std::size_t index = FIRST_NAMED_INDEX + i;
        if (index < full.size()) {
            named[i] = full[index];
        }
    }
    return named;
}

std::size_t fullChannelCount(Capability capability) {
    switch (capability) {
        case Capability::FullFeatured: return FULL_CHANNEL_COUNT;
        case Capability::Legacy:       return LEGACY_CHANNEL_COUNT;
    }
    return FULL_CHANNEL_COUNT;
}

} // namespace lumina::luminaire::channel_map
