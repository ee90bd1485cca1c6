#include "clipfolio/Capability.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace clipfolio {

const char* capabilityName(Capability cap) {
    switch (cap) {
        case Capability::Clipboard:      return "clipboard";
        case Capability::Opener:         return "opener";
        case Capability::Filesystem:     return "fs";
        case Capability::GlobalShortcut: return "global-shortcut";
    }
    return "unknown";
}

std::optional<Capability> parseCapability(std::string_view name) {
    for (Capability cap : allCapabilities()) {
        if (name == capabilityName(cap)) return cap;
    }
    return std::nullopt;
}

std::set<Capability> parseCapabilityList(const std::string& list) {
    std::set<Capability> result;
    std::stringstream ss(list);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token.erase(std::remove_if(token.begin(), token.end(),
                                   [](unsigned char c) { return std::isspace(c); }),
                    token.end());
        if (auto cap = parseCapability(token)) result.insert(*cap);
    }
    return result;
}

std::set<Capability> allCapabilities() {
    return {Capability::Clipboard, Capability::Opener,
            Capability::Filesystem, Capability::GlobalShortcut};
}

} // namespace clipfolio
