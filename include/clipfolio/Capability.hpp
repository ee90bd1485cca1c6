#pragma once
// Capabilities a plugin can expose to the UI layer

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace clipfolio {

enum class Capability {
    Clipboard,
    Opener,
    Filesystem,
    GlobalShortcut
};

const char* capabilityName(Capability cap);
std::optional<Capability> parseCapability(std::string_view name);

// "clipboard,opener" -> {Clipboard, Opener}; unknown names are skipped
std::set<Capability> parseCapabilityList(const std::string& list);
std::set<Capability> allCapabilities();

} // namespace clipfolio
