#pragma once
// Application identity, window settings and permissions derived from Config

#include "Capability.hpp"
#include "Forward.hpp"
#include <filesystem>
#include <set>
#include <string>

namespace clipfolio {

inline constexpr const char* CLIPFOLIO_VERSION = "0.1.0";

struct WindowSettings {
    std::string title = "Clipfolio";
    int width = 420;
    int height = 620;
    bool alwaysOnTop = false;
};

struct AppContext {
    // Bundle identity
    std::string identifier = "io.clipfolio.app";
    std::string productName = "Clipfolio";
    std::string version = CLIPFOLIO_VERSION;

    WindowSettings window;

    // Capabilities the UI layer may call
    std::set<Capability> permissions;

    std::filesystem::path dataDir;
    std::string socketPath;

    int maxHistoryItems = 50;
    int clipboardPollMs = 1000;
    int saveDebounceMs = 500;
    bool monitorClipboard = true;
    std::string toggleShortcut;
    bool compositorPlugin = false;
};

AppContext generateContext(const Config& config);

// Throws StartupError for an unusable context
void validateContext(const AppContext& context);

} // namespace clipfolio
