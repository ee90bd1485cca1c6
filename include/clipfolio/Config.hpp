#pragma once
#include <string>

namespace clipfolio {

struct Config {
    // Window
    int windowWidth = 420;
    int windowHeight = 620;
    bool alwaysOnTop = false;

    // Behavior
    int maxHistoryItems = 50;
    int clipboardPollMs = 1000;
    int saveDebounceMs = 500;
    bool monitorClipboard = true;
    std::string toggleShortcut = "Super+V";
    bool compositorPlugin = false;   // bind shortcuts to clipfolio:shortcut dispatcher
    std::string capabilities = "clipboard,opener,fs,global-shortcut";

    std::string logLevel = "info";

    // Paths
    std::string configPath;
    std::string dataDir;
    std::string socketPath = "/tmp/clipfolio.sock";
};

} // namespace clipfolio
